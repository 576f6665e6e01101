#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace turntable::events {

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    util::Logger::debug(std::string("EventBus: Subscribed to ") + to_string(type) +
                        " (id=" + std::to_string(id) + ")");
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : subscribers_) {
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscriber& s) { return s.id == id; }),
                   subs.end());
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
}

void EventBus::publish(const Event& event) {
    util::Logger::debug(std::string("EventBus: Publishing ") + to_string(event.type));

    // Copy handlers to avoid holding lock during execution
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

const char* to_string(Event::Type type) {
    switch (type) {
        case Event::Type::PlayPause: return "PlayPause";
        case Event::Type::Play: return "Play";
        case Event::Type::Pause: return "Pause";
        case Event::Type::Stop: return "Stop";
        case Event::Type::NextTrack: return "NextTrack";
        case Event::Type::PrevTrack: return "PrevTrack";
        case Event::Type::PlayIndex: return "PlayIndex";
        case Event::Type::Seek: return "Seek";
        case Event::Type::SeekForward: return "SeekForward";
        case Event::Type::SeekBackward: return "SeekBackward";
        case Event::Type::SetVolume: return "SetVolume";
        case Event::Type::VolumeUp: return "VolumeUp";
        case Event::Type::VolumeDown: return "VolumeDown";
        case Event::Type::ShuffleToggle: return "ShuffleToggle";
        case Event::Type::RepeatToggle: return "RepeatToggle";
        case Event::Type::AddTracks: return "AddTracks";
        case Event::Type::AddFolder: return "AddFolder";
        case Event::Type::RemoveTracks: return "RemoveTracks";
        case Event::Type::ClearPlaylist: return "ClearPlaylist";
        case Event::Type::Search: return "Search";
        case Event::Type::ListPlaylist: return "ListPlaylist";
        case Event::Type::Quit: return "Quit";
    }
    return "Unknown";
}

}  // namespace turntable::events
