#pragma once

#include <functional>
#include <map>
#include <vector>
#include <string>
#include <mutex>

namespace turntable::events {

struct Event {
    enum class Type {
        PlayPause,
        Play,
        Pause,
        Stop,
        NextTrack,
        PrevTrack,
        PlayIndex,
        Seek,
        SeekForward,
        SeekBackward,
        SetVolume,
        VolumeUp,
        VolumeDown,
        ShuffleToggle,
        RepeatToggle,
        AddTracks,
        AddFolder,
        RemoveTracks,
        ClearPlaylist,
        Search,
        ListPlaylist,
        Quit,
    };
    Type type;
    int index = -1;                  // For track selection
    std::vector<int> indices;        // For removal
    std::string data;                // Folder path or search query
    std::vector<std::string> paths;  // For adding tracks
    double seek_seconds = 5.0;       // Absolute target for Seek, step otherwise
    int volume_delta = 10;           // Percent; absolute level for SetVolume
};

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = size_t;

    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

    // Drops every subscriber
    void clear();

private:
    EventBus() = default;

    struct Subscriber {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscriber>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

const char* to_string(Event::Type type);

}  // namespace turntable::events
