#include "backend/PipeWireBackend.hpp"
#include "audio/DecoderFactory.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

namespace turntable::backend {

namespace {
constexpr int BUFFER_FRAMES = 4096;
constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(2);
}

PipeWireBackend::PipeWireBackend() {
    context_ready_ = context_.init();
    if (!context_ready_) {
        util::Logger::error("PipeWireBackend: PipeWire unavailable, every load will fail");
    }
}

PipeWireBackend::~PipeWireBackend() {
    join_worker();
    output_.close();
}

void PipeWireBackend::join_worker() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

void PipeWireBackend::load(const std::string& path) {
    stop();

    auto decoder = audio::open_decoder(path);
    if (!decoder) {
        loaded_path_.clear();
        throw LoadError(path, "Cannot decode " + util::Platform::display_name(path));
    }

    loaded_path_ = path;
    prepared_ = std::move(decoder);
    util::Logger::debug("PipeWireBackend: Loaded " + path);
}

void PipeWireBackend::prepare_output(const audio::AudioDecoder& decoder) {
    if (!context_ready_) {
        throw LoadError(loaded_path_, "Audio output unavailable");
    }

    // Reuse the stream while the format is unchanged
    if (output_.is_initialized() &&
        output_.get_sample_rate() == decoder.get_sample_rate() &&
        output_.get_channels() == decoder.get_channels()) {
        return;
    }

    output_.close();
    if (!output_.init(context_, decoder.get_sample_rate(), decoder.get_channels())) {
        throw LoadError(loaded_path_, "Audio output could not be opened");
    }
}

void PipeWireBackend::play_from_offset(double seconds) {
    join_worker();
    // The joined worker leaves busy set; nothing plays until a new one starts
    busy_.store(false, std::memory_order_release);
    output_.flush();

    if (loaded_path_.empty()) {
        throw LoadError("", "No track loaded");
    }

    std::unique_ptr<audio::AudioDecoder> decoder = std::move(prepared_);
    if (!decoder) {
        decoder = audio::open_decoder(loaded_path_);
        if (!decoder) {
            throw LoadError(loaded_path_, "Cannot decode " + util::Platform::display_name(loaded_path_));
        }
    }

    if (seconds > 0.0 && !decoder->seek_to_seconds(seconds)) {
        util::Logger::warn("PipeWireBackend: Seek to " + std::to_string(seconds) + "s failed, starting from 0");
    }

    prepare_output(*decoder);

    paused_.store(false, std::memory_order_release);
    busy_.store(true, std::memory_order_release);
    worker_ = std::jthread([this, d = std::move(decoder)](std::stop_token st) mutable {
        run(st, std::move(d));
    });
}

void PipeWireBackend::pause() {
    paused_.store(true, std::memory_order_release);
}

void PipeWireBackend::resume() {
    paused_.store(false, std::memory_order_release);
}

void PipeWireBackend::stop() {
    join_worker();
    output_.flush();
    prepared_.reset();
    paused_.store(false, std::memory_order_release);
    busy_.store(false, std::memory_order_release);
}

void PipeWireBackend::set_volume(double volume) {
    volume_.store(std::clamp(volume, 0.0, 1.0), std::memory_order_release);
}

double PipeWireBackend::current_volume() const {
    return volume_.load(std::memory_order_acquire);
}

bool PipeWireBackend::is_busy() const {
    return busy_.load(std::memory_order_acquire);
}

void PipeWireBackend::run(std::stop_token stop_token, std::unique_ptr<audio::AudioDecoder> decoder) {
    const int channels = decoder->get_channels();
    std::vector<float> buffer(static_cast<size_t>(BUFFER_FRAMES) * channels, 0.0f);
    bool finished = false;

    while (!stop_token.stop_requested()) {
        if (paused_.load(std::memory_order_acquire)) {
            output_.pause(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }
        output_.pause(false);
        output_.set_volume(static_cast<float>(volume_.load(std::memory_order_acquire)));

        int frames = decoder->read_pcm(buffer.data(), BUFFER_FRAMES);
        if (frames <= 0) {
            finished = true;
            break;
        }

        size_t written = 0;
        while (written < static_cast<size_t>(frames) && !stop_token.stop_requested()) {
            size_t n = output_.write(buffer.data() + written * channels, frames - written);
            if (n == 0) {
                util::Logger::error("PipeWireBackend: Output stalled, ending track");
                finished = true;
                break;
            }
            written += n;
        }
        if (finished) break;
    }

    decoder->close();

    // Let queued buffers play out before reporting the end
    if (finished && !stop_token.stop_requested()) {
        output_.begin_drain();
        auto deadline = std::chrono::steady_clock::now() + DRAIN_TIMEOUT;
        while (!output_.drained() && !stop_token.stop_requested() &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    // A stop request means the owner is joining us and resets the flag itself
    if (finished && !stop_token.stop_requested()) {
        util::Logger::debug("PipeWireBackend: Track finished");
        busy_.store(false, std::memory_order_release);
    }
}

}  // namespace turntable::backend
