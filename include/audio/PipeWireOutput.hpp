#pragma once

#include "audio/PipeWireContext.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>

struct pw_stream;

namespace turntable::audio {

// One F32 playback stream on the shared context. Pushes interleaved frames
// by dequeuing stream buffers; there is no process callback.
class PipeWireOutput {
public:
    PipeWireOutput() = default;
    ~PipeWireOutput();

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    bool init(PipeWireContext& context, int sample_rate, int channels);
    void close();

    // Returns number of frames actually written, 0 on stream failure
    size_t write(const float* data, size_t frames);
    void pause(bool paused);

    // Drops queued audio without draining it
    void flush();

    // Asks the server to play out what is queued; drained() turns true once
    // the last queued buffer has been consumed
    void begin_drain();
    bool drained() const { return drained_.load(std::memory_order_acquire); }

    // Called from the PipeWire loop thread
    void notify_drained();

    bool is_initialized() const { return stream_ != nullptr; }
    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

    // Linear gain 0.0 .. 1.0 applied while copying samples
    void set_volume(float gain);

private:
    bool wait_for_streaming();

    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;
    std::atomic<bool> drained_{false};
    float gain_ = 1.0f;
    uint64_t clipped_samples_ = 0;

    struct pw_stream* stream_ = nullptr;
    PipeWireContext* context_ = nullptr; // Non-owning
};

}  // namespace turntable::audio
