#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace turntable::audio {

// Pull-style PCM source producing interleaved float frames.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;

    // Returns frames written to buffer (max_frames * channels floats),
    // 0 at end of stream or on error
    virtual int read_pcm(float* buffer, int max_frames) = 0;

    virtual int get_sample_rate() const = 0;
    virtual int get_channels() const = 0;
    virtual long get_total_frames() const = 0;
    virtual long get_position_frames() const = 0;

    virtual bool seek(long frame) = 0;
    virtual bool is_open() const = 0;

    bool seek_to_seconds(double seconds) {
        if (get_sample_rate() == 0) return false;
        return seek(static_cast<long>(seconds * get_sample_rate()));
    }

    double get_duration_seconds() const {
        if (get_sample_rate() == 0) return 0.0;
        return static_cast<double>(get_total_frames()) / get_sample_rate();
    }
};

}  // namespace turntable::audio
