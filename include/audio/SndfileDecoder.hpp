#pragma once

#include "AudioDecoder.hpp"
#include <sndfile.h>

namespace turntable::audio {

// WAV and FLAC through libsndfile.
class SndfileDecoder : public AudioDecoder {
public:
    SndfileDecoder() = default;
    ~SndfileDecoder() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read_pcm(float* buffer, int max_frames) override;

    [[nodiscard]] int get_sample_rate() const override { return info_.samplerate; }
    [[nodiscard]] int get_channels() const override { return info_.channels; }
    [[nodiscard]] long get_total_frames() const override { return static_cast<long>(info_.frames); }
    [[nodiscard]] long get_position_frames() const override { return position_frames_; }

    [[nodiscard]] bool seek(long frame) override;
    [[nodiscard]] bool is_open() const override { return file_ != nullptr; }

private:
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
    long position_frames_ = 0;
};

}  // namespace turntable::audio
