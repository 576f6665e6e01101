#pragma once

#include "AudioDecoder.hpp"
#include <vector>

// Forward declarations for FFmpeg types
struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwrContext;

namespace turntable::audio {

// Module formats (MOD, XM, IT, S3M) through libavformat. Requires an FFmpeg
// build with a module demuxer (libopenmpt or libmodplug); otherwise open()
// fails and the track is reported as unloadable.
class TrackerDecoder : public AudioDecoder {
public:
    TrackerDecoder() = default;
    ~TrackerDecoder() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read_pcm(float* buffer, int max_frames) override;

    [[nodiscard]] int get_sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int get_channels() const override { return channels_; }
    [[nodiscard]] long get_total_frames() const override { return total_frames_; }
    [[nodiscard]] long get_position_frames() const override { return position_frames_; }

    [[nodiscard]] bool seek(long frame) override;
    [[nodiscard]] bool is_open() const override { return format_ctx_ != nullptr; }

private:
    bool fail(const std::string& message);

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;

    int audio_stream_index_ = -1;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
    long position_frames_ = 0;

    std::vector<float> convert_buffer_;
    // Converted frames that did not fit the caller's buffer
    std::vector<float> residual_;
    size_t residual_offset_ = 0;
};

}  // namespace turntable::audio
