#include "audio/TrackerDecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace turntable::audio {

using util::Logger;

namespace {

std::string av_error_string(int code) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

}  // namespace

TrackerDecoder::~TrackerDecoder() {
    close();
}

bool TrackerDecoder::fail(const std::string& message) {
    Logger::error("TrackerDecoder: " + message);
    close();
    return false;
}

bool TrackerDecoder::open(const std::string& filepath) {
    Logger::debug("TrackerDecoder: Opening file: " + filepath);
    close();

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        format_ctx_ = nullptr;
        return fail("Failed to open " + filepath + " (" + av_error_string(ret) + ")");
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        return fail("No stream info in " + filepath + " (" + av_error_string(ret) + ")");
    }

    const AVCodec* codec = nullptr;
    audio_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (audio_stream_index_ < 0 || !codec) {
        return fail("No decodable audio stream in " + filepath);
    }

    AVStream* stream = format_ctx_->streams[audio_stream_index_];

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return fail("Failed to allocate codec context");
    }
    if (avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0) {
        return fail("Failed to copy codec parameters");
    }
    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        return fail("Failed to open codec (" + av_error_string(ret) + ")");
    }

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;
    if (sample_rate_ <= 0 || channels_ <= 0) {
        return fail("Invalid stream parameters in " + filepath);
    }

    if (stream->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(stream->duration * av_q2d(stream->time_base) * sample_rate_);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(
            format_ctx_->duration / static_cast<double>(AV_TIME_BASE) * sample_rate_);
    } else {
        total_frames_ = 0;
    }

    // Whatever the decoder emits becomes interleaved float at the same rate
    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, channels_);
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &out_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                              0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
        return fail("Failed to initialize resampler");
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        return fail("Failed to allocate packet/frame");
    }

    position_frames_ = 0;
    Logger::info("TrackerDecoder: Opened " + filepath + " - " +
                 std::to_string(sample_rate_) + "Hz, " +
                 std::to_string(channels_) + "ch, " +
                 std::to_string(total_frames_) + " frames");
    return true;
}

void TrackerDecoder::close() {
    residual_.clear();
    residual_offset_ = 0;

    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    audio_stream_index_ = -1;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int TrackerDecoder::read_pcm(float* buffer, int max_frames) {
    if (!format_ctx_ || !codec_ctx_ || !buffer || max_frames <= 0) return 0;

    int frames_written = 0;

    // Leftovers from the previous call come first
    if (residual_offset_ < residual_.size()) {
        size_t available = (residual_.size() - residual_offset_) / channels_;
        int to_copy = static_cast<int>(std::min<size_t>(available, max_frames));
        std::memcpy(buffer, residual_.data() + residual_offset_,
                    static_cast<size_t>(to_copy) * channels_ * sizeof(float));
        residual_offset_ += static_cast<size_t>(to_copy) * channels_;
        frames_written += to_copy;
        if (residual_offset_ >= residual_.size()) {
            residual_.clear();
            residual_offset_ = 0;
        }
    }

    while (frames_written < max_frames) {
        int ret = av_read_frame(format_ctx_, packet_);
        if (ret < 0) break;  // EOF or error

        if (packet_->stream_index != audio_stream_index_) {
            av_packet_unref(packet_);
            continue;
        }

        ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0) continue;

        while (avcodec_receive_frame(codec_ctx_, frame_) >= 0) {
            int out_samples = swr_get_out_samples(swr_ctx_, frame_->nb_samples);
            convert_buffer_.resize(static_cast<size_t>(std::max(out_samples, 0)) * channels_);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(convert_buffer_.data());

            int converted = swr_convert(swr_ctx_, &out_ptr, out_samples,
                                        const_cast<const uint8_t**>(frame_->extended_data),
                                        frame_->nb_samples);
            av_frame_unref(frame_);
            if (converted <= 0) continue;

            int to_copy = std::min(converted, max_frames - frames_written);
            std::memcpy(buffer + static_cast<size_t>(frames_written) * channels_, convert_buffer_.data(),
                        static_cast<size_t>(to_copy) * channels_ * sizeof(float));
            frames_written += to_copy;

            if (converted > to_copy) {
                residual_.insert(residual_.end(),
                                 convert_buffer_.begin() + static_cast<size_t>(to_copy) * channels_,
                                 convert_buffer_.begin() + static_cast<size_t>(converted) * channels_);
            }
        }
    }

    position_frames_ += frames_written;
    return frames_written;
}

bool TrackerDecoder::seek(long frame) {
    if (!format_ctx_ || audio_stream_index_ < 0) return false;

    residual_.clear();
    residual_offset_ = 0;

    AVStream* stream = format_ctx_->streams[audio_stream_index_];
    int64_t timestamp = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);

    int ret = av_seek_frame(format_ctx_, audio_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        Logger::error("TrackerDecoder: Seek failed (" + av_error_string(ret) + ")");
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    position_frames_ = frame;
    return true;
}

}  // namespace turntable::audio
