#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"

namespace turntable::audio {

using util::Logger;

OGGDecoder::~OGGDecoder() {
    close();
}

bool OGGDecoder::open(const std::string& filepath) {
    Logger::debug("OGGDecoder: Opening file: " + filepath);
    close();

    int rc = ov_fopen(filepath.c_str(), &vf_);
    if (rc < 0) {
        Logger::error("OGGDecoder: Failed to open Vorbis stream: " + filepath +
                      " (code=" + std::to_string(rc) + ")");
        return false;
    }
    is_open_ = true;

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info || info->channels <= 0) {
        Logger::error("OGGDecoder: Missing stream info for: " + filepath);
        close();
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;

    ogg_int64_t pcm_total = ov_pcm_total(&vf_, -1);
    total_frames_ = pcm_total < 0 ? 0 : static_cast<long>(pcm_total);
    position_frames_ = 0;
    current_section_ = 0;

    Logger::info("OGGDecoder: Opened " + filepath + " - " +
                 std::to_string(sample_rate_) + "Hz, " +
                 std::to_string(channels_) + "ch, " +
                 std::to_string(total_frames_) + " frames");
    return true;
}

void OGGDecoder::close() {
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int OGGDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer || max_frames <= 0) return 0;

    int frames_read = 0;
    while (frames_read < max_frames) {
        float** pcm = nullptr;
        long got = ov_read_float(&vf_, &pcm, max_frames - frames_read, &current_section_);
        if (got == OV_HOLE) continue;  // recoverable gap in the bitstream
        if (got <= 0) break;

        // Planar to interleaved
        for (long i = 0; i < got; ++i) {
            float* out = buffer + (frames_read + i) * channels_;
            for (int ch = 0; ch < channels_; ++ch) {
                out[ch] = pcm[ch][i];
            }
        }
        frames_read += static_cast<int>(got);
    }

    position_frames_ += frames_read;
    return frames_read;
}

bool OGGDecoder::seek(long frame) {
    if (!is_open_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        Logger::error("OGGDecoder: Seek failed (code=" + std::to_string(result) + ")");
        return false;
    }

    position_frames_ = frame;
    return true;
}

}  // namespace turntable::audio
