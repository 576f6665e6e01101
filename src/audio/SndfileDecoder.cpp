#include "audio/SndfileDecoder.hpp"
#include "util/Logger.hpp"

namespace turntable::audio {

using util::Logger;

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(const std::string& filepath) {
    Logger::debug("SndfileDecoder: Opening file: " + filepath);
    close();

    info_ = SF_INFO{};
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        Logger::error("SndfileDecoder: Failed to open file: " + filepath +
                      " (" + std::string(sf_strerror(nullptr)) + ")");
        info_ = SF_INFO{};
        return false;
    }

    if (info_.samplerate <= 0 || info_.channels <= 0) {
        Logger::error("SndfileDecoder: Invalid stream parameters in " + filepath);
        close();
        return false;
    }

    position_frames_ = 0;
    Logger::info("SndfileDecoder: Opened " + filepath + " - " +
                 std::to_string(info_.samplerate) + "Hz, " +
                 std::to_string(info_.channels) + "ch, " +
                 std::to_string(info_.frames) + " frames");
    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    info_ = SF_INFO{};
    position_frames_ = 0;
}

int SndfileDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer || max_frames <= 0) return 0;

    sf_count_t frames_read = sf_readf_float(file_, buffer, max_frames);
    if (frames_read < 0) {
        Logger::error("SndfileDecoder: Read error: " + std::string(sf_strerror(file_)));
        return 0;
    }

    position_frames_ += static_cast<long>(frames_read);
    return static_cast<int>(frames_read);
}

bool SndfileDecoder::seek(long frame) {
    if (!file_) return false;

    sf_count_t result = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (result < 0) {
        Logger::error("SndfileDecoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }

    position_frames_ = static_cast<long>(result);
    return true;
}

}  // namespace turntable::audio
