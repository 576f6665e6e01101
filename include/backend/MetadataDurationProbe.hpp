#pragma once

#include "backend/DurationProbe.hpp"
#include "model/Snapshot.hpp"
#include <string>

namespace turntable::backend {

/**
 * @brief Track length from container metadata, with a decode fallback.
 *
 * Each format is asked through the library that plays it:
 * - MP3: mpg123 after a full frame scan (VBR files report no length otherwise)
 * - WAV/FLAC: libsndfile frame count
 * - OGG: vorbisfile total time
 * - MOD/XM/IT/S3M: libavformat duration
 *
 * When metadata yields nothing, the file is decoded to the end and its frames
 * counted. A counted length of 0.2s or less is treated as unknown.
 */
class MetadataDurationProbe : public DurationProbe {
public:
    double probe(const std::string& path) override;

    static constexpr double MIN_COUNTED_SECONDS = 0.2;

private:
    static double from_metadata(const std::string& path, model::AudioFormat format);
    static double from_mp3(const std::string& path);
    static double from_sndfile(const std::string& path);
    static double from_vorbis(const std::string& path);
    static double from_avformat(const std::string& path);
    static double by_decoding(const std::string& path);
};

}  // namespace turntable::backend
