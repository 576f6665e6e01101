#include "backend/MetadataDurationProbe.hpp"
#include "audio/DecoderFactory.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <mpg123.h>
#include <sndfile.h>
#include <vorbis/vorbisfile.h>
#include <filesystem>
#include <vector>

extern "C" {
#include <libavformat/avformat.h>
}

namespace turntable::backend {

namespace {

// Keeps libmpg123 initialised for probes running outside any decoder
struct Mpg123Library {
    Mpg123Library() { mpg123_init(); }
    ~Mpg123Library() { mpg123_exit(); }
};
Mpg123Library g_mpg123;

}  // namespace

double MetadataDurationProbe::probe(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        util::Logger::debug("MetadataDurationProbe: Not a regular file: " + path);
        return 0.0;
    }

    auto format = util::Platform::detect_format(path);
    if (format == model::AudioFormat::Unknown) {
        return 0.0;
    }

    double seconds = from_metadata(path, format);
    if (seconds > 0.0) {
        return seconds;
    }

    util::Logger::debug("MetadataDurationProbe: No length in metadata, decoding " + path);
    seconds = by_decoding(path);
    if (seconds > MIN_COUNTED_SECONDS) {
        return seconds;
    }
    return 0.0;
}

double MetadataDurationProbe::from_metadata(const std::string& path, model::AudioFormat format) {
    switch (format) {
        case model::AudioFormat::MP3:
            return from_mp3(path);
        case model::AudioFormat::WAV:
        case model::AudioFormat::FLAC:
            return from_sndfile(path);
        case model::AudioFormat::OGG:
            return from_vorbis(path);
        case model::AudioFormat::MOD:
        case model::AudioFormat::XM:
        case model::AudioFormat::IT:
        case model::AudioFormat::S3M:
            return from_avformat(path);
        case model::AudioFormat::Unknown:
            break;
    }
    return 0.0;
}

double MetadataDurationProbe::from_mp3(const std::string& path) {
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return 0.0;

    double seconds = 0.0;
    if (mpg123_open(mh, path.c_str()) == MPG123_OK) {
        long rate = 0;
        int channels = 0, encoding = 0;
        if (mpg123_scan(mh) == MPG123_OK &&
            mpg123_getformat(mh, &rate, &channels, &encoding) == MPG123_OK && rate > 0) {
            off_t length = mpg123_length(mh);
            if (length > 0) {
                seconds = static_cast<double>(length) / rate;
            }
        }
        mpg123_close(mh);
    }
    mpg123_delete(mh);
    return seconds;
}

double MetadataDurationProbe::from_sndfile(const std::string& path) {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) return 0.0;

    double seconds = 0.0;
    if (info.samplerate > 0 && info.frames > 0) {
        seconds = static_cast<double>(info.frames) / info.samplerate;
    }
    sf_close(file);
    return seconds;
}

double MetadataDurationProbe::from_vorbis(const std::string& path) {
    OggVorbis_File vf{};
    if (ov_fopen(path.c_str(), &vf) < 0) return 0.0;

    double seconds = ov_time_total(&vf, -1);
    ov_clear(&vf);
    return seconds > 0.0 ? seconds : 0.0;
}

double MetadataDurationProbe::from_avformat(const std::string& path) {
    AVFormatContext* ctx = nullptr;
    if (avformat_open_input(&ctx, path.c_str(), nullptr, nullptr) < 0) return 0.0;

    double seconds = 0.0;
    if (avformat_find_stream_info(ctx, nullptr) >= 0 && ctx->duration != AV_NOPTS_VALUE) {
        seconds = ctx->duration / static_cast<double>(AV_TIME_BASE);
    }
    avformat_close_input(&ctx);
    return seconds;
}

double MetadataDurationProbe::by_decoding(const std::string& path) {
    auto decoder = audio::open_decoder(path);
    if (!decoder || decoder->get_sample_rate() <= 0) return 0.0;

    constexpr int CHUNK_FRAMES = 8192;
    std::vector<float> scratch(static_cast<size_t>(CHUNK_FRAMES) * decoder->get_channels());

    long total = 0;
    int got = 0;
    while ((got = decoder->read_pcm(scratch.data(), CHUNK_FRAMES)) > 0) {
        total += got;
    }

    double seconds = static_cast<double>(total) / decoder->get_sample_rate();
    decoder->close();
    return seconds;
}

}  // namespace turntable::backend
