#include "audio/DecoderFactory.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "audio/SndfileDecoder.hpp"
#include "audio/TrackerDecoder.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

namespace turntable::audio {

std::unique_ptr<AudioDecoder> create_decoder(model::AudioFormat format) {
    switch (format) {
        case model::AudioFormat::MP3:
            return std::make_unique<MP3Decoder>();
        case model::AudioFormat::OGG:
            return std::make_unique<OGGDecoder>();
        case model::AudioFormat::WAV:
        case model::AudioFormat::FLAC:
            return std::make_unique<SndfileDecoder>();
        case model::AudioFormat::MOD:
        case model::AudioFormat::XM:
        case model::AudioFormat::IT:
        case model::AudioFormat::S3M:
            return std::make_unique<TrackerDecoder>();
        case model::AudioFormat::Unknown:
            break;
    }
    return nullptr;
}

std::unique_ptr<AudioDecoder> open_decoder(const std::string& path) {
    auto decoder = create_decoder(util::Platform::detect_format(path));
    if (!decoder) {
        util::Logger::warn("DecoderFactory: Unsupported format: " + path);
        return nullptr;
    }
    if (!decoder->open(path)) {
        return nullptr;
    }
    return decoder;
}

}  // namespace turntable::audio
