#pragma once

#include "audio/AudioDecoder.hpp"
#include "model/Snapshot.hpp"
#include <memory>
#include <string>

namespace turntable::audio {

// Decoder for the given container format, or nullptr when unsupported.
std::unique_ptr<AudioDecoder> create_decoder(model::AudioFormat format);

// Detects the format from the extension and opens the file.
// Returns nullptr when the format is unknown or the file cannot be opened.
std::unique_ptr<AudioDecoder> open_decoder(const std::string& path);

}  // namespace turntable::audio
