#pragma once

#include <stdexcept>
#include <string>

namespace turntable::backend {

// Raised by AudioBackend::load (and play_from_offset) when a file cannot be
// opened or decoded.
class LoadError : public std::runtime_error {
public:
    LoadError(const std::string& path, const std::string& reason)
        : std::runtime_error(reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Coarse transport primitives of an audio output engine. There is no
// position query and no completion callback: callers track time themselves
// and poll is_busy().
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Makes path the current source without starting it. Throws LoadError.
    virtual void load(const std::string& path) = 0;

    // (Re)starts the loaded source at the given offset. The latest call wins.
    virtual void play_from_offset(double seconds) = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    // 0.0 .. 1.0
    virtual void set_volume(double volume) = 0;
    virtual double current_volume() const = 0;

    // True while a started source is still producing audio (including while
    // paused); false once it finished naturally or was stopped.
    virtual bool is_busy() const = 0;
};

}  // namespace turntable::backend
