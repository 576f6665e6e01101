#pragma once

#include "audio/AudioDecoder.hpp"
#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireOutput.hpp"
#include "backend/AudioBackend.hpp"
#include <atomic>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace turntable::backend {

// AudioBackend over the decoders and a PipeWire stream.
//
// One worker thread at a time pulls PCM from the decoder and pushes it to the
// output. Every transport call that restarts playback first stops and joins
// the previous worker, so the latest call wins and a finished worker can never
// clear the busy flag of its successor.
class PipeWireBackend : public AudioBackend {
public:
    PipeWireBackend();
    ~PipeWireBackend() override;

    void load(const std::string& path) override;
    void play_from_offset(double seconds) override;
    void pause() override;
    void resume() override;
    void stop() override;

    void set_volume(double volume) override;
    double current_volume() const override;
    bool is_busy() const override;

private:
    void run(std::stop_token stop_token, std::unique_ptr<audio::AudioDecoder> decoder);
    void join_worker();
    void prepare_output(const audio::AudioDecoder& decoder);

    audio::PipeWireContext context_;
    bool context_ready_ = false;

    // Shared across tracks; only touched by the worker or while none runs
    audio::PipeWireOutput output_;

    std::string loaded_path_;
    std::unique_ptr<audio::AudioDecoder> prepared_;

    std::jthread worker_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> paused_{false};
    std::atomic<double> volume_{1.0};
};

}  // namespace turntable::backend
