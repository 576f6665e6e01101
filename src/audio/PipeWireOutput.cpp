#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>

namespace turntable::audio {

using util::Logger;

namespace {

void on_drained(void* data) {
    static_cast<PipeWireOutput*>(data)->notify_drained();
}

const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .drained = on_drained,
};

const char* state_name(enum pw_stream_state state) {
    switch (state) {
        case PW_STREAM_STATE_ERROR: return "ERROR";
        case PW_STREAM_STATE_UNCONNECTED: return "UNCONNECTED";
        case PW_STREAM_STATE_CONNECTING: return "CONNECTING";
        case PW_STREAM_STATE_PAUSED: return "PAUSED";
        case PW_STREAM_STATE_STREAMING: return "STREAMING";
    }
    return "UNKNOWN";
}

}  // namespace

PipeWireOutput::~PipeWireOutput() {
    close();
}

bool PipeWireOutput::init(PipeWireContext& context, int sample_rate, int channels) {
    Logger::debug("PipeWireOutput: Initializing (" + std::to_string(sample_rate) + "Hz, " +
                  std::to_string(channels) + "ch)");

    if (stream_) {
        Logger::warn("PipeWireOutput: Already initialized");
        return false;
    }

    struct pw_thread_loop* loop = context.get_loop();
    if (!loop) {
        Logger::error("PipeWireOutput: Context loop is null");
        return false;
    }

    context_ = &context;
    sample_rate_ = sample_rate;
    channels_ = channels;

    // All PipeWire calls happen with the thread loop locked
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "turntable",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        pw_thread_loop_unlock(loop);
        Logger::error("PipeWireOutput: Failed to create stream");
        return false;
    }

    uint8_t pod_buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buffer, sizeof(pod_buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels_);
    info.rate = static_cast<uint32_t>(sample_rate_);

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        Logger::error("PipeWireOutput: Stream connect failed (result=" + std::to_string(result) + ")");
        close();
        return false;
    }

    paused_ = false;
    Logger::info("PipeWireOutput: Stream connected");
    return true;
}

void PipeWireOutput::close() {
    if (stream_) {
        struct pw_thread_loop* loop = context_ ? context_->get_loop() : nullptr;
        if (loop) pw_thread_loop_lock(loop);
        pw_stream_flush(stream_, true);
        pw_stream_destroy(stream_);
        if (loop) pw_thread_loop_unlock(loop);
        stream_ = nullptr;
        Logger::debug("PipeWireOutput: Stream closed");
    }

    sample_rate_ = 0;
    channels_ = 0;
    paused_ = false;
}

void PipeWireOutput::flush() {
    if (!stream_ || !context_ || !context_->get_loop()) return;

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    pw_stream_flush(stream_, false);
    pw_thread_loop_unlock(loop);
}

void PipeWireOutput::begin_drain() {
    if (!stream_ || !context_ || !context_->get_loop()) {
        drained_.store(true, std::memory_order_release);
        return;
    }

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    drained_.store(false, std::memory_order_release);
    pw_stream_flush(stream_, true);
    pw_thread_loop_unlock(loop);
}

void PipeWireOutput::notify_drained() {
    drained_.store(true, std::memory_order_release);
}

bool PipeWireOutput::wait_for_streaming() {
    struct pw_thread_loop* loop = context_->get_loop();
    enum pw_stream_state state = PW_STREAM_STATE_UNCONNECTED;

    // Suspended sinks can take a while to wake up; give up after ~2s
    for (int attempt = 0; attempt < 100; ++attempt) {
        pw_thread_loop_lock(loop);
        state = pw_stream_get_state(stream_, nullptr);
        pw_thread_loop_unlock(loop);

        if (state == PW_STREAM_STATE_STREAMING) return true;
        if (state == PW_STREAM_STATE_ERROR) break;

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    Logger::error(std::string("PipeWireOutput: Stream not streaming (state=") + state_name(state) + ")");
    return false;
}

size_t PipeWireOutput::write(const float* data, size_t frames) {
    if (!stream_ || !context_ || !context_->get_loop() || !data || frames == 0) {
        return 0;
    }

    if (!wait_for_streaming()) return 0;

    struct pw_thread_loop* loop = context_->get_loop();
    struct pw_buffer* pw_buf = nullptr;

    constexpr int max_retries = 50;
    for (int i = 0; i < max_retries; ++i) {
        pw_thread_loop_lock(loop);
        pw_buf = pw_stream_dequeue_buffer(stream_);
        if (pw_buf) break;  // keep the lock while filling
        pw_thread_loop_unlock(loop);

        // Backoff 2, 4, 8, 16, 32ms then capped at 50ms
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(2 << std::min(i, 4), 50)));
    }

    if (!pw_buf) {
        Logger::error("PipeWireOutput: No buffer after " + std::to_string(max_retries) + " retries");
        return 0;
    }

    struct spa_buffer* buf = pw_buf->buffer;
    if (!buf->datas[0].data) {
        pw_stream_queue_buffer(stream_, pw_buf);
        pw_thread_loop_unlock(loop);
        return 0;
    }

    const size_t bytes_per_frame = static_cast<size_t>(channels_) * sizeof(float);
    const size_t frames_to_write = std::min(frames, buf->datas[0].maxsize / bytes_per_frame);
    const size_t total_samples = frames_to_write * channels_;

    float* dst = static_cast<float*>(buf->datas[0].data);
    for (size_t i = 0; i < total_samples; ++i) {
        float val = data[i] * gain_;
        if (!std::isfinite(val)) {
            ++clipped_samples_;
            val = 0.0f;
        }
        dst[i] = std::clamp(val, -1.0f, 1.0f);
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = static_cast<int32_t>(bytes_per_frame);
    buf->datas[0].chunk->size = static_cast<uint32_t>(frames_to_write * bytes_per_frame);

    pw_stream_queue_buffer(stream_, pw_buf);
    pw_thread_loop_unlock(loop);

    return frames_to_write;
}

void PipeWireOutput::set_volume(float gain) {
    float clamped = std::clamp(gain, 0.0f, 1.0f);
    if (clamped == gain_) return;

    gain_ = clamped;
    Logger::debug("PipeWireOutput: Gain set to " + std::to_string(gain_));
}

void PipeWireOutput::pause(bool paused) {
    if (paused_ == paused) return;
    if (!stream_ || !context_ || !context_->get_loop()) return;

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    pw_stream_set_active(stream_, !paused);
    pw_thread_loop_unlock(loop);

    paused_ = paused;
    Logger::debug(std::string("PipeWireOutput: Stream ") + (paused ? "paused" : "resumed"));
    if (clipped_samples_ > 0) {
        Logger::warn("PipeWireOutput: " + std::to_string(clipped_samples_) + " non-finite samples zeroed");
        clipped_samples_ = 0;
    }
}

}  // namespace turntable::audio
