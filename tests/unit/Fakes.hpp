#pragma once

#include "backend/AudioBackend.hpp"
#include "backend/DurationProbe.hpp"
#include "util/TimeSource.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace turntable::test {

// Records every transport call; files listed in failing throw LoadError.
class FakeBackend : public backend::AudioBackend {
public:
    void load(const std::string& path) override {
        calls.push_back("load:" + path);
        if (failing.count(path)) {
            throw backend::LoadError(path, "cannot decode " + path);
        }
        loaded = path;
    }

    void play_from_offset(double seconds) override {
        calls.push_back("play_from_offset:" + std::to_string(static_cast<int>(seconds)));
        if (fail_next_play) {
            // Restart failed after the old worker was joined
            fail_next_play = false;
            busy = false;
            throw backend::LoadError(loaded, "cannot reopen " + loaded);
        }
        last_offset = seconds;
        busy = true;
        paused = false;
    }

    void pause() override {
        calls.push_back("pause");
        paused = true;
    }

    void resume() override {
        calls.push_back("resume");
        paused = false;
    }

    void stop() override {
        calls.push_back("stop");
        busy = false;
        paused = false;
    }

    void set_volume(double v) override { volume = v; }
    double current_volume() const override { return volume; }
    bool is_busy() const override { return busy; }

    // Simulates the source running out
    void finish() { busy = false; }

    size_t count(const std::string& prefix) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.rfind(prefix, 0) == 0) n++;
        }
        return n;
    }

    std::vector<std::string> calls;
    std::set<std::string> failing;
    std::string loaded;
    double last_offset = -1.0;
    double volume = 1.0;
    bool busy = false;
    bool paused = false;
    bool fail_next_play = false;
};

class FakeProbe : public backend::DurationProbe {
public:
    double probe(const std::string& path) override {
        probed.push_back(path);
        auto it = lengths.find(path);
        return it != lengths.end() ? it->second : default_length;
    }

    std::map<std::string, double> lengths;
    double default_length = 180.0;
    std::vector<std::string> probed;
};

class ManualTimeSource : public util::TimeSource {
public:
    double now() const override { return current; }
    void advance(double seconds) { current += seconds; }

    double current = 1000.0;
};

}  // namespace turntable::test
