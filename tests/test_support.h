#pragma once

#include "MindRun.h"

// Test helpers
inline void test_header(const std::string& name) {
    std::cout << "\n=== " << name << " ===" << std::endl;
}

inline void test_pass(const std::string& msg) {
    std::cout << "  [PASS] " << msg << std::endl;
}

inline void test_fail(const std::string& msg) {
    std::cout << "  [FAIL] " << msg << std::endl;
    exit(1);
}

template<typename E, typename Fn>
void expect_throw(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const E& e) {
        test_pass(what + " (" + e.what() + ")");
        return;
    } catch (const std::exception& e) {
        test_fail(what + ": wrong exception: " + e.what());
    }
    test_fail(what + ": nothing thrown");
}

// Per-test state directory, removed on exit.
struct TempStateDir {
    std::filesystem::path path;

    explicit TempStateDir(const std::string& tag) {
        path = std::filesystem::temp_directory_path() /
               ("mindrun_" + tag + "_" + std::to_string(getpid()));
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
    }
    ~TempStateDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

// Scriptable environment shared by every FakeDriver a factory hands out.
// Each adapter method pops its next outcome from a queue and falls back to
// the default when the queue is empty.
struct FakeControl {
    enum class Outcome { Ok, Unresponsive, Throw, Hang };

    std::mutex mutex;
    std::deque<Outcome> start_outcomes;
    std::deque<Outcome> stop_outcomes;
    std::deque<Outcome> capture_outcomes;
    std::deque<Outcome> restore_outcomes;
    std::deque<Outcome> probe_outcomes;
    Outcome default_restore = Outcome::Ok;
    Outcome default_probe = Outcome::Ok;
    MindRun::Millis hang{400};

    std::string encoding = "application/json";
    std::string state = "{\"url\":\"https://example.test/\",\"cookies\":[]}";
    std::vector<std::string> restored_payloads;
    std::vector<std::string> stopped_handles;
    std::vector<MindRun::DriverConfig> start_configs;

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> captures{0};
    std::atomic<int> restores{0};
    std::atomic<int> probes{0};
    std::atomic<int> next_handle{1};
    // Adapter calls in progress, and the most seen at once.
    std::atomic<int> active_calls{0};
    std::atomic<int> peak_calls{0};

    Outcome next(std::deque<Outcome>& queue, Outcome fallback) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) return fallback;
        Outcome o = queue.front();
        queue.pop_front();
        return o;
    }

    void push(std::deque<Outcome>& queue, Outcome o, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex);
        for (int i = 0; i < times; ++i) queue.push_back(o);
    }

    std::string new_handle() {
        return "fake-" + std::to_string(next_handle++);
    }
};

struct CallScope {
    FakeControl& control;

    explicit CallScope(FakeControl& c) : control(c) {
        int now = ++control.active_calls;
        int peak = control.peak_calls.load();
        while (now > peak && !control.peak_calls.compare_exchange_weak(peak, now)) {}
    }
    ~CallScope() { --control.active_calls; }
};

class FakeDriver : public MindRun::EnvironmentDriver {
public:
    using Outcome = FakeControl::Outcome;

    explicit FakeDriver(std::shared_ptr<FakeControl> control) : control_(std::move(control)) {}

    MindRun::DriverHandle start(const MindRun::DriverConfig& config) override {
        ++control_->starts;
        CallScope scope(*control_);
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->start_configs.push_back(config);
        }
        settle(control_->next(control_->start_outcomes, Outcome::Ok), "start");
        return control_->new_handle();
    }

    void stop(const MindRun::DriverHandle& handle) override {
        ++control_->stops;
        CallScope scope(*control_);
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->stopped_handles.push_back(handle);
        }
        settle(control_->next(control_->stop_outcomes, Outcome::Ok), "stop " + handle);
    }

    MindRun::SnapshotPayload capture_state(const MindRun::DriverHandle& handle) override {
        ++control_->captures;
        CallScope scope(*control_);
        settle(control_->next(control_->capture_outcomes, Outcome::Ok), "capture " + handle);
        std::lock_guard<std::mutex> lock(control_->mutex);
        return MindRun::SnapshotPayload{control_->encoding, control_->state};
    }

    MindRun::DriverHandle restore_state(const MindRun::SnapshotPayload& payload) override {
        ++control_->restores;
        CallScope scope(*control_);
        settle(control_->next(control_->restore_outcomes, control_->default_restore), "restore");
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->restored_payloads.push_back(payload.bytes);
        return "fake-" + std::to_string(control_->next_handle++);
    }

    MindRun::ProbeResult health_check(const MindRun::DriverHandle& handle, MindRun::Millis) override {
        ++control_->probes;
        CallScope scope(*control_);
        Outcome o = control_->next(control_->probe_outcomes, control_->default_probe);
        if (o == Outcome::Unresponsive) return MindRun::ProbeResult::Unresponsive;
        settle(o, "probe " + handle);
        return MindRun::ProbeResult::Healthy;
    }

private:
    void settle(Outcome o, const std::string& what) {
        if (o == Outcome::Hang) std::this_thread::sleep_for(control_->hang);
        if (o == Outcome::Throw) throw std::runtime_error("fake failure: " + what);
    }

    std::shared_ptr<FakeControl> control_;
};

inline MindRun::DriverFactory fake_factory(std::shared_ptr<FakeControl> control) {
    return [control]() { return std::make_shared<FakeDriver>(control); };
}

inline std::vector<MindRun::EventKind> kinds_of(const std::vector<MindRun::Event>& events) {
    std::vector<MindRun::EventKind> out;
    for (const auto& ev : events) out.push_back(ev.kind);
    return out;
}

inline std::string kinds_text(const std::vector<MindRun::Event>& events) {
    std::string out;
    for (const auto& ev : events) {
        if (!out.empty()) out += ",";
        out += MindRun::event_kind_label(ev.kind);
    }
    return out;
}
