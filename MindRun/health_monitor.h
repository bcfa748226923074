#pragma once

namespace MindRun {

struct MonitorSettings {
    Millis probe_interval{2000};
    Millis probe_timeout{1000};
    int failure_threshold = 3;
};

// One supervision task (thread) per watched session. Each cycle waits the
// probe interval, probes under the session's exclusive section and
// classifies the result:
//   healthy      -> failures reset; degraded goes back to running
//   not healthy  -> failures+1; running goes to degraded, and degraded goes
//                   to lost once failures reach the threshold
// A lost session is handed to the recovery coordinator on the same task.
// The task ends once the session is terminal or cancelled.
class HealthMonitor {
public:
    HealthMonitor(SessionRegistry& registry, RecoveryCoordinator& recovery, MonitorSettings settings);
    ~HealthMonitor();

    void watch(const std::string& session_id);
    // Cancels the session's task and waits for it to finish.
    void unwatch(const std::string& session_id);
    void stop_all();
    bool is_watching(const std::string& session_id) const;
    size_t task_count() const;

    // A single probe cycle, run on the caller's thread. Returns the state
    // the session is in afterwards.
    SessionState probe_once(const std::string& session_id);

    const MonitorSettings& settings() const { return settings_; }

private:
    struct Task {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void run_task(const std::string& session_id, std::shared_ptr<Task> task);
    static void join_task(Task& task);

    SessionRegistry& registry_;
    RecoveryCoordinator& recovery_;
    MonitorSettings settings_;

    mutable std::mutex tasks_mutex_;
    std::map<std::string, std::shared_ptr<Task>> tasks_;
};

} // namespace MindRun
