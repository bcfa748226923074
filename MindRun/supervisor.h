#pragma once

namespace MindRun {

struct SupervisorConfig {
    std::filesystem::path state_dir = "./mindrun_state";
    Millis probe_interval{2000};
    Millis probe_timeout{1000};
    Millis call_timeout{10000};
    int failure_threshold = 3;
    int recovery_attempts = 3;
    Millis backoff_initial{500};
    Millis backoff_max{8000};
    bool auto_probe = true;
    bool resume_on_start = true;
    bool quiet = false;

    // Defaults overlaid with MINDRUN_* environment variables.
    static SupervisorConfig from_env();

    // Consumes recognised --options and returns the remaining arguments.
    std::vector<std::string> merge_with_cli(const std::vector<std::string>& args);

    void validate() const;
};

// Facade the agent talks to. Owns the supervision components and wires
// them together; every operation here may be called from any thread.
class Supervisor {
public:
    explicit Supervisor(SupervisorConfig config);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void register_driver(SessionKind kind, DriverFactory factory);

    // Loads persisted state and settles sessions left behind by a previous
    // run. Register drivers first.
    void init();
    // Stops supervision tasks and flushes session records. Live
    // environments are left running.
    void shutdown();

    std::string create_session(SessionKind kind, const DriverConfig& config = {});
    void teardown_session(const std::string& session_id);

    std::string capture_snapshot(const std::string& owner);
    SnapshotPayload restore_snapshot(const std::string& snapshot_id) const;
    std::string resume_session(const std::string& snapshot_id);
    void set_global_serializer(GlobalSerializer serializer);

    Session get_session(const std::string& session_id) const;
    std::vector<Session> list_sessions(bool include_finished = false) const;

    // Manual probe cycle for deployments (and tests) running without
    // supervision threads.
    SessionState probe(const std::string& session_id);

    std::vector<Event> events_since(const std::string& session_id, uint64_t after_event_id) const;
    std::optional<Event> wait_for_event(const std::string& session_id, uint64_t after_event_id, Millis timeout) const;
    size_t subscribe(EventCallback callback);
    bool unsubscribe(size_t token);

    const SupervisorConfig& config() const { return config_; }
    EventNotifier& events() { return events_; }
    SnapshotStore& snapshots() { return store_; }
    SessionRegistry& registry() { return registry_; }
    RecoveryCoordinator& recovery() { return recovery_; }
    HealthMonitor& monitor() { return monitor_; }

private:
    void settle_restored_sessions();

    SupervisorConfig config_;
    DriverRegistry drivers_;
    EventNotifier events_;
    SessionRegistry registry_;
    SnapshotStore store_;
    RecoveryCoordinator recovery_;
    HealthMonitor monitor_;

    std::mutex lifecycle_mutex_;
    bool initialized_ = false;
    bool shut_down_ = false;
};

} // namespace MindRun
