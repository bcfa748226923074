#pragma once

namespace MindRun {

// Live state of one session. `mutex` is the session's exclusive section:
// state changes and adapter calls for the session run while holding it.
// `view` is the last published copy, readable without waiting on an
// in-flight adapter call.
struct SessionSlot {
    std::mutex mutex;
    Session session;
    std::shared_ptr<EnvironmentDriver> driver;
    std::optional<DriverHandle> handle;

    mutable std::mutex view_mutex;
    Session view;

    void cancel();
    bool cancelled() const;
    // Sleeps for up to `wait`. Returns true if cancelled before or during.
    bool wait_cancelled(Millis wait);

private:
    mutable std::mutex signal_mutex_;
    std::condition_variable signal_cv_;
    bool cancelled_ = false;
};

// Owns the live session table. Only the slot map is shared; every record
// mutation happens under that record's own slot mutex and is persisted to
// sessions/<id>.session.
class SessionRegistry {
public:
    SessionRegistry(std::filesystem::path sessions_dir, DriverRegistry& drivers,
                    EventNotifier& events, Millis call_timeout);

    // Reads persisted records. Call after the event streams are loaded.
    // A record older than its stream's newest transition event takes the
    // sequence and state that event implies. read_only leaves the
    // directory untouched.
    void load(bool read_only = false);

    // Starts a new environment (one retry on failure). Returns once the
    // session is running; on failure the session is left `failed` and the
    // adapter error is rethrown.
    std::string create(SessionKind kind, const DriverConfig& config);

    // New session whose environment is rebuilt from a snapshot payload.
    std::string create_from_snapshot(SessionKind kind, const DriverConfig& config,
                                     const SnapshotPayload& payload, const std::string& snapshot_id);

    Session get(const std::string& session_id) const;
    void teardown(const std::string& session_id);
    std::vector<Session> list_active() const;
    std::vector<Session> list_all() const;

    std::shared_ptr<SessionSlot> find(const std::string& session_id) const;
    std::shared_ptr<SessionSlot> slot(const std::string& session_id) const;

    // The helpers below require the caller to hold slot.mutex.

    // Applies a table-checked transition, bumps transition_seq, emits the
    // matching event and persists. Returns false if the move is not allowed.
    bool commit(SessionSlot& slot, SessionState to, EventKind kind, const std::string& detail);
    // Marks a session whose live handle did not survive a supervisor restart.
    bool orphan(SessionSlot& slot, const std::string& detail);
    void set_snapshot_ref(SessionSlot& slot, const std::string& snapshot_id);
    void publish(SessionSlot& slot);
    void persist(SessionSlot& slot);
    // Adapter instance for the slot, created on first use after a reload.
    std::shared_ptr<EnvironmentDriver> driver_for(SessionSlot& slot);

    void flush();
    void cancel_all();

private:
    std::string allocate_id();
    std::string launch(SessionKind kind, const DriverConfig& config,
                       const std::function<DriverHandle(std::shared_ptr<EnvironmentDriver>)>& bring_up,
                       int attempts, const std::string& started_detail,
                       const std::optional<std::string>& snapshot_ref);
    std::filesystem::path record_path(const std::string& session_id) const;
    bool emit_and_persist(SessionSlot& slot, EventKind kind, const std::string& detail);

    std::filesystem::path dir_;
    DriverRegistry& drivers_;
    EventNotifier& events_;
    Millis call_timeout_;

    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<SessionSlot>> slots_;

    std::mutex id_mutex_;
    uint64_t next_id_ = 1;
};

std::string format_session_id(uint64_t n);
std::string render_session_record(const Session& session);
std::optional<Session> parse_session_record(const std::string& text);

} // namespace MindRun
