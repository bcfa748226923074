#pragma once

namespace MindRun {

// Read-only view of a state directory written by a supervisor, possibly one
// running in another process.
class StateReader {
public:
    explicit StateReader(std::filesystem::path state_dir);

    // Re-reads session records and snapshot manifests and picks up newly
    // appended events. Throws PersistError if the directory does not exist.
    void reload();

    const std::filesystem::path& state_dir() const { return dir_; }
    SessionRegistry& sessions() { return sessions_; }
    EventNotifier& events() { return events_; }
    SnapshotStore& snapshots() { return snapshots_; }

private:
    std::filesystem::path dir_;
    DriverRegistry drivers_;
    EventNotifier events_;
    SessionRegistry sessions_;
    SnapshotStore snapshots_;
    bool loaded_ = false;
};

std::string format_session_row(const Session& s);
std::string format_session_table(const std::vector<Session>& sessions);

// Live ncurses view of sessions and recent events. Returns when the user
// presses q.
bool run_dashboard(StateReader& reader, Millis interval);

} // namespace MindRun
