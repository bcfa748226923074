#pragma once

namespace MindRun {

struct RecoverySettings {
    int max_attempts = 3;
    Millis backoff_initial{500};
    Millis backoff_max{8000};
    Millis call_timeout{10000};
};

enum class RecoveryOutcome {
    Recovered,
    Exhausted,
    Cancelled,
    AlreadyRunning
};

const char* recovery_outcome_label(RecoveryOutcome outcome);

// Rebuilds a lost session from its latest snapshot. Runs on the caller's
// thread (the session's supervision task) so at most one sequence per
// session is in flight.
class RecoveryCoordinator {
public:
    RecoveryCoordinator(SessionRegistry& registry, SnapshotStore& store, RecoverySettings settings);

    // Best-effort stop of the stale handle, then up to max_attempts restores
    // with exponential backoff. Ends in running (recovered) or
    // terminal_failure (exhausted). Teardown cancels between attempts.
    RecoveryOutcome recover(const std::string& session_id);

    // Delay after failed attempt n (1-based).
    Millis backoff_for(int attempt) const;

    uint64_t sequences_started() const { return sequences_.load(); }
    const RecoverySettings& settings() const { return settings_; }

private:
    RecoveryOutcome run_attempts(SessionSlot& slot, const std::string& session_id);

    SessionRegistry& registry_;
    SnapshotStore& store_;
    RecoverySettings settings_;

    std::mutex in_flight_mutex_;
    std::set<std::string> in_flight_;
    std::atomic<uint64_t> sequences_{0};
};

} // namespace MindRun
