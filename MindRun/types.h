#pragma once

namespace MindRun {

// Owner id used for agent-wide snapshots and their event stream.
constexpr const char* GLOBAL_OWNER = "global";

enum class SessionKind {
    Browser,
    Notebook,
    Other
};

//   Starting -> Running | Failed
//   Running  -> Degraded | Terminated
//   Degraded -> Running | Lost | Terminated
//   Lost     -> Running | TerminalFailure | Terminated
// Terminated, TerminalFailure and Failed are absorbing.
enum class SessionState {
    Starting,
    Running,
    Degraded,
    Lost,
    Terminated,
    TerminalFailure,
    Failed
};

enum class EventKind {
    Started,
    Degraded,
    Lost,
    Recovered,
    TerminalFailure,
    SnapshotCaptured,
    Terminated,
    StartFailed
};

enum class ProbeResult {
    Healthy,
    Unresponsive
};

using DriverConfig = std::map<std::string, std::string>;
using DriverHandle = std::string;

const char* kind_label(SessionKind kind);
std::optional<SessionKind> parse_kind(const std::string& name);
const char* state_label(SessionState state);
std::optional<SessionState> parse_state(const std::string& name);
const char* event_kind_label(EventKind kind);
std::optional<EventKind> parse_event_kind(const std::string& name);

bool is_terminal(SessionState state);
bool can_transition(SessionState from, SessionState to);

struct Session {
    std::string session_id;
    SessionKind kind = SessionKind::Other;
    SessionState state = SessionState::Starting;
    std::optional<std::string> last_snapshot_ref;
    TimePoint created_at{};
    std::optional<TimePoint> last_health_at;

    // Bookkeeping persisted with the table
    uint64_t transition_seq = 0;
    int consecutive_failures = 0;
    std::string detail;
    DriverConfig config;
};

// Opaque bytes plus the encoding the adapter declared for them.
struct SnapshotPayload {
    std::string encoding;
    std::string bytes;
};

struct Snapshot {
    std::string snapshot_id;
    std::string session_id;
    TimePoint captured_at{};
    std::string encoding;
    std::string payload_hash;
    uint64_t size = 0;
    std::optional<std::string> parent_snapshot_id;
};

struct Event {
    uint64_t event_id = 0;
    std::string session_id;
    EventKind kind = EventKind::Started;
    TimePoint occurred_at{};
    std::string detail;
    // Identity of the committed fact ("t:<transition_seq>", "s:<snapshot_id>")
    std::string key;

    std::string to_json() const;
    static std::optional<Event> from_json(const std::string& line);
};

} // namespace MindRun
