#include "MindRun.h"

namespace MindRun {

namespace {
    std::string lower_copy(const std::string& s){
        std::string lower = s;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return lower;
    }
}

const char* kind_label(SessionKind kind){
    switch(kind){
        case SessionKind::Browser: return "browser";
        case SessionKind::Notebook: return "notebook";
        case SessionKind::Other: return "other";
    }
    return "?";
}

std::optional<SessionKind> parse_kind(const std::string& name){
    std::string lower = lower_copy(name);
    if(lower == "browser") return SessionKind::Browser;
    if(lower == "notebook" || lower == "kernel") return SessionKind::Notebook;
    if(lower == "other") return SessionKind::Other;
    return std::nullopt;
}

const char* state_label(SessionState state){
    switch(state){
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::Degraded: return "degraded";
        case SessionState::Lost: return "lost";
        case SessionState::Terminated: return "terminated";
        case SessionState::TerminalFailure: return "terminal_failure";
        case SessionState::Failed: return "failed";
    }
    return "?";
}

std::optional<SessionState> parse_state(const std::string& name){
    std::string lower = lower_copy(name);
    if(lower == "starting") return SessionState::Starting;
    if(lower == "running") return SessionState::Running;
    if(lower == "degraded") return SessionState::Degraded;
    if(lower == "lost") return SessionState::Lost;
    if(lower == "terminated") return SessionState::Terminated;
    if(lower == "terminal_failure") return SessionState::TerminalFailure;
    if(lower == "failed") return SessionState::Failed;
    return std::nullopt;
}

const char* event_kind_label(EventKind kind){
    switch(kind){
        case EventKind::Started: return "started";
        case EventKind::Degraded: return "degraded";
        case EventKind::Lost: return "lost";
        case EventKind::Recovered: return "recovered";
        case EventKind::TerminalFailure: return "terminal_failure";
        case EventKind::SnapshotCaptured: return "snapshot_captured";
        case EventKind::Terminated: return "terminated";
        case EventKind::StartFailed: return "start_failed";
    }
    return "?";
}

std::optional<EventKind> parse_event_kind(const std::string& name){
    std::string lower = lower_copy(name);
    if(lower == "started") return EventKind::Started;
    if(lower == "degraded") return EventKind::Degraded;
    if(lower == "lost") return EventKind::Lost;
    if(lower == "recovered") return EventKind::Recovered;
    if(lower == "terminal_failure") return EventKind::TerminalFailure;
    if(lower == "snapshot_captured") return EventKind::SnapshotCaptured;
    if(lower == "terminated") return EventKind::Terminated;
    if(lower == "start_failed") return EventKind::StartFailed;
    return std::nullopt;
}

bool is_terminal(SessionState state){
    return state == SessionState::Terminated ||
           state == SessionState::TerminalFailure ||
           state == SessionState::Failed;
}

bool can_transition(SessionState from, SessionState to){
    if(is_terminal(from)) return false;
    if(to == SessionState::Terminated) return true;
    switch(from){
        case SessionState::Starting:
            return to == SessionState::Running || to == SessionState::Failed;
        case SessionState::Running:
            return to == SessionState::Degraded;
        case SessionState::Degraded:
            return to == SessionState::Running || to == SessionState::Lost;
        case SessionState::Lost:
            return to == SessionState::Running || to == SessionState::TerminalFailure;
        default:
            return false;
    }
}

std::string Event::to_json() const {
    std::ostringstream oss;
    oss << "{\"event_id\":" << event_id
        << ",\"session_id\":\"" << json_escape(session_id) << "\""
        << ",\"kind\":\"" << event_kind_label(kind) << "\""
        << ",\"occurred_at\":\"" << format_timestamp(occurred_at) << "\""
        << ",\"key\":\"" << json_escape(key) << "\""
        // Free text goes last: field lookup takes the first match.
        << ",\"detail\":\"" << json_escape(detail) << "\""
        << "}";
    return oss.str();
}

std::optional<Event> Event::from_json(const std::string& line){
    std::string id_text = extract_json_field(line, "event_id");
    std::string session = extract_json_field(line, "session_id");
    auto kind = parse_event_kind(extract_json_field(line, "kind"));
    auto when = parse_timestamp(extract_json_field(line, "occurred_at"));
    if(id_text.empty() || session.empty() || !kind || !when) return std::nullopt;

    Event ev;
    try{
        ev.event_id = std::stoull(id_text);
    } catch(const std::exception&){
        return std::nullopt;
    }
    ev.session_id = session;
    ev.kind = *kind;
    ev.occurred_at = *when;
    ev.detail = extract_json_field(line, "detail");
    ev.key = extract_json_field(line, "key");
    return ev;
}

} // namespace MindRun
