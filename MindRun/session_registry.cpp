#include "MindRun.h"

namespace fs = std::filesystem;

namespace MindRun {

void SessionSlot::cancel(){
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        cancelled_ = true;
    }
    signal_cv_.notify_all();
}

bool SessionSlot::cancelled() const {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    return cancelled_;
}

bool SessionSlot::wait_cancelled(Millis wait){
    std::unique_lock<std::mutex> lock(signal_mutex_);
    return signal_cv_.wait_for(lock, wait, [this]{ return cancelled_; });
}

std::string format_session_id(uint64_t n){
    char buf[32];
    std::snprintf(buf, sizeof(buf), "sess-%06llu", static_cast<unsigned long long>(n));
    return buf;
}

namespace {
    std::optional<uint64_t> session_number(const std::string& session_id){
        unsigned long long n = 0;
        if(std::sscanf(session_id.c_str(), "sess-%llu", &n) != 1) return std::nullopt;
        return static_cast<uint64_t>(n);
    }

    std::string optional_field(const std::optional<std::string>& value){
        return value ? json_escape(*value) : std::string("-");
    }

    // State a session is in right after publishing a transition event.
    std::optional<SessionState> state_after(EventKind kind){
        switch(kind){
            case EventKind::Started:
            case EventKind::Recovered: return SessionState::Running;
            case EventKind::Degraded: return SessionState::Degraded;
            case EventKind::Lost: return SessionState::Lost;
            case EventKind::TerminalFailure: return SessionState::TerminalFailure;
            case EventKind::Terminated: return SessionState::Terminated;
            case EventKind::StartFailed: return SessionState::Failed;
            case EventKind::SnapshotCaptured: break;
        }
        return std::nullopt;
    }

    // Brings a record written before its latest transition event in line
    // with the stream. Returns true if anything changed.
    bool reconcile_with_events(Session& s, const std::vector<Event>& events){
        const Event* newest = nullptr;
        uint64_t newest_seq = s.transition_seq;
        for(const auto& ev : events){
            unsigned long long seq = 0;
            if(std::sscanf(ev.key.c_str(), "t:%llu", &seq) == 1 && seq > newest_seq){
                newest_seq = seq;
                newest = &ev;
            }
        }
        if(!newest) return false;
        s.transition_seq = newest_seq;
        if(auto state = state_after(newest->kind)){
            s.state = *state;
            s.detail = newest->detail;
            if(*state == SessionState::Running) s.consecutive_failures = 0;
        }
        return true;
    }
}

std::string render_session_record(const Session& s){
    std::ostringstream oss;
    oss << "SESSION_V1\n";
    oss << "id: " << s.session_id << "\n";
    oss << "kind: " << kind_label(s.kind) << "\n";
    oss << "state: " << state_label(s.state) << "\n";
    oss << "created_at: " << format_timestamp(s.created_at) << "\n";
    oss << "last_health_at: " << (s.last_health_at ? format_timestamp(*s.last_health_at) : std::string("-")) << "\n";
    oss << "last_snapshot_ref: " << optional_field(s.last_snapshot_ref) << "\n";
    oss << "transition_seq: " << s.transition_seq << "\n";
    oss << "consecutive_failures: " << s.consecutive_failures << "\n";
    oss << "detail: " << json_escape(s.detail) << "\n";
    for(const auto& [key, value] : s.config){
        oss << "config." << key << ": " << json_escape(value) << "\n";
    }
    return oss.str();
}

std::optional<Session> parse_session_record(const std::string& text){
    std::istringstream in(text);
    std::string line;
    if(!std::getline(in, line) || trim_copy(line) != "SESSION_V1") return std::nullopt;

    Session s;
    bool have_id = false, have_kind = false, have_state = false, have_created = false;
    while(std::getline(in, line)){
        if(trim_copy(line).empty()) continue;
        size_t colon = line.find(':');
        if(colon == std::string::npos) return std::nullopt;
        std::string key = trim_copy(line.substr(0, colon));
        std::string value = trim_copy(line.substr(colon + 1));

        try{
            if(key == "id"){
                s.session_id = value;
                have_id = !value.empty();
            } else if(key == "kind"){
                auto kind = parse_kind(value);
                if(!kind) return std::nullopt;
                s.kind = *kind;
                have_kind = true;
            } else if(key == "state"){
                auto state = parse_state(value);
                if(!state) return std::nullopt;
                s.state = *state;
                have_state = true;
            } else if(key == "created_at"){
                auto tp = parse_timestamp(value);
                if(!tp) return std::nullopt;
                s.created_at = *tp;
                have_created = true;
            } else if(key == "last_health_at"){
                if(value != "-") s.last_health_at = parse_timestamp(value);
            } else if(key == "last_snapshot_ref"){
                if(value != "-") s.last_snapshot_ref = json_unescape(value);
            } else if(key == "transition_seq"){
                s.transition_seq = std::stoull(value);
            } else if(key == "consecutive_failures"){
                s.consecutive_failures = std::stoi(value);
            } else if(key == "detail"){
                s.detail = json_unescape(value);
            } else if(key.rfind("config.", 0) == 0){
                s.config[key.substr(7)] = json_unescape(value);
            }
        } catch(const std::exception&){
            return std::nullopt;
        }
    }
    if(!have_id || !have_kind || !have_state || !have_created) return std::nullopt;
    return s;
}

SessionRegistry::SessionRegistry(fs::path sessions_dir, DriverRegistry& drivers,
                                 EventNotifier& events, Millis call_timeout)
    : dir_(std::move(sessions_dir)), drivers_(drivers), events_(events), call_timeout_(call_timeout) {}

fs::path SessionRegistry::record_path(const std::string& session_id) const {
    return dir_ / (session_id + ".session");
}

void SessionRegistry::load(bool read_only){
    TRACE_FN("dir=", dir_.string(), " read_only=", read_only);
    if(!read_only) ensure_dir_exists(dir_);

    uint64_t next = 1;
    std::error_code ec;
    fs::path counter = dir_ / "next_id";
    if(fs::exists(counter, ec)){
        std::string text = trim_copy(read_file(counter));
        try{
            next = std::max<uint64_t>(next, std::stoull(text));
        } catch(const std::exception&){
            log_warning("SessionRegistry", "ignoring malformed id counter: " + text);
        }
    }

    std::map<std::string, std::shared_ptr<SessionSlot>> loaded;
    for(const auto& entry : fs::directory_iterator(dir_, ec)){
        if(!entry.is_regular_file() || entry.path().extension() != ".session") continue;
        std::string text;
        try{
            text = read_file(entry.path());
        } catch(const PersistError& e){
            log_warning("SessionRegistry", e.what());
            continue;
        }
        auto session = parse_session_record(text);
        if(!session){
            log_warning("SessionRegistry", "skipping unreadable record " + entry.path().filename().string());
            continue;
        }

        // Events may have been appended after the record was last written.
        if(reconcile_with_events(*session, events_.events_since(session->session_id, 0))){
            log_notice("SessionRegistry", session->session_id + " record behind its events; now " +
                       state_label(session->state) + " at transition " + std::to_string(session->transition_seq));
            if(!read_only){
                try{
                    write_file_atomic(entry.path(), render_session_record(*session));
                } catch(const PersistError& e){
                    log_warning("SessionRegistry", session->session_id + " record not rewritten: " + e.what());
                }
            }
        }

        if(auto n = session_number(session->session_id)) next = std::max(next, *n + 1);
        auto slot = std::make_shared<SessionSlot>();
        slot->session = *session;
        slot->view = *session;
        loaded[session->session_id] = slot;
    }

    {
        std::lock_guard<std::mutex> lock(id_mutex_);
        next_id_ = next;
    }
    std::lock_guard<std::mutex> lock(map_mutex_);
    slots_.swap(loaded);
    TRACE_MSG("loaded ", slots_.size(), " sessions, next id ", next);
}

std::string SessionRegistry::allocate_id(){
    std::lock_guard<std::mutex> lock(id_mutex_);
    uint64_t n = next_id_++;
    write_file_atomic(dir_ / "next_id", std::to_string(next_id_) + "\n");
    return format_session_id(n);
}

std::string SessionRegistry::create(SessionKind kind, const DriverConfig& config){
    Millis timeout = call_timeout_;
    return launch(kind, config,
        [&config, timeout](std::shared_ptr<EnvironmentDriver> driver){
            return guarded_start(std::move(driver), config, timeout);
        }, 2, "started", std::nullopt);
}

std::string SessionRegistry::create_from_snapshot(SessionKind kind, const DriverConfig& config,
                                                  const SnapshotPayload& payload, const std::string& snapshot_id){
    Millis timeout = call_timeout_;
    return launch(kind, config,
        [&payload, timeout](std::shared_ptr<EnvironmentDriver> driver){
            return guarded_restore(std::move(driver), payload, timeout);
        }, 1, "resumed from snapshot " + snapshot_id, snapshot_id);
}

std::string SessionRegistry::launch(SessionKind kind, const DriverConfig& config,
                                    const std::function<DriverHandle(std::shared_ptr<EnvironmentDriver>)>& bring_up,
                                    int attempts, const std::string& started_detail,
                                    const std::optional<std::string>& snapshot_ref){
    auto driver = drivers_.instantiate(kind);

    auto slot = std::make_shared<SessionSlot>();
    std::lock_guard<std::mutex> lock(slot->mutex);
    Session& s = slot->session;
    s.session_id = allocate_id();
    s.kind = kind;
    s.state = SessionState::Starting;
    s.created_at = Clock::now();
    s.config = config;
    slot->driver = driver;
    persist(*slot);
    {
        std::lock_guard<std::mutex> map_lock(map_mutex_);
        slots_[s.session_id] = slot;
    }
    TRACE_FN("session=", s.session_id, " kind=", kind_label(kind));
    log_notice("SessionRegistry", "starting " + s.session_id + " (" + kind_label(kind) + ")");

    std::exception_ptr last_error;
    std::string last_message;
    for(int attempt = 1; attempt <= attempts; ++attempt){
        try{
            slot->handle = bring_up(driver);
            break;
        } catch(const MindRunError& e){
            last_error = std::current_exception();
            last_message = e.what();
        }
        if(attempt < attempts){
            log_warning("SessionRegistry", s.session_id + " start attempt " + std::to_string(attempt) +
                        " failed (" + last_message + "); retrying");
        }
    }

    if(slot->handle){
        s.last_snapshot_ref = snapshot_ref;
        commit(*slot, SessionState::Running, EventKind::Started, started_detail);
        return s.session_id;
    }

    log_warning("SessionRegistry", s.session_id + " failed to start: " + last_message);
    commit(*slot, SessionState::Failed, EventKind::StartFailed, last_message);
    std::rethrow_exception(last_error);
}

std::shared_ptr<SessionSlot> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = slots_.find(session_id);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionSlot> SessionRegistry::slot(const std::string& session_id) const {
    auto found = find(session_id);
    if(!found) throw NotFound("unknown session " + session_id);
    return found;
}

Session SessionRegistry::get(const std::string& session_id) const {
    auto s = slot(session_id);
    std::lock_guard<std::mutex> lock(s->view_mutex);
    return s->view;
}

void SessionRegistry::teardown(const std::string& session_id){
    auto s = slot(session_id);
    s->cancel();

    std::lock_guard<std::mutex> lock(s->mutex);
    if(is_terminal(s->session.state)){
        TRACE_MSG("teardown of ", session_id, " already ", state_label(s->session.state));
        return;
    }

    std::string detail = "torn down";
    if(s->handle){
        try{
            guarded_stop(driver_for(*s), *s->handle, call_timeout_);
        } catch(const MindRunError& e){
            detail += std::string("; stop failed: ") + e.what();
            log_warning("SessionRegistry", session_id + " stop failed: " + e.what());
        }
    }
    s->handle.reset();
    commit(*s, SessionState::Terminated, EventKind::Terminated, detail);
}

std::vector<Session> SessionRegistry::list_all() const {
    std::vector<std::shared_ptr<SessionSlot>> all;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for(const auto& [id, s] : slots_) all.push_back(s);
    }
    std::vector<Session> out;
    for(const auto& s : all){
        std::lock_guard<std::mutex> lock(s->view_mutex);
        out.push_back(s->view);
    }
    std::sort(out.begin(), out.end(), [](const Session& a, const Session& b){
        if(a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.session_id < b.session_id;
    });
    return out;
}

std::vector<Session> SessionRegistry::list_active() const {
    auto all = list_all();
    all.erase(std::remove_if(all.begin(), all.end(),
        [](const Session& s){ return is_terminal(s.state); }), all.end());
    return all;
}

bool SessionRegistry::commit(SessionSlot& slot, SessionState to, EventKind kind, const std::string& detail){
    Session& s = slot.session;
    if(!can_transition(s.state, to)){
        TRACE_MSG("rejected ", s.session_id, " ", state_label(s.state), " -> ", state_label(to));
        return false;
    }
    log_notice("SessionRegistry", s.session_id + " " + state_label(s.state) + " -> " + state_label(to) +
               (detail.empty() ? "" : " (" + detail + ")"));
    s.state = to;
    if(to == SessionState::Running) s.consecutive_failures = 0;
    return emit_and_persist(slot, kind, detail);
}

bool SessionRegistry::orphan(SessionSlot& slot, const std::string& detail){
    Session& s = slot.session;
    if(s.state != SessionState::Running && s.state != SessionState::Degraded) return false;
    log_notice("SessionRegistry", s.session_id + " " + state_label(s.state) + " -> lost (" + detail + ")");
    s.state = SessionState::Lost;
    slot.handle.reset();
    return emit_and_persist(slot, EventKind::Lost, detail);
}

bool SessionRegistry::emit_and_persist(SessionSlot& slot, EventKind kind, const std::string& detail){
    Session& s = slot.session;
    ++s.transition_seq;
    s.detail = detail;
    try{
        events_.emit(s.session_id, kind, detail, "t:" + std::to_string(s.transition_seq));
    } catch(const PersistError& e){
        // The transition stands without its event.
        log_warning("SessionRegistry", s.session_id + " " + event_kind_label(kind) + " event lost: " + e.what());
    }
    try{
        persist(slot);
    } catch(const PersistError& e){
        log_warning("SessionRegistry", s.session_id + " record not written: " + e.what());
        publish(slot);
    }
    return true;
}

void SessionRegistry::set_snapshot_ref(SessionSlot& slot, const std::string& snapshot_id){
    slot.session.last_snapshot_ref = snapshot_id;
    try{
        persist(slot);
    } catch(const PersistError& e){
        log_warning("SessionRegistry", slot.session.session_id + " record not written: " + e.what());
        publish(slot);
    }
}

void SessionRegistry::publish(SessionSlot& slot){
    std::lock_guard<std::mutex> lock(slot.view_mutex);
    slot.view = slot.session;
}

void SessionRegistry::persist(SessionSlot& slot){
    publish(slot);
    write_file_atomic(record_path(slot.session.session_id), render_session_record(slot.session));
}

std::shared_ptr<EnvironmentDriver> SessionRegistry::driver_for(SessionSlot& slot){
    if(!slot.driver) slot.driver = drivers_.instantiate(slot.session.kind);
    return slot.driver;
}

void SessionRegistry::flush(){
    std::vector<std::shared_ptr<SessionSlot>> all;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for(const auto& [id, s] : slots_) all.push_back(s);
    }
    for(const auto& s : all){
        Session view;
        {
            std::lock_guard<std::mutex> lock(s->view_mutex);
            view = s->view;
        }
        try{
            write_file_atomic(record_path(view.session_id), render_session_record(view));
        } catch(const PersistError& e){
            log_warning("SessionRegistry", e.what());
        }
    }
}

void SessionRegistry::cancel_all(){
    std::lock_guard<std::mutex> lock(map_mutex_);
    for(const auto& [id, s] : slots_) s->cancel();
}

} // namespace MindRun
