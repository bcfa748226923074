#include "MindRun.h"

namespace MindRun {

namespace {
    bool env_truthy(const char* name){
        if(const char* val = std::getenv(name)){
            std::string v = trim_copy(val);
            return !v.empty() && v != "0" && v != "false" && v != "no";
        }
        return false;
    }

    void env_millis(const char* name, Millis& out){
        if(const char* val = std::getenv(name); val && *val){
            out = Millis(static_cast<Millis::rep>(parse_size_arg(trim_copy(val), name)));
        }
    }

    void env_int(const char* name, int& out){
        if(const char* val = std::getenv(name); val && *val){
            size_t n = parse_size_arg(trim_copy(val), name);
            if(n > static_cast<size_t>(std::numeric_limits<int>::max())){
                throw std::runtime_error(std::string(name) + " out of range");
            }
            out = static_cast<int>(n);
        }
    }
}

SupervisorConfig SupervisorConfig::from_env(){
    SupervisorConfig cfg;
    if(const char* dir = std::getenv("MINDRUN_STATE_DIR"); dir && *dir) cfg.state_dir = dir;
    env_millis("MINDRUN_PROBE_INTERVAL_MS", cfg.probe_interval);
    env_millis("MINDRUN_PROBE_TIMEOUT_MS", cfg.probe_timeout);
    env_millis("MINDRUN_CALL_TIMEOUT_MS", cfg.call_timeout);
    env_int("MINDRUN_FAILURE_THRESHOLD", cfg.failure_threshold);
    env_int("MINDRUN_RECOVERY_ATTEMPTS", cfg.recovery_attempts);
    env_millis("MINDRUN_BACKOFF_MS", cfg.backoff_initial);
    env_millis("MINDRUN_BACKOFF_MAX_MS", cfg.backoff_max);
    if(env_truthy("MINDRUN_QUIET")) cfg.quiet = true;
    return cfg;
}

std::vector<std::string> SupervisorConfig::merge_with_cli(const std::vector<std::string>& args){
    std::vector<std::string> rest;
    auto value_of = [&](size_t& i, const std::string& flag) -> const std::string& {
        if(i + 1 >= args.size()) throw std::runtime_error(flag + " requires a value");
        return args[++i];
    };
    auto millis_of = [&](size_t& i, const std::string& flag){
        return Millis(static_cast<Millis::rep>(parse_size_arg(value_of(i, flag), flag.c_str())));
    };
    auto int_of = [&](size_t& i, const std::string& flag){
        size_t n = parse_size_arg(value_of(i, flag), flag.c_str());
        if(n > static_cast<size_t>(std::numeric_limits<int>::max())) throw std::runtime_error(flag + " out of range");
        return static_cast<int>(n);
    };

    for(size_t i = 0; i < args.size(); ++i){
        const std::string& arg = args[i];
        if(arg == "--state-dir" || arg == "-s"){ state_dir = value_of(i, arg); continue; }
        if(arg == "--probe-interval"){ probe_interval = millis_of(i, arg); continue; }
        if(arg == "--probe-timeout"){ probe_timeout = millis_of(i, arg); continue; }
        if(arg == "--call-timeout"){ call_timeout = millis_of(i, arg); continue; }
        if(arg == "--threshold"){ failure_threshold = int_of(i, arg); continue; }
        if(arg == "--attempts"){ recovery_attempts = int_of(i, arg); continue; }
        if(arg == "--backoff"){ backoff_initial = millis_of(i, arg); continue; }
        if(arg == "--backoff-max"){ backoff_max = millis_of(i, arg); continue; }
        if(arg == "--no-resume"){ resume_on_start = false; continue; }
        if(arg == "--manual-probe"){ auto_probe = false; continue; }
        if(arg == "--quiet" || arg == "-q"){ quiet = true; continue; }
        rest.push_back(arg);
    }
    return rest;
}

void SupervisorConfig::validate() const {
    if(state_dir.empty()) throw std::runtime_error("state_dir must not be empty");
    if(failure_threshold < 1) throw std::runtime_error("failure_threshold must be at least 1");
    if(recovery_attempts < 1) throw std::runtime_error("recovery_attempts must be at least 1");
    if(probe_timeout.count() <= 0) throw std::runtime_error("probe_timeout must be positive");
    if(call_timeout.count() <= 0) throw std::runtime_error("call_timeout must be positive");
    if(backoff_max < backoff_initial) throw std::runtime_error("backoff_max must not be below backoff_initial");
}

Supervisor::Supervisor(SupervisorConfig config)
    : config_(std::move(config)),
      events_(config_.state_dir / "events"),
      registry_(config_.state_dir / "sessions", drivers_, events_, config_.call_timeout),
      store_(config_.state_dir / "snapshots"),
      recovery_(registry_, store_, RecoverySettings{config_.recovery_attempts, config_.backoff_initial,
                                                    config_.backoff_max, config_.call_timeout}),
      monitor_(registry_, recovery_, MonitorSettings{config_.probe_interval, config_.probe_timeout,
                                                     config_.failure_threshold}) {
    config_.validate();
    set_quiet(config_.quiet);
}

Supervisor::~Supervisor(){
    shutdown();
}

void Supervisor::register_driver(SessionKind kind, DriverFactory factory){
    drivers_.register_kind(kind, std::move(factory));
}

void Supervisor::init(){
    TRACE_FN("state_dir=", config_.state_dir.string());
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if(initialized_) return;
    if(!ensure_dir_exists(config_.state_dir)){
        throw PersistError("cannot create state directory " + config_.state_dir.string());
    }
    events_.load();
    store_.load();
    registry_.load();
    initialized_ = true;
    shut_down_ = false;

    auto sessions = registry_.list_all();
    log_notice("Supervisor", "state " + config_.state_dir.string() + ": " + std::to_string(sessions.size()) +
               " session(s), " + std::to_string(store_.size()) + " snapshot(s)");
    settle_restored_sessions();
}

void Supervisor::settle_restored_sessions(){
    for(const auto& s : registry_.list_active()){
        auto slot = registry_.find(s.session_id);
        if(!slot) continue;
        bool lost = false;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            switch(slot->session.state){
                case SessionState::Starting:
                    registry_.commit(*slot, SessionState::Failed, EventKind::StartFailed,
                                     "supervisor restarted during startup");
                    break;
                case SessionState::Running:
                case SessionState::Degraded:
                    registry_.orphan(*slot, "supervisor restarted");
                    lost = true;
                    break;
                case SessionState::Lost:
                    lost = true;
                    break;
                default:
                    break;
            }
        }
        if(!lost || !config_.resume_on_start) continue;
        if(config_.auto_probe){
            monitor_.watch(s.session_id);
        } else {
            recovery_.recover(s.session_id);
        }
    }
}

void Supervisor::shutdown(){
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if(!initialized_ || shut_down_) return;
    registry_.cancel_all();
    monitor_.stop_all();
    registry_.flush();
    events_.drain();
    shut_down_ = true;
    log_notice("Supervisor", "shut down");
}

std::string Supervisor::create_session(SessionKind kind, const DriverConfig& config){
    std::string id = registry_.create(kind, config);
    if(config_.auto_probe) monitor_.watch(id);
    return id;
}

void Supervisor::teardown_session(const std::string& session_id){
    registry_.teardown(session_id);
    monitor_.unwatch(session_id);
}

std::string Supervisor::capture_snapshot(const std::string& owner){
    return store_.capture(registry_, events_, owner, config_.call_timeout);
}

SnapshotPayload Supervisor::restore_snapshot(const std::string& snapshot_id) const {
    return store_.restore(snapshot_id);
}

std::string Supervisor::resume_session(const std::string& snapshot_id){
    Snapshot snap = store_.get(snapshot_id);
    if(snap.session_id == GLOBAL_OWNER){
        throw RestoreError("snapshot " + snapshot_id + " holds global state, not a session environment");
    }
    Session origin = registry_.get(snap.session_id);
    SnapshotPayload payload = store_.restore(snapshot_id);
    std::string id = registry_.create_from_snapshot(origin.kind, origin.config, payload, snapshot_id);
    log_notice("Supervisor", id + " resumed from " + snap.session_id + " snapshot " + snapshot_id.substr(0, 16));
    if(config_.auto_probe) monitor_.watch(id);
    return id;
}

void Supervisor::set_global_serializer(GlobalSerializer serializer){
    store_.set_global_serializer(std::move(serializer));
}

Session Supervisor::get_session(const std::string& session_id) const {
    return registry_.get(session_id);
}

std::vector<Session> Supervisor::list_sessions(bool include_finished) const {
    return include_finished ? registry_.list_all() : registry_.list_active();
}

SessionState Supervisor::probe(const std::string& session_id){
    return monitor_.probe_once(session_id);
}

std::vector<Event> Supervisor::events_since(const std::string& session_id, uint64_t after_event_id) const {
    return events_.events_since(session_id, after_event_id);
}

std::optional<Event> Supervisor::wait_for_event(const std::string& session_id, uint64_t after_event_id, Millis timeout) const {
    return events_.wait_for(session_id, after_event_id, timeout);
}

size_t Supervisor::subscribe(EventCallback callback){
    return events_.subscribe(std::move(callback));
}

bool Supervisor::unsubscribe(size_t token){
    return events_.unsubscribe(token);
}

} // namespace MindRun
