#include "MindRun.h"

namespace MindRun {

const char* recovery_outcome_label(RecoveryOutcome outcome){
    switch(outcome){
        case RecoveryOutcome::Recovered: return "recovered";
        case RecoveryOutcome::Exhausted: return "exhausted";
        case RecoveryOutcome::Cancelled: return "cancelled";
        case RecoveryOutcome::AlreadyRunning: return "already_running";
    }
    return "?";
}

RecoveryCoordinator::RecoveryCoordinator(SessionRegistry& registry, SnapshotStore& store, RecoverySettings settings)
    : registry_(registry), store_(store), settings_(settings) {}

Millis RecoveryCoordinator::backoff_for(int attempt) const {
    Millis delay = settings_.backoff_initial;
    for(int i = 1; i < attempt && delay < settings_.backoff_max; ++i){
        delay *= 2;
    }
    return std::min(delay, settings_.backoff_max);
}

RecoveryOutcome RecoveryCoordinator::recover(const std::string& session_id){
    TRACE_FN("session=", session_id);
    auto slot = registry_.find(session_id);
    if(!slot) return RecoveryOutcome::Cancelled;

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        if(!in_flight_.insert(session_id).second){
            TRACE_MSG("recovery of ", session_id, " already in flight");
            return RecoveryOutcome::AlreadyRunning;
        }
    }
    struct InFlightGuard {
        RecoveryCoordinator& self;
        const std::string& id;
        ~InFlightGuard(){
            std::lock_guard<std::mutex> lock(self.in_flight_mutex_);
            self.in_flight_.erase(id);
        }
    } guard{*this, session_id};

    ++sequences_;
    log_notice("Recovery", "recovering " + session_id + " (up to " + std::to_string(settings_.max_attempts) + " attempts)");

    // The old handle may still hold resources even though it stopped answering.
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if(slot->session.state != SessionState::Lost) return RecoveryOutcome::Cancelled;
        if(slot->handle){
            try{
                guarded_stop(registry_.driver_for(*slot), *slot->handle, settings_.call_timeout);
            } catch(const MindRunError& e){
                log_warning("Recovery", session_id + " stale handle stop failed: " + e.what());
            }
            slot->handle.reset();
        }
    }

    RecoveryOutcome outcome;
    try{
        outcome = run_attempts(*slot, session_id);
    } catch(const RecoveryExhausted& e){
        std::lock_guard<std::mutex> lock(slot->mutex);
        if(!registry_.commit(*slot, SessionState::TerminalFailure, EventKind::TerminalFailure, e.what())){
            return RecoveryOutcome::Cancelled;
        }
        log_warning("Recovery", session_id + " " + e.what());
        return RecoveryOutcome::Exhausted;
    }
    log_notice("Recovery", session_id + " recovery " + recovery_outcome_label(outcome));
    return outcome;
}

RecoveryOutcome RecoveryCoordinator::run_attempts(SessionSlot& slot, const std::string& session_id){
    std::string last_error = "no restore attempted";
    for(int attempt = 1; attempt <= settings_.max_attempts; ++attempt){
        if(slot.cancelled()) return RecoveryOutcome::Cancelled;
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if(slot.session.state != SessionState::Lost) return RecoveryOutcome::Cancelled;
            try{
                const auto& ref = slot.session.last_snapshot_ref;
                if(!ref) throw RestoreError("session has no snapshot to restore from");
                SnapshotPayload payload;
                try{
                    payload = store_.restore(*ref);
                } catch(const NotFound&){
                    throw RestoreError("snapshot " + *ref + " is not in the store");
                }
                DriverHandle handle = guarded_restore(registry_.driver_for(slot), payload, settings_.call_timeout);
                slot.handle = handle;
                registry_.commit(slot, SessionState::Running, EventKind::Recovered,
                                 "restored from snapshot " + *ref + " (attempt " + std::to_string(attempt) + ")");
                return RecoveryOutcome::Recovered;
            } catch(const MindRunError& e){
                last_error = e.what();
            }
        }
        log_warning("Recovery", session_id + " attempt " + std::to_string(attempt) + "/" +
                    std::to_string(settings_.max_attempts) + " failed: " + last_error);
        if(attempt < settings_.max_attempts && slot.wait_cancelled(backoff_for(attempt))){
            return RecoveryOutcome::Cancelled;
        }
    }
    throw RecoveryExhausted("recovery exhausted after " + std::to_string(settings_.max_attempts) +
                            " attempts: " + last_error);
}

} // namespace MindRun
