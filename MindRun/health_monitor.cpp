#include "MindRun.h"

namespace MindRun {

HealthMonitor::HealthMonitor(SessionRegistry& registry, RecoveryCoordinator& recovery, MonitorSettings settings)
    : registry_(registry), recovery_(recovery), settings_(settings) {}

HealthMonitor::~HealthMonitor(){
    stop_all();
}

void HealthMonitor::watch(const std::string& session_id){
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.find(session_id);
    if(it != tasks_.end()){
        if(!it->second->finished.load()) return;
        join_task(*it->second);
        tasks_.erase(it);
    }
    auto task = std::make_shared<Task>();
    tasks_[session_id] = task;
    task->thread = std::thread(&HealthMonitor::run_task, this, session_id, task);
    TRACE_MSG("watching ", session_id);
}

void HealthMonitor::unwatch(const std::string& session_id){
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(session_id);
        if(it == tasks_.end()) return;
        task = it->second;
        tasks_.erase(it);
    }
    if(auto slot = registry_.find(session_id)) slot->cancel();
    join_task(*task);
}

void HealthMonitor::stop_all(){
    std::map<std::string, std::shared_ptr<Task>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }
    for(auto& [id, task] : tasks){
        if(auto slot = registry_.find(id)) slot->cancel();
    }
    for(auto& [id, task] : tasks){
        join_task(*task);
    }
    if(!tasks.empty()){
        log_notice("HealthMonitor", "stopped " + std::to_string(tasks.size()) + " supervision task(s)");
    }
}

void HealthMonitor::join_task(Task& task){
    if(!task.thread.joinable()) return;
    // Joining from the task's own thread would never return.
    if(task.thread.get_id() == std::this_thread::get_id()){
        task.thread.detach();
    } else {
        task.thread.join();
    }
}

bool HealthMonitor::is_watching(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.find(session_id);
    return it != tasks_.end() && !it->second->finished.load();
}

size_t HealthMonitor::task_count() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    size_t n = 0;
    for(const auto& [id, task] : tasks_){
        if(!task->finished.load()) ++n;
    }
    return n;
}

void HealthMonitor::run_task(const std::string& session_id, std::shared_ptr<Task> task){
    TRACE_FN("session=", session_id);
    while(true){
        auto slot = registry_.find(session_id);
        if(!slot || slot->cancelled()) break;

        SessionState state;
        {
            std::lock_guard<std::mutex> lock(slot->view_mutex);
            state = slot->view.state;
        }
        if(is_terminal(state)) break;

        // A session already lost (restart, or a cycle cut short) goes
        // straight to recovery.
        if(state != SessionState::Lost && slot->wait_cancelled(settings_.probe_interval)) break;

        TRACE_LOOP("probe", session_id);
        try{
            state = probe_once(session_id);
        } catch(const MindRunError& e){
            log_warning("HealthMonitor", session_id + " supervision stopped: " + e.what());
            break;
        }
        if(is_terminal(state)) break;
        if(state == SessionState::Lost && slot->wait_cancelled(settings_.probe_interval)) break;
    }
    task->finished.store(true);
    TRACE_MSG("supervision of ", session_id, " ended");
}

SessionState HealthMonitor::probe_once(const std::string& session_id){
    auto slot = registry_.slot(session_id);
    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        Session& s = slot->session;
        if(s.state == SessionState::Lost){
            lost = true;
        } else if(s.state != SessionState::Running && s.state != SessionState::Degraded){
            return s.state;
        } else {
            bool healthy = false;
            std::string why;
            if(!slot->handle){
                why = "no live handle";
            } else {
                try{
                    healthy = guarded_probe(registry_.driver_for(*slot), *slot->handle, settings_.probe_timeout) == ProbeResult::Healthy;
                    if(!healthy) why = "environment unresponsive";
                } catch(const TimeoutExceeded& e){
                    why = std::string("probe timed out: ") + e.what();
                } catch(const MindRunError& e){
                    why = e.what();
                }
            }
            s.last_health_at = Clock::now();

            if(healthy){
                s.consecutive_failures = 0;
                if(s.state == SessionState::Degraded){
                    registry_.commit(*slot, SessionState::Running, EventKind::Recovered, "health probe passed");
                }
            } else {
                ++s.consecutive_failures;
                std::string detail = why + " (" + std::to_string(s.consecutive_failures) + "/" +
                                     std::to_string(settings_.failure_threshold) + ")";
                TRACE_MSG(session_id, " probe failed: ", detail);
                if(s.state == SessionState::Running){
                    registry_.commit(*slot, SessionState::Degraded, EventKind::Degraded, detail);
                }
                if(s.state == SessionState::Degraded && s.consecutive_failures >= settings_.failure_threshold){
                    registry_.commit(*slot, SessionState::Lost, EventKind::Lost, detail);
                    lost = true;
                }
            }
            registry_.publish(*slot);
        }
    }

    if(lost){
        recovery_.recover(session_id);
    }
    return registry_.get(session_id).state;
}

} // namespace MindRun
