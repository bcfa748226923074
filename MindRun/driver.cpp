#include "MindRun.h"

namespace MindRun {

void DriverRegistry::register_kind(SessionKind kind, DriverFactory factory){
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[kind] = std::move(factory);
}

std::shared_ptr<EnvironmentDriver> DriverRegistry::instantiate(SessionKind kind) const {
    DriverFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(kind);
        if(it == factories_.end()){
            throw NotFound(std::string("no driver registered for kind ") + kind_label(kind));
        }
        factory = it->second;
    }
    auto driver = factory();
    if(!driver){
        throw StartupError(std::string("driver factory for ") + kind_label(kind) + " returned nothing");
    }
    return driver;
}

namespace {
    template<typename AdapterError, typename T>
    T run_adapter_call(const std::string& what, Millis timeout, std::function<T()> fn,
                       typename LateResult<T>::type on_late = {}){
        try{
            return call_with_deadline<T>(what, timeout, std::move(fn), std::move(on_late));
        } catch(const AdapterError&){
            throw;
        } catch(const TimeoutExceeded&){
            throw;
        } catch(const std::exception& e){
            throw AdapterError(what + ": " + e.what());
        } catch(...){
            throw AdapterError(what + ": non-standard exception from adapter");
        }
    }

    // A handle that comes back after its call timed out belongs to no
    // session, so it is stopped where it arrives.
    LateResult<DriverHandle>::type stop_late_handle(std::shared_ptr<EnvironmentDriver> driver, const std::string& what){
        return [driver, what](const DriverHandle& handle){
            log_warning("Driver", what + " returned " + handle + " after its deadline; stopping it");
            driver->stop(handle);
        };
    }
}

DriverHandle guarded_start(std::shared_ptr<EnvironmentDriver> driver, const DriverConfig& config, Millis timeout){
    return run_adapter_call<StartupError, DriverHandle>("start", timeout,
        [driver, config](){ return driver->start(config); },
        stop_late_handle(driver, "start"));
}

void guarded_stop(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout){
    run_adapter_call<ShutdownError, void>("stop", timeout,
        [driver, handle](){ driver->stop(handle); });
}

SnapshotPayload guarded_capture(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout){
    return run_adapter_call<CaptureError, SnapshotPayload>("capture_state", timeout,
        [driver, handle](){ return driver->capture_state(handle); });
}

DriverHandle guarded_restore(std::shared_ptr<EnvironmentDriver> driver, const SnapshotPayload& payload, Millis timeout){
    return run_adapter_call<RestoreError, DriverHandle>("restore_state", timeout,
        [driver, payload](){ return driver->restore_state(payload); },
        stop_late_handle(driver, "restore_state"));
}

ProbeResult guarded_probe(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout){
    return run_adapter_call<ProbeError, ProbeResult>("health_check", timeout,
        [driver, handle, timeout](){ return driver->health_check(handle, timeout); });
}

} // namespace MindRun
