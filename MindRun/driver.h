#pragma once

namespace MindRun {

// Capability set every dynamic environment (browser, notebook kernel, ...)
// provides. One instance owns the live resources of exactly one session.
class EnvironmentDriver {
public:
    virtual ~EnvironmentDriver() = default;

    // Throws StartupError. Safe to retry once when no handle came back.
    virtual DriverHandle start(const DriverConfig& config) = 0;

    // Throws ShutdownError. Best-effort; callers treat failure as gone.
    virtual void stop(const DriverHandle& handle) = 0;

    // Throws CaptureError.
    virtual SnapshotPayload capture_state(const DriverHandle& handle) = 0;

    // Throws RestoreError.
    virtual DriverHandle restore_state(const SnapshotPayload& payload) = 0;

    // Throws ProbeError. Should return within `timeout`; the supervisor
    // enforces that independently.
    virtual ProbeResult health_check(const DriverHandle& handle, Millis timeout) = 0;
};

using DriverFactory = std::function<std::shared_ptr<EnvironmentDriver>()>;

// Per-kind registration table, filled at process startup.
class DriverRegistry {
public:
    void register_kind(SessionKind kind, DriverFactory factory);

    // New adapter instance for one session. Throws NotFound for an
    // unregistered kind, StartupError when the factory yields nothing.
    std::shared_ptr<EnvironmentDriver> instantiate(SessionKind kind) const;

private:
    mutable std::mutex mutex_;
    std::map<SessionKind, DriverFactory> factories_;
};

// Deadline-guarded adapter calls. Exceptions other than the call's own
// adapter error (and TimeoutExceeded) are folded into that adapter error.
DriverHandle guarded_start(std::shared_ptr<EnvironmentDriver> driver, const DriverConfig& config, Millis timeout);
void guarded_stop(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout);
SnapshotPayload guarded_capture(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout);
DriverHandle guarded_restore(std::shared_ptr<EnvironmentDriver> driver, const SnapshotPayload& payload, Millis timeout);
ProbeResult guarded_probe(std::shared_ptr<EnvironmentDriver> driver, const DriverHandle& handle, Millis timeout);

} // namespace MindRun
