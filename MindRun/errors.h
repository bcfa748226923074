#pragma once

namespace MindRun {

// Base of every error this library throws.
struct MindRunError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Adapter-origin failures
struct StartupError : MindRunError { using MindRunError::MindRunError; };
struct ShutdownError : MindRunError { using MindRunError::MindRunError; };
struct CaptureError : MindRunError { using MindRunError::MindRunError; };
struct RestoreError : MindRunError { using MindRunError::MindRunError; };
struct ProbeError : MindRunError { using MindRunError::MindRunError; };

// Registry or snapshot lookup miss
struct NotFound : MindRunError { using MindRunError::MindRunError; };

// Hard deadline on an adapter call passed
struct TimeoutExceeded : MindRunError { using MindRunError::MindRunError; };

// Recovery ran out of attempts; terminal for the session only
struct RecoveryExhausted : MindRunError { using MindRunError::MindRunError; };

// State directory I/O or unreadable persisted data
struct PersistError : MindRunError { using MindRunError::MindRunError; };

} // namespace MindRun
