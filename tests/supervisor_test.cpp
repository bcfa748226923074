#include "test_support.h"

using namespace MindRun;
namespace fs = std::filesystem;
using Outcome = FakeControl::Outcome;

// Manual probing with short timeouts and backoff so cycles run on the test thread.
SupervisorConfig manual_config(const fs::path& dir) {
    SupervisorConfig cfg;
    cfg.state_dir = dir;
    cfg.auto_probe = false;
    cfg.probe_interval = Millis(20);
    cfg.probe_timeout = Millis(100);
    cfg.call_timeout = Millis(300);
    cfg.failure_threshold = 3;
    cfg.recovery_attempts = 3;
    cfg.backoff_initial = Millis(5);
    cfg.backoff_max = Millis(20);
    cfg.quiet = true;
    return cfg;
}

std::unique_ptr<Supervisor> make_supervisor(const SupervisorConfig& cfg, std::shared_ptr<FakeControl> control) {
    auto sup = std::make_unique<Supervisor>(cfg);
    sup->register_driver(SessionKind::Browser, fake_factory(control));
    sup->register_driver(SessionKind::Notebook, fake_factory(control));
    sup->init();
    return sup;
}

// ============================================================================
// Test Cases
// ============================================================================

void test_transient_blips(const fs::path& dir) {
    test_header("Transient Probe Failures");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);
    std::string id = sup->create_session(SessionKind::Browser);

    control->push(control->probe_outcomes, Outcome::Unresponsive);
    if (sup->probe(id) != SessionState::Degraded) {
        test_fail("one failed probe should degrade the session");
    }
    if (sup->probe(id) != SessionState::Running) {
        test_fail("a healthy probe should bring a degraded session back");
    }
    auto kinds = kinds_text(sup->events_since(id, 0));
    if (kinds != "started,degraded,recovered") {
        test_fail("unexpected event sequence: " + kinds);
    }
    if (control->restores != 0) {
        test_fail("a blip must not trigger recovery");
    }
    test_pass("blip absorbed: " + kinds);

    Session s = sup->get_session(id);
    if (!s.last_health_at || s.consecutive_failures != 0) {
        test_fail("healthy probe should stamp last_health_at and reset failures");
    }
    test_pass("last_health_at recorded");

    control->push(control->probe_outcomes, Outcome::Hang);
    if (sup->probe(id) != SessionState::Degraded) {
        test_fail("a probe past its deadline should count as a failure");
    }
    if (sup->get_session(id).detail.find("probe timed out") == std::string::npos) {
        test_fail("timeout should be named in the detail");
    }
    test_pass("probe timeout counted as failure");
}

void test_lost_and_recovered(const fs::path& dir) {
    test_header("Lost Then Recovered");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);
    std::string id = sup->create_session(SessionKind::Browser);
    std::string snap = sup->capture_snapshot(id);

    control->push(control->probe_outcomes, Outcome::Unresponsive, 3);
    sup->probe(id);
    sup->probe(id);
    if (sup->get_session(id).state != SessionState::Degraded) {
        test_fail("two failures stay below the threshold");
    }
    SessionState after = sup->probe(id);
    if (after != SessionState::Running) {
        test_fail("third failure should lose and recover the session, got " + std::string(state_label(after)));
    }
    if (control->restores != 1 || control->restored_payloads.at(0) != control->state) {
        test_fail("recovery should restore the captured payload once");
    }
    auto kinds = kinds_text(sup->events_since(id, 0));
    if (kinds != "started,snapshot_captured,degraded,lost,recovered") {
        test_fail("unexpected event sequence: " + kinds);
    }
    auto events = sup->events_since(id, 0);
    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].event_id != i + 1) {
            test_fail("event ids should run 1..n without gaps");
        }
    }
    if (events.back().detail.find(snap) == std::string::npos) {
        test_fail("recovered event should name the snapshot");
    }
    test_pass("recovered from " + snap.substr(0, 16));

    if (sup->recovery().sequences_started() != 1) {
        test_fail("exactly one recovery sequence expected");
    }
    test_pass("single recovery sequence");
}

void test_recovery_exhausted(const fs::path& dir) {
    test_header("Recovery Exhausted");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);

    std::string id = sup->create_session(SessionKind::Notebook);
    sup->capture_snapshot(id);
    control->default_restore = Outcome::Throw;
    control->push(control->probe_outcomes, Outcome::Unresponsive, 3);
    for (int i = 0; i < 3; ++i) sup->probe(id);

    Session s = sup->get_session(id);
    if (s.state != SessionState::TerminalFailure) {
        test_fail("failed restores should end in terminal_failure, got " + std::string(state_label(s.state)));
    }
    if (control->restores != 3) {
        test_fail("expected three restore attempts, got " + std::to_string(control->restores.load()));
    }
    auto events = sup->events_since(id, 0);
    if (events.back().kind != EventKind::TerminalFailure ||
        events.back().detail.find("recovery exhausted") == std::string::npos) {
        test_fail("terminal_failure event should carry the exhaustion reason");
    }
    test_pass("terminal_failure after 3 attempts");

    int probes_before = control->probes;
    sup->probe(id);
    if (control->probes != probes_before) {
        test_fail("terminal sessions must not be probed");
    }
    expect_throw<CaptureError>([&] { sup->capture_snapshot(id); }, "capture of a failed session");

    control->default_restore = Outcome::Ok;
    std::string bare = sup->create_session(SessionKind::Notebook);
    control->push(control->probe_outcomes, Outcome::Unresponsive, 3);
    for (int i = 0; i < 3; ++i) sup->probe(bare);
    if (sup->get_session(bare).state != SessionState::TerminalFailure || control->restores != 3) {
        test_fail("session without a snapshot should fail without restoring");
    }
    test_pass("no snapshot: terminal_failure without a restore");
}

void test_late_restore_stopped(const fs::path& dir) {
    test_header("Late Restore Result");

    SupervisorConfig cfg = manual_config(dir);
    cfg.failure_threshold = 1;
    cfg.call_timeout = Millis(100);
    auto control = std::make_shared<FakeControl>();
    control->hang = Millis(250);
    auto sup = make_supervisor(cfg, control);
    std::string id = sup->create_session(SessionKind::Browser);
    sup->capture_snapshot(id);

    control->push(control->restore_outcomes, Outcome::Hang);
    control->push(control->probe_outcomes, Outcome::Unresponsive);
    if (sup->probe(id) != SessionState::Running || control->restores != 2) {
        test_fail("second restore attempt should recover the session");
    }
    std::this_thread::sleep_for(Millis(400));

    DriverHandle live;
    {
        auto slot = sup->registry().slot(id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        live = slot->handle.value_or("");
    }
    std::vector<std::string> stopped;
    {
        std::lock_guard<std::mutex> lock(control->mutex);
        stopped = control->stopped_handles;
    }
    if (stopped.size() != 2 || stopped[0] != "fake-1") {
        test_fail("expected the stale handle and the late restore handle to be stopped, got " +
                  std::to_string(stopped.size()));
    }
    if (live.empty() || stopped[1] == live) {
        test_fail("the live handle must not be stopped");
    }
    test_pass("late handle " + stopped[1] + " stopped, " + live + " stays live");
}

void test_recovery_cancelled(const fs::path& dir) {
    test_header("Recovery Cancelled by Teardown");

    SupervisorConfig cfg = manual_config(dir);
    cfg.failure_threshold = 1;
    cfg.backoff_initial = Millis(3000);
    cfg.backoff_max = Millis(3000);
    auto control = std::make_shared<FakeControl>();
    control->default_restore = Outcome::Throw;
    auto sup = make_supervisor(cfg, control);
    std::string id = sup->create_session(SessionKind::Browser);
    sup->capture_snapshot(id);

    control->push(control->probe_outcomes, Outcome::Unresponsive);
    SessionState after_probe = SessionState::Running;
    std::thread prober([&]() { after_probe = sup->probe(id); });

    auto deadline = std::chrono::steady_clock::now() + Millis(2000);
    while (control->restores < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(Millis(5));
    }
    if (control->restores != 1) {
        prober.join();
        test_fail("recovery should have made its first attempt");
    }

    if (sup->recovery().recover(id) != RecoveryOutcome::AlreadyRunning) {
        prober.join();
        test_fail("a second recover call should report already_running");
    }
    test_pass("second recover call: already_running");

    auto t0 = std::chrono::steady_clock::now();
    sup->teardown_session(id);
    prober.join();
    if (std::chrono::steady_clock::now() - t0 > Millis(1500)) {
        test_fail("teardown should cut the backoff short");
    }
    if (after_probe != SessionState::Terminated || control->restores != 1) {
        test_fail("cancelled recovery should make no further attempts");
    }
    auto kinds = kinds_of(sup->events_since(id, 0));
    if (std::count(kinds.begin(), kinds.end(), EventKind::Terminated) != 1 ||
        std::count(kinds.begin(), kinds.end(), EventKind::TerminalFailure) != 0) {
        test_fail("expected one terminated event and no terminal_failure: " + kinds_text(sup->events_since(id, 0)));
    }
    if (sup->recovery().sequences_started() != 1) {
        test_fail("only the first recover call should start a sequence");
    }
    test_pass("teardown during backoff cancels recovery");
}

void test_capture_probe_exclusive(const fs::path& dir) {
    test_header("Capture and Probe Exclusion");

    auto control = std::make_shared<FakeControl>();
    control->hang = Millis(150);
    auto sup = make_supervisor(manual_config(dir), control);
    std::string id = sup->create_session(SessionKind::Browser);

    control->push(control->capture_outcomes, Outcome::Hang);
    std::thread capturer([&]() { sup->capture_snapshot(id); });
    auto deadline = std::chrono::steady_clock::now() + Millis(2000);
    while (control->captures < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(Millis(2));
    }
    SessionState state = sup->probe(id);
    capturer.join();

    if (state != SessionState::Running || control->probes != 1) {
        test_fail("probe should run once the capture is done");
    }
    if (control->peak_calls != 1) {
        test_fail("capture and probe overlapped on one session");
    }
    if (!sup->get_session(id).last_snapshot_ref) {
        test_fail("capture should have completed");
    }
    test_pass("probe waited for the in-flight capture");
}

void test_teardown(const fs::path& dir) {
    test_header("Teardown");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);
    std::string id = sup->create_session(SessionKind::Browser);

    sup->teardown_session(id);
    sup->teardown_session(id);
    auto kinds = kinds_of(sup->events_since(id, 0));
    if (std::count(kinds.begin(), kinds.end(), EventKind::Terminated) != 1) {
        test_fail("teardown should publish exactly one terminated event");
    }
    if (sup->get_session(id).state != SessionState::Terminated) {
        test_fail("session should be terminated");
    }
    for (const auto& s : sup->list_sessions()) {
        if (s.session_id == id) test_fail("terminated session listed as active");
    }
    if (sup->list_sessions(true).empty()) {
        test_fail("finished sessions should be listed on request");
    }
    test_pass("idempotent teardown");

    expect_throw<CaptureError>([&] { sup->capture_snapshot(id); }, "capture of a terminated session");
    expect_throw<NotFound>([&] { sup->teardown_session("sess-424242"); }, "teardown of unknown session");
    expect_throw<NotFound>([&] { sup->capture_snapshot("sess-424242"); }, "capture of unknown session");
}

void test_restart(const fs::path& dir) {
    test_header("Supervisor Restart");

    auto control = std::make_shared<FakeControl>();
    std::string with_snapshot, without_snapshot;
    {
        auto sup = make_supervisor(manual_config(dir), control);
        with_snapshot = sup->create_session(SessionKind::Browser, {{"url", "https://example.test/docs"}});
        sup->capture_snapshot(with_snapshot);
        without_snapshot = sup->create_session(SessionKind::Browser);
        sup->shutdown();
    }

    // A record left in starting by a crash mid-launch.
    Session half;
    half.session_id = "sess-000003";
    half.kind = SessionKind::Browser;
    half.state = SessionState::Starting;
    half.created_at = Clock::now();
    write_file_atomic(dir / "sessions" / "sess-000003.session", render_session_record(half));
    write_file_atomic(dir / "sessions" / "next_id", "4\n");

    auto next_control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), next_control);

    Session resumed = sup->get_session(with_snapshot);
    if (resumed.state != SessionState::Running || next_control->restores != 1) {
        test_fail("session with a snapshot should come back running");
    }
    auto kinds = kinds_text(sup->events_since(with_snapshot, 0));
    if (kinds != "started,snapshot_captured,lost,recovered") {
        test_fail("unexpected events after restart: " + kinds);
    }
    if (sup->events_since(with_snapshot, 0).back().event_id != 4) {
        test_fail("event numbering should continue across the restart");
    }
    test_pass("lost on restart, then recovered: " + kinds);

    if (sup->get_session(without_snapshot).state != SessionState::TerminalFailure) {
        test_fail("session without a snapshot should end in terminal_failure");
    }
    test_pass("session without snapshot ends terminal_failure");

    Session half_after = sup->get_session("sess-000003");
    auto half_events = sup->events_since("sess-000003", 0);
    if (half_after.state != SessionState::Failed || half_events.size() != 1 ||
        half_events[0].kind != EventKind::StartFailed) {
        test_fail("interrupted start should be marked failed");
    }
    test_pass("interrupted start marked failed");

    std::string fresh = sup->create_session(SessionKind::Browser);
    if (fresh != "sess-000004") {
        test_fail("id allocation should continue, got " + fresh);
    }
    test_pass("ids continue at " + fresh);
    sup->shutdown();

    // Without resume, lost sessions stay lost and cannot be captured.
    SupervisorConfig cfg = manual_config(dir);
    cfg.resume_on_start = false;
    auto idle_control = std::make_shared<FakeControl>();
    auto idle = make_supervisor(cfg, idle_control);
    if (idle->get_session(fresh).state != SessionState::Lost || idle_control->restores != 0) {
        test_fail("resume disabled: session should stay lost");
    }
    expect_throw<CaptureError>([&] { idle->capture_snapshot(fresh); }, "capture of a lost session");
    if (idle->probe(with_snapshot) != SessionState::Running || idle_control->restores != 1) {
        test_fail("probing a lost session should hand it to recovery");
    }
    test_pass("manual probe recovers a lost session");
}

void test_snapshots_and_resume(const fs::path& dir) {
    test_header("Snapshots and Resume");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);
    std::string id = sup->create_session(SessionKind::Notebook, {{"kernel", "python3"}});

    std::string first = sup->capture_snapshot(id);
    control->state = "{\"cells\":2}";
    std::string second = sup->capture_snapshot(id);
    auto chain = sup->snapshots().chain(second);
    if (chain.size() != 2 || chain[1] != first) {
        test_fail("consecutive captures should form a chain");
    }
    if (sup->get_session(id).last_snapshot_ref != second) {
        test_fail("last_snapshot_ref should follow the newest capture");
    }
    test_pass("capture chain of two");

    if (sup->restore_snapshot(first).bytes != "{\"url\":\"https://example.test/\",\"cookies\":[]}") {
        test_fail("restore_snapshot should return the first payload");
    }
    test_pass("restore_snapshot reads the stored payload");

    std::string resumed = sup->resume_session(first);
    Session r = sup->get_session(resumed);
    if (resumed == id || r.state != SessionState::Running || r.kind != SessionKind::Notebook) {
        test_fail("resume should start a new running session of the same kind");
    }
    if (r.last_snapshot_ref != first || r.config.at("kernel") != "python3") {
        test_fail("resumed session should carry the snapshot ref and origin config");
    }
    auto events = sup->events_since(resumed, 0);
    if (events.size() != 1 || events[0].detail.find("resumed from snapshot") == std::string::npos) {
        test_fail("resumed session should publish a started event naming the snapshot");
    }
    test_pass("resumed as " + resumed);

    expect_throw<NotFound>([&] { sup->resume_session(std::string(64, '0')); }, "resume from unknown snapshot");

    expect_throw<CaptureError>([&] { sup->capture_snapshot(GLOBAL_OWNER); }, "global capture without serializer");
    int generation = 0;
    sup->set_global_serializer([&generation]() {
        return SnapshotPayload{"application/json", "{\"generation\":" + std::to_string(++generation) + "}"};
    });
    std::string g1 = sup->capture_snapshot(GLOBAL_OWNER);
    std::string g2 = sup->capture_snapshot(GLOBAL_OWNER);
    if (sup->snapshots().chain(g2) != std::vector<std::string>{g2, g1}) {
        test_fail("global snapshots should chain");
    }
    if (kinds_text(sup->events_since(GLOBAL_OWNER, 0)) != "snapshot_captured,snapshot_captured") {
        test_fail("global captures should publish on the global stream");
    }
    test_pass("global chain of two");
    expect_throw<RestoreError>([&] { sup->resume_session(g1); }, "resume from a global snapshot");

    sup->set_global_serializer([]() -> SnapshotPayload { throw std::runtime_error("agent busy"); });
    expect_throw<CaptureError>([&] { sup->capture_snapshot(GLOBAL_OWNER); }, "failing serializer");
}

void test_subscribers(const fs::path& dir) {
    test_header("Subscribers and Waiters");

    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(manual_config(dir), control);

    std::mutex seen_mutex;
    std::vector<std::string> seen;
    size_t failing = sup->subscribe([](const Event&) {
        throw std::runtime_error("consumer crashed");
    });
    size_t token = sup->subscribe([&](const Event& ev) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(event_kind_label(ev.kind));
    });

    std::string id = sup->create_session(SessionKind::Browser);
    std::thread killer([&]() {
        std::this_thread::sleep_for(Millis(30));
        sup->teardown_session(id);
    });
    auto ev = sup->wait_for_event(id, 1, Millis(2000));
    killer.join();
    if (!ev || ev->kind != EventKind::Terminated) {
        test_fail("waiter should wake for the terminated event");
    }
    test_pass("wait_for_event woken by teardown");

    sup->events().drain();
    {
        std::lock_guard<std::mutex> lock(seen_mutex);
        if (seen != std::vector<std::string>{"started", "terminated"}) {
            test_fail("subscriber should see started then terminated");
        }
    }
    if (!sup->unsubscribe(token) || !sup->unsubscribe(failing)) {
        test_fail("unsubscribe should succeed");
    }
    test_pass("subscriber saw every event in order despite a failing one before it");
}

void test_auto_supervision(const fs::path& dir) {
    test_header("Automatic Supervision");

    SupervisorConfig cfg = manual_config(dir);
    cfg.auto_probe = true;
    cfg.failure_threshold = 2;
    auto control = std::make_shared<FakeControl>();
    auto sup = make_supervisor(cfg, control);

    std::string id = sup->create_session(SessionKind::Browser);
    if (!sup->monitor().is_watching(id)) {
        test_fail("new session should be watched");
    }
    sup->capture_snapshot(id);
    control->push(control->probe_outcomes, Outcome::Unresponsive, 2);

    uint64_t after = 0;
    bool recovered = false;
    auto deadline = std::chrono::steady_clock::now() + Millis(5000);
    while (!recovered && std::chrono::steady_clock::now() < deadline) {
        auto ev = sup->wait_for_event(id, after, Millis(500));
        if (!ev) continue;
        after = ev->event_id;
        recovered = ev->kind == EventKind::Recovered && ev->detail.find("restored") != std::string::npos;
    }
    if (!recovered) {
        test_fail("supervision task should recover the session, saw " + kinds_text(sup->events_since(id, 0)));
    }
    if (sup->recovery().sequences_started() != 1 || control->restores != 1) {
        test_fail("exactly one recovery sequence expected");
    }
    test_pass("degraded, lost and recovered by the supervision task");

    sup->teardown_session(id);
    if (sup->monitor().is_watching(id) || sup->monitor().task_count() != 0) {
        test_fail("teardown should end the supervision task");
    }
    int probes = control->probes;
    std::this_thread::sleep_for(Millis(80));
    if (control->probes != probes) {
        test_fail("no probes after teardown");
    }
    test_pass("supervision stops at teardown");
}

void test_config() {
    test_header("Configuration");

    setenv("MINDRUN_PROBE_INTERVAL_MS", "150", 1);
    setenv("MINDRUN_FAILURE_THRESHOLD", "5", 1);
    SupervisorConfig cfg = SupervisorConfig::from_env();
    unsetenv("MINDRUN_PROBE_INTERVAL_MS");
    unsetenv("MINDRUN_FAILURE_THRESHOLD");
    if (cfg.probe_interval != Millis(150) || cfg.failure_threshold != 5 || cfg.recovery_attempts != 3) {
        test_fail("environment should overlay the defaults");
    }
    test_pass("MINDRUN_* variables applied");

    setenv("MINDRUN_BACKOFF_MS", "soon", 1);
    expect_throw<std::runtime_error>([] { SupervisorConfig::from_env(); }, "malformed environment value");
    unsetenv("MINDRUN_BACKOFF_MS");

    auto rest = cfg.merge_with_cli({"--state-dir", "/tmp/mindrun_cli", "--threshold", "4",
                                    "--manual-probe", "sessions", "--all"});
    if (cfg.state_dir != "/tmp/mindrun_cli" || cfg.failure_threshold != 4 || cfg.auto_probe) {
        test_fail("command line options should override");
    }
    if (rest != std::vector<std::string>{"sessions", "--all"}) {
        test_fail("unrecognised arguments should be returned");
    }
    test_pass("command line merged");

    expect_throw<std::runtime_error>([&] { cfg.merge_with_cli({"--attempts"}); }, "option without value");

    SupervisorConfig bad;
    bad.failure_threshold = 0;
    expect_throw<std::runtime_error>([&] { bad.validate(); }, "zero threshold rejected");
    bad = SupervisorConfig();
    bad.backoff_max = Millis(1);
    expect_throw<std::runtime_error>([&] { Supervisor sup(bad); }, "backoff_max below initial rejected");
}

void test_deadline_and_backoff() {
    test_header("Deadlines and Backoff");

    int v = call_with_deadline<int>("quick", Millis(500), [] { return 7; });
    if (v != 7) {
        test_fail("call_with_deadline should return the value");
    }
    auto t0 = std::chrono::steady_clock::now();
    expect_throw<TimeoutExceeded>([] {
        call_with_deadline<void>("slow", Millis(20), [] { std::this_thread::sleep_for(Millis(200)); });
    }, "slow call times out");
    if (std::chrono::steady_clock::now() - t0 > Millis(150)) {
        test_fail("timeout should fire near the deadline, not after the call");
    }
    test_pass("deadline honoured");

    DriverRegistry drivers;
    EventNotifier events(fs::temp_directory_path() / "mindrun_unused_events");
    SessionRegistry registry(fs::temp_directory_path() / "mindrun_unused_sessions", drivers, events, Millis(100));
    SnapshotStore store(fs::temp_directory_path() / "mindrun_unused_snapshots");
    RecoveryCoordinator recovery(registry, store, RecoverySettings{4, Millis(100), Millis(350), Millis(100)});
    if (recovery.backoff_for(1) != Millis(100) || recovery.backoff_for(2) != Millis(200) ||
        recovery.backoff_for(3) != Millis(350) || recovery.backoff_for(9) != Millis(350)) {
        test_fail("backoff should double up to the cap");
    }
    test_pass("backoff 100, 200, 350, 350");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Supervisor Test Suite" << std::endl;
    std::cout << "=====================" << std::endl;
    set_quiet(true);

    TempStateDir tmp("supervisor");
    try {
        test_transient_blips(tmp.path / "blips");
        test_lost_and_recovered(tmp.path / "lost");
        test_recovery_exhausted(tmp.path / "exhausted");
        test_late_restore_stopped(tmp.path / "late");
        test_recovery_cancelled(tmp.path / "cancelled");
        test_capture_probe_exclusive(tmp.path / "exclusive");
        test_teardown(tmp.path / "teardown");
        test_restart(tmp.path / "restart");
        test_snapshots_and_resume(tmp.path / "resume");
        test_subscribers(tmp.path / "subscribers");
        test_auto_supervision(tmp.path / "auto");
        test_config();
        test_deadline_and_backoff();

        std::cout << "\nAll tests PASSED!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n[ERROR] Exception: " << e.what() << std::endl;
        return 1;
    }
}
