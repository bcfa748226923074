#pragma once

namespace MindRun {

using EventCallback = std::function<void(const Event&)>;

// Per-session append-only event streams, mirrored to events/<id>.log as
// JSON lines. Each committed fact is published at most once: a repeated
// dedup key returns the event already recorded for it.
class EventNotifier {
public:
    explicit EventNotifier(std::filesystem::path events_dir);
    ~EventNotifier();

    // Rebuilds the in-memory streams from the log directory. read_only
    // skips creating the directory.
    void load(bool read_only = false);

    // Picks up lines appended to the logs by another process. Waiters and
    // subscribers see the new events. Returns how many were added.
    size_t poll_logs();

    // Appends, then publishes. Throws PersistError when the append fails;
    // the event is then neither recorded nor published.
    Event emit(const std::string& session_id, EventKind kind,
               const std::string& detail, const std::string& dedup_key);

    // Events with event_id > after_event_id, oldest first.
    std::vector<Event> events_since(const std::string& session_id, uint64_t after_event_id) const;

    // Blocks until an event newer than after_event_id exists or the timeout
    // passes.
    std::optional<Event> wait_for(const std::string& session_id, uint64_t after_event_id, Millis timeout) const;

    // Last n events across every stream ordered by occurrence.
    std::vector<Event> recent(size_t n) const;

    uint64_t last_event_id(const std::string& session_id) const;

    // Callbacks run in emission order on the notifier's dispatch thread,
    // never under a session or notifier lock.
    size_t subscribe(EventCallback callback);
    bool unsubscribe(size_t token);
    // Blocks until every event emitted so far has been delivered.
    void drain();

    const std::filesystem::path& directory() const { return dir_; }

private:
    struct Stream {
        mutable std::mutex mutex;
        std::vector<Event> events;
        std::map<std::string, uint64_t> keys;
        bool torn_tail = false;
    };

    std::shared_ptr<Stream> stream_for(const std::string& session_id, bool create) const;
    std::filesystem::path log_path(const std::string& session_id) const;
    size_t read_logs(bool notify);
    void notify_waiters() const;
    void publish(const std::vector<Event>& events);
    void dispatch_loop();

    std::filesystem::path dir_;

    mutable std::mutex streams_mutex_;
    mutable std::map<std::string, std::shared_ptr<Stream>> streams_;

    mutable std::mutex wait_mutex_;
    mutable std::condition_variable wait_cv_;

    mutable std::mutex subscribers_mutex_;
    std::map<size_t, EventCallback> subscribers_;
    size_t next_token_ = 1;

    std::mutex dispatch_mutex_;
    std::condition_variable dispatch_cv_;
    std::deque<Event> pending_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::thread dispatcher_;
};

// "2026-10-18T09:14:02.120Z sess-000001 #3 lost: 3 consecutive failures"
std::string format_event(const Event& ev);
std::string format_feed(const std::vector<Event>& events);

} // namespace MindRun
