#include "MindRun.h"

namespace fs = std::filesystem;

namespace MindRun {

EventNotifier::EventNotifier(fs::path events_dir)
    : dir_(std::move(events_dir)) {}

EventNotifier::~EventNotifier(){
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        stopping_ = true;
    }
    dispatch_cv_.notify_all();
    if(dispatcher_.joinable()){
        if(dispatcher_.get_id() == std::this_thread::get_id()) dispatcher_.detach();
        else dispatcher_.join();
    }
}

fs::path EventNotifier::log_path(const std::string& session_id) const {
    return dir_ / (session_id + ".log");
}

std::shared_ptr<EventNotifier::Stream> EventNotifier::stream_for(const std::string& session_id, bool create) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(session_id);
    if(it != streams_.end()) return it->second;
    if(!create) return nullptr;
    auto stream = std::make_shared<Stream>();
    streams_[session_id] = stream;
    return stream;
}

void EventNotifier::load(bool read_only){
    TRACE_FN("dir=", dir_.string());
    if(!read_only) ensure_dir_exists(dir_);
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.clear();
    }
    size_t count = read_logs(false);
    TRACE_MSG("loaded ", count, " events");
}

size_t EventNotifier::poll_logs(){
    return read_logs(true);
}

size_t EventNotifier::read_logs(bool notify){
    std::error_code ec;
    if(!fs::is_directory(dir_, ec)) return 0;

    std::vector<Event> added;
    for(const auto& entry : fs::directory_iterator(dir_, ec)){
        if(!entry.is_regular_file() || entry.path().extension() != ".log") continue;
        std::string session_id = entry.path().stem().string();

        std::ifstream in(entry.path());
        if(!in){
            log_warning("EventNotifier", "cannot read " + entry.path().string());
            continue;
        }

        auto stream = stream_for(session_id, true);
        std::lock_guard<std::mutex> lock(stream->mutex);
        uint64_t last = stream->events.empty() ? 0 : stream->events.back().event_id;
        std::string line;
        size_t line_no = 0;
        while(std::getline(in, line)){
            ++line_no;
            if(trim_copy(line).empty()) continue;
            auto ev = Event::from_json(line);
            if(!ev){
                // An unterminated last line is a write cut short (or still in
                // progress in another process).
                if(in.eof()){
                    stream->torn_tail = true;
                    continue;
                }
                log_warning("EventNotifier", entry.path().filename().string() + ":" +
                            std::to_string(line_no) + ": malformed event line skipped");
                continue;
            }
            stream->torn_tail = false;
            if(ev->event_id <= last) continue;
            last = ev->event_id;
            if(!ev->key.empty()) stream->keys[ev->key] = ev->event_id;
            stream->events.push_back(*ev);
            added.push_back(*ev);
        }
    }

    if(notify && !added.empty()){
        notify_waiters();
        publish(added);
    }
    return added.size();
}

Event EventNotifier::emit(const std::string& session_id, EventKind kind,
                          const std::string& detail, const std::string& dedup_key){
    TRACE_FN("session=", session_id, " kind=", event_kind_label(kind), " key=", dedup_key);
    auto stream = stream_for(session_id, true);
    Event ev;
    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        if(!dedup_key.empty()){
            auto it = stream->keys.find(dedup_key);
            if(it != stream->keys.end()){
                uint64_t existing = it->second;
                auto found = std::find_if(stream->events.rbegin(), stream->events.rend(),
                    [existing](const Event& e){ return e.event_id == existing; });
                if(found != stream->events.rend()){
                    TRACE_MSG("duplicate key ", dedup_key, " -> event ", existing);
                    return *found;
                }
            }
        }

        ev.event_id = stream->events.empty() ? 1 : stream->events.back().event_id + 1;
        ev.session_id = session_id;
        ev.kind = kind;
        ev.occurred_at = Clock::now();
        ev.detail = detail;
        ev.key = dedup_key;

        ensure_dir_exists(dir_);
        std::ofstream out(log_path(session_id), std::ios::app);
        if(stream->torn_tail) out << '\n';
        out << ev.to_json() << '\n';
        out.flush();
        if(!out){
            // Nothing is recorded or published, so the id is reused by the next
            // emit. A partial line may be on disk; start the next one fresh.
            stream->torn_tail = true;
            throw PersistError("failed to append event " + std::to_string(ev.event_id) +
                               " to " + log_path(session_id).string());
        }
        stream->torn_tail = false;

        stream->events.push_back(ev);
        if(!dedup_key.empty()) stream->keys[dedup_key] = ev.event_id;
    }

    notify_waiters();
    publish({ev});
    return ev;
}

void EventNotifier::notify_waiters() const {
    { std::lock_guard<std::mutex> lock(wait_mutex_); }
    wait_cv_.notify_all();
}

void EventNotifier::publish(const std::vector<Event>& events){
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        if(subscribers_.empty()) return;
    }
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        if(stopping_) return;
        pending_.insert(pending_.end(), events.begin(), events.end());
        if(!dispatcher_.joinable()){
            dispatcher_ = std::thread(&EventNotifier::dispatch_loop, this);
        }
    }
    dispatch_cv_.notify_all();
}

void EventNotifier::dispatch_loop(){
    std::unique_lock<std::mutex> lock(dispatch_mutex_);
    while(true){
        dispatch_cv_.wait(lock, [this]{ return stopping_ || !pending_.empty(); });
        if(pending_.empty()) break;
        Event ev = pending_.front();
        pending_.pop_front();
        delivering_ = true;
        lock.unlock();

        std::vector<EventCallback> callbacks;
        {
            std::lock_guard<std::mutex> subs_lock(subscribers_mutex_);
            for(const auto& [token, cb] : subscribers_) callbacks.push_back(cb);
        }
        for(const auto& cb : callbacks){
            try{
                cb(ev);
            } catch(const std::exception& e){
                log_warning("EventNotifier", std::string("subscriber failed on ") + ev.session_id +
                            " #" + std::to_string(ev.event_id) + ": " + e.what());
            }
        }

        lock.lock();
        delivering_ = false;
        dispatch_cv_.notify_all();
    }
}

void EventNotifier::drain(){
    std::unique_lock<std::mutex> lock(dispatch_mutex_);
    dispatch_cv_.wait(lock, [this]{ return (pending_.empty() && !delivering_) || stopping_; });
}

std::vector<Event> EventNotifier::events_since(const std::string& session_id, uint64_t after_event_id) const {
    auto stream = stream_for(session_id, false);
    if(!stream) return {};
    std::lock_guard<std::mutex> lock(stream->mutex);
    std::vector<Event> out;
    for(const auto& ev : stream->events){
        if(ev.event_id > after_event_id) out.push_back(ev);
    }
    return out;
}

std::optional<Event> EventNotifier::wait_for(const std::string& session_id, uint64_t after_event_id, Millis timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while(true){
        auto pending = events_since(session_id, after_event_id);
        if(!pending.empty()) return pending.front();
        if(wait_cv_.wait_until(lock, deadline) == std::cv_status::timeout){
            pending = events_since(session_id, after_event_id);
            if(!pending.empty()) return pending.front();
            return std::nullopt;
        }
    }
}

std::vector<Event> EventNotifier::recent(size_t n) const {
    std::vector<std::shared_ptr<Stream>> all;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for(const auto& [id, stream] : streams_) all.push_back(stream);
    }
    std::vector<Event> merged;
    for(const auto& stream : all){
        std::lock_guard<std::mutex> lock(stream->mutex);
        merged.insert(merged.end(), stream->events.begin(), stream->events.end());
    }
    std::stable_sort(merged.begin(), merged.end(), [](const Event& a, const Event& b){
        if(a.occurred_at != b.occurred_at) return a.occurred_at < b.occurred_at;
        if(a.session_id != b.session_id) return a.session_id < b.session_id;
        return a.event_id < b.event_id;
    });
    if(merged.size() > n) merged.erase(merged.begin(), merged.end() - static_cast<std::ptrdiff_t>(n));
    return merged;
}

uint64_t EventNotifier::last_event_id(const std::string& session_id) const {
    auto stream = stream_for(session_id, false);
    if(!stream) return 0;
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->events.empty() ? 0 : stream->events.back().event_id;
}

size_t EventNotifier::subscribe(EventCallback callback){
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    size_t token = next_token_++;
    subscribers_[token] = std::move(callback);
    return token;
}

bool EventNotifier::unsubscribe(size_t token){
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.erase(token) > 0;
}

std::string format_event(const Event& ev){
    std::ostringstream oss;
    oss << format_timestamp(ev.occurred_at) << " " << ev.session_id
        << " #" << ev.event_id << " " << event_kind_label(ev.kind);
    if(!ev.detail.empty()) oss << ": " << ev.detail;
    return oss.str();
}

std::string format_feed(const std::vector<Event>& events){
    if(events.empty()) return "(no events)\n";
    std::ostringstream oss;
    for(const auto& ev : events) oss << format_event(ev) << "\n";
    return oss.str();
}

} // namespace MindRun
