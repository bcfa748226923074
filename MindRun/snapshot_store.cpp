#include "MindRun.h"

namespace fs = std::filesystem;

namespace MindRun {

std::string snapshot_identity(const std::string& owner, const std::string& encoding,
                              const std::optional<std::string>& parent, const std::string& payload_hash){
    std::ostringstream oss;
    oss << "owner:" << owner << "\n"
        << "encoding:" << encoding << "\n"
        << "parent:" << (parent ? *parent : std::string("-")) << "\n"
        << "payload:" << payload_hash << "\n";
    return oss.str();
}

std::string render_manifest(const Snapshot& snap, const std::vector<std::string>& chain){
    std::ostringstream oss;
    oss << "SNAPSHOT_V1\n";
    oss << "snapshot_id: " << snap.snapshot_id << "\n";
    oss << "session_id: " << snap.session_id << "\n";
    oss << "captured_at: " << format_timestamp(snap.captured_at) << "\n";
    oss << "encoding: " << json_escape(snap.encoding) << "\n";
    oss << "size: " << snap.size << "\n";
    oss << "payload_hash: " << snap.payload_hash << "\n";
    oss << "parent: " << (snap.parent_snapshot_id ? *snap.parent_snapshot_id : std::string("-")) << "\n";
    oss << "chain:\n";
    for(const auto& id : chain) oss << "  " << id << "\n";
    return oss.str();
}

std::optional<Snapshot> parse_manifest(const std::string& text){
    std::istringstream in(text);
    std::string line;
    if(!std::getline(in, line) || trim_copy(line) != "SNAPSHOT_V1") return std::nullopt;

    Snapshot snap;
    bool have_captured = false;
    while(std::getline(in, line)){
        if(line.empty() || line[0] == ' ') continue;  // chain entries
        size_t colon = line.find(':');
        if(colon == std::string::npos) return std::nullopt;
        std::string key = trim_copy(line.substr(0, colon));
        std::string value = trim_copy(line.substr(colon + 1));

        if(key == "snapshot_id") snap.snapshot_id = value;
        else if(key == "session_id") snap.session_id = value;
        else if(key == "captured_at"){
            auto tp = parse_timestamp(value);
            if(!tp) return std::nullopt;
            snap.captured_at = *tp;
            have_captured = true;
        }
        else if(key == "encoding") snap.encoding = json_unescape(value);
        else if(key == "size"){
            try{
                snap.size = std::stoull(value);
            } catch(const std::exception&){
                return std::nullopt;
            }
        }
        else if(key == "payload_hash") snap.payload_hash = value;
        else if(key == "parent"){
            if(value != "-") snap.parent_snapshot_id = value;
        }
    }
    if(snap.snapshot_id.empty() || snap.session_id.empty() || snap.payload_hash.empty() || !have_captured){
        return std::nullopt;
    }
    return snap;
}

SnapshotStore::SnapshotStore(fs::path root)
    : dir_(std::move(root)) {}

fs::path SnapshotStore::snapshot_dir(const std::string& snapshot_id) const {
    return dir_ / snapshot_id;
}

void SnapshotStore::load(bool read_only){
    TRACE_FN("dir=", dir_.string());
    if(!read_only) ensure_dir_exists(dir_);

    std::map<std::string, Snapshot> arena;
    std::error_code ec;
    for(const auto& entry : fs::directory_iterator(dir_, ec)){
        if(!entry.is_directory()) continue;
        fs::path manifest = entry.path() / "manifest";
        if(!fs::exists(manifest)) continue;
        std::optional<Snapshot> snap;
        try{
            snap = parse_manifest(read_file(manifest));
        } catch(const PersistError& e){
            log_warning("SnapshotStore", e.what());
            continue;
        }
        if(!snap || snap->snapshot_id != entry.path().filename().string()){
            log_warning("SnapshotStore", "skipping unreadable manifest " + manifest.string());
            continue;
        }
        arena[snap->snapshot_id] = *snap;
    }

    for(const auto& [id, snap] : arena){
        if(snap.parent_snapshot_id && !arena.count(*snap.parent_snapshot_id)){
            log_warning("SnapshotStore", "snapshot " + id + " refers to missing parent " + *snap.parent_snapshot_id);
        }
    }

    std::map<std::string, std::string> heads;
    fs::path heads_path = dir_ / "HEADS";
    if(fs::exists(heads_path, ec)){
        std::istringstream in(read_file(heads_path));
        std::string owner, id;
        while(in >> owner >> id){
            if(arena.count(id)) heads[owner] = id;
        }
    }
    // Owners missing from HEADS fall back to their newest snapshot.
    std::map<std::string, std::string> newest;
    for(const auto& [id, snap] : arena){
        auto it = newest.find(snap.session_id);
        if(it == newest.end() || arena.at(it->second).captured_at < snap.captured_at){
            newest[snap.session_id] = id;
        }
    }
    for(const auto& [owner, id] : newest) heads.emplace(owner, id);

    std::lock_guard<std::mutex> lock(arena_mutex_);
    arena_.swap(arena);
    heads_.swap(heads);
    TRACE_MSG("loaded ", arena_.size(), " snapshots");
}

Snapshot SnapshotStore::put(const std::string& owner, const SnapshotPayload& payload,
                            const std::optional<std::string>& parent){
    if(payload.encoding.empty()){
        throw CaptureError("snapshot payload from " + owner + " declares no encoding");
    }
    std::string payload_hash = compute_string_hash(payload.bytes);
    std::string id = compute_string_hash(snapshot_identity(owner, payload.encoding, parent, payload_hash));
    TRACE_FN("owner=", owner, " id=", id, " size=", payload.bytes.size());

    Snapshot snap;
    std::vector<std::string> chain;
    {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        auto existing = arena_.find(id);
        if(existing != arena_.end()){
            TRACE_MSG("snapshot ", id, " already stored");
            return existing->second;
        }
        if(parent && !arena_.count(*parent)){
            throw NotFound("parent snapshot " + *parent + " is not in the store");
        }
        snap.snapshot_id = id;
        snap.session_id = owner;
        snap.captured_at = Clock::now();
        snap.encoding = payload.encoding;
        snap.payload_hash = payload_hash;
        snap.size = payload.bytes.size();
        snap.parent_snapshot_id = parent;
        chain.push_back(id);
        if(parent){
            auto ancestors = chain_locked(*parent);
            chain.insert(chain.end(), ancestors.begin(), ancestors.end());
        }
    }

    // Payload first: a manifest only ever names bytes that are already on disk.
    fs::path dir = snapshot_dir(id);
    write_file_atomic(dir / "payload", payload.bytes);
    write_file_atomic(dir / "manifest", render_manifest(snap, chain));

    std::lock_guard<std::mutex> lock(arena_mutex_);
    auto [it, inserted] = arena_.emplace(id, snap);
    heads_[owner] = id;
    write_heads_locked();
    if(inserted){
        log_notice("SnapshotStore", "stored " + id.substr(0, 16) + " for " + owner + " (" +
                   std::to_string(snap.size) + " bytes, chain depth " + std::to_string(chain.size()) + ")");
    }
    return it->second;
}

void SnapshotStore::write_heads_locked() const {
    std::ostringstream oss;
    for(const auto& [owner, id] : heads_) oss << owner << " " << id << "\n";
    write_file_atomic(dir_ / "HEADS", oss.str());
}

std::string SnapshotStore::capture(SessionRegistry& registry, EventNotifier& events,
                                   const std::string& owner, Millis timeout){
    TRACE_FN("owner=", owner);
    Snapshot snap;

    if(owner == GLOBAL_OWNER){
        std::lock_guard<std::mutex> lock(global_mutex_);
        if(!global_serializer_){
            throw CaptureError("no global state serializer registered");
        }
        GlobalSerializer serializer = global_serializer_;
        SnapshotPayload payload;
        try{
            payload = call_with_deadline<SnapshotPayload>("global serializer", timeout, serializer);
        } catch(const MindRunError&){
            throw;
        } catch(const std::exception& e){
            throw CaptureError(std::string("global serializer: ") + e.what());
        } catch(...){
            throw CaptureError("global serializer: non-standard exception");
        }
        snap = put(GLOBAL_OWNER, payload, head(GLOBAL_OWNER));
        events.emit(GLOBAL_OWNER, EventKind::SnapshotCaptured, "snapshot " + snap.snapshot_id,
                    "s:" + snap.snapshot_id);
        return snap.snapshot_id;
    }

    auto slot = registry.slot(owner);
    std::lock_guard<std::mutex> lock(slot->mutex);
    SessionState state = slot->session.state;
    if(!slot->handle || (state != SessionState::Running && state != SessionState::Degraded)){
        throw CaptureError("session " + owner + " is " + state_label(state) + "; no live environment to capture");
    }

    SnapshotPayload payload = guarded_capture(registry.driver_for(*slot), *slot->handle, timeout);

    std::optional<std::string> parent = slot->session.last_snapshot_ref;
    if(parent && !contains(*parent)){
        log_warning("SnapshotStore", "previous snapshot " + *parent + " of " + owner +
                    " is not in the store; starting a new chain");
        parent.reset();
    }
    snap = put(owner, payload, parent);
    registry.set_snapshot_ref(*slot, snap.snapshot_id);
    events.emit(owner, EventKind::SnapshotCaptured, "snapshot " + snap.snapshot_id, "s:" + snap.snapshot_id);
    return snap.snapshot_id;
}

void SnapshotStore::set_global_serializer(GlobalSerializer serializer){
    std::lock_guard<std::mutex> lock(global_mutex_);
    global_serializer_ = std::move(serializer);
}

SnapshotPayload SnapshotStore::restore(const std::string& snapshot_id) const {
    TRACE_FN("id=", snapshot_id);
    Snapshot snap = get(snapshot_id);

    fs::path path = snapshot_dir(snapshot_id) / "payload";
    std::string bytes;
    try{
        bytes = read_file(path);
    } catch(const PersistError&){
        throw RestoreError("payload of snapshot " + snapshot_id + " is missing");
    }
    if(compute_string_hash(bytes) != snap.payload_hash){
        throw RestoreError("payload of snapshot " + snapshot_id + " fails its integrity check");
    }
    return SnapshotPayload{snap.encoding, bytes};
}

Snapshot SnapshotStore::get(const std::string& snapshot_id) const {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    auto it = arena_.find(snapshot_id);
    if(it == arena_.end()) throw NotFound("unknown snapshot " + snapshot_id);
    return it->second;
}

bool SnapshotStore::contains(const std::string& snapshot_id) const {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    return arena_.count(snapshot_id) > 0;
}

std::vector<std::string> SnapshotStore::chain(const std::string& snapshot_id) const {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    if(!arena_.count(snapshot_id)) throw NotFound("unknown snapshot " + snapshot_id);
    return chain_locked(snapshot_id);
}

std::vector<std::string> SnapshotStore::chain_locked(const std::string& snapshot_id) const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    std::optional<std::string> cur = snapshot_id;
    while(cur && !seen.count(*cur)){
        auto it = arena_.find(*cur);
        if(it == arena_.end()) break;
        out.push_back(*cur);
        seen.insert(*cur);
        cur = it->second.parent_snapshot_id;
    }
    return out;
}

std::vector<Snapshot> SnapshotStore::list(const std::string& owner) const {
    std::vector<Snapshot> out;
    {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        for(const auto& [id, snap] : arena_){
            if(snap.session_id == owner) out.push_back(snap);
        }
    }
    std::sort(out.begin(), out.end(), [](const Snapshot& a, const Snapshot& b){
        if(a.captured_at != b.captured_at) return a.captured_at < b.captured_at;
        return a.snapshot_id < b.snapshot_id;
    });
    return out;
}

std::optional<std::string> SnapshotStore::head(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    auto it = heads_.find(owner);
    if(it == heads_.end()) return std::nullopt;
    return it->second;
}

size_t SnapshotStore::size() const {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    return arena_.size();
}

} // namespace MindRun
