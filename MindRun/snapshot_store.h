#pragma once

namespace MindRun {

using GlobalSerializer = std::function<SnapshotPayload()>;

// Content-addressed, append-only snapshot arena.
//
// Layout under the store directory:
//   <snapshot_id>/payload    raw payload bytes
//   <snapshot_id>/manifest   SNAPSHOT_V1 key: value metadata + chain
//   HEADS                    "<owner> <snapshot_id>" per line
//
// A snapshot id is the BLAKE3 of (owner, encoding, parent, payload hash), so
// writing the same content on the same lineage twice is a no-op. Parents are
// always stored before their children; chains never cycle.
class SnapshotStore {
public:
    explicit SnapshotStore(std::filesystem::path root);

    // read_only skips creating the arena directory.
    void load(bool read_only = false);

    // Persists a payload as the child of `parent`. Throws NotFound for an
    // unknown parent and PersistError when the arena cannot be written.
    Snapshot put(const std::string& owner, const SnapshotPayload& payload,
                 const std::optional<std::string>& parent);

    // Captures a running session (under its exclusive section) or, for the
    // "global" owner, the registered global serializer. Links the new
    // snapshot to the previous one and emits snapshot_captured.
    std::string capture(SessionRegistry& registry, EventNotifier& events,
                        const std::string& owner, Millis timeout);

    void set_global_serializer(GlobalSerializer serializer);

    // Pure read: NotFound for an unknown id, RestoreError when the payload
    // is missing or fails its integrity check.
    SnapshotPayload restore(const std::string& snapshot_id) const;

    Snapshot get(const std::string& snapshot_id) const;
    bool contains(const std::string& snapshot_id) const;
    // snapshot_id first, then each ancestor back to the root.
    std::vector<std::string> chain(const std::string& snapshot_id) const;
    // Snapshots of one owner, oldest first.
    std::vector<Snapshot> list(const std::string& owner) const;
    std::optional<std::string> head(const std::string& owner) const;
    size_t size() const;

    std::filesystem::path snapshot_dir(const std::string& snapshot_id) const;

private:
    std::vector<std::string> chain_locked(const std::string& snapshot_id) const;
    void write_heads_locked() const;

    std::filesystem::path dir_;

    mutable std::mutex arena_mutex_;
    std::map<std::string, Snapshot> arena_;
    std::map<std::string, std::string> heads_;

    std::mutex global_mutex_;
    GlobalSerializer global_serializer_;
};

std::string snapshot_identity(const std::string& owner, const std::string& encoding,
                              const std::optional<std::string>& parent, const std::string& payload_hash);
std::string render_manifest(const Snapshot& snap, const std::vector<std::string>& chain);
std::optional<Snapshot> parse_manifest(const std::string& text);

} // namespace MindRun
