#pragma once
// Collector: the snapshot heartbeat
//
// Every tick reads the stream store and the vector store concurrently,
// under one deadline shorter than the tick, and publishes one new
// Snapshot. A source that fails or misses the deadline keeps its fields
// from the previous tick and is marked stale; the tick itself always
// happens.

#include <sakshi/snapshot.hpp>
#include <sakshi/snapshot_store.hpp>
#include <sakshi/stream_store.hpp>
#include <sakshi/types.hpp>
#include <sakshi/vector_store.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sakshi {

struct CollectorConfig {
    int64_t tick_interval_ms = 200;
    int64_t source_timeout_ms = 150;   // shared by both sources, below the tick
    std::string name = "Timmy";
    std::string stream_key = "daneel:stream:awake";
    std::string actors_key = "daneel:actors";
    std::string memory_collection = "memories";
    std::string unconscious_collection = "unconscious";
    std::string identity_collection = "identity";
};

// Called once per tick, after publish, on the collector thread
using PublishCallback = std::function<void(const SnapshotStore::Ptr&)>;

class Collector {
public:
    Collector(CollectorConfig config,
              StreamSource& stream,
              VectorSource& vectors,
              SnapshotStore& store);
    ~Collector();

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    void on_publish(PublishCallback callback) { callback_ = std::move(callback); }

    // Replaces the wall clock and restarts the uptime origin
    void set_clock(Clock clock);

    // One synchronous tick: read, merge, publish, notify
    SnapshotStore::Ptr tick();

    // Fixed-rate loop on its own thread
    void start();
    void stop();
    bool is_running() const { return running_; }

    struct Stats {
        uint64_t ticks = 0;
        uint64_t stream_failures = 0;
        uint64_t vector_failures = 0;
        uint64_t malformed_thoughts = 0;
        bool stream_stale = false;
        bool vector_stale = false;
    };

    Stats stats() const;

private:
    // Last-known-good primitives of each source
    struct StreamSide {
        uint64_t session_thoughts = 0;
        std::vector<ThoughtSummary> recent;
        float valence = 0.0f;
        float arousal = 0.5f;
        ActorMap actors;
    };

    struct VectorSide {
        IdentityRecord identity;
        uint64_t conscious = 0;
        uint64_t unconscious = 0;
    };

    struct VectorReading {
        std::optional<IdentityRecord> identity;
        std::optional<uint64_t> conscious;
        std::optional<uint64_t> unconscious;
    };

    void merge_stream(const StreamReading& reading, Timestamp tick_time);
    VectorReading fetch_vectors();
    bool merge_vectors(const VectorReading& reading);
    void mark(const char* source, bool ok, bool& stale, uint64_t& failures,
              const std::string& error);
    Snapshot build(Timestamp timestamp) const;
    void run_loop();

    CollectorConfig config_;
    StreamSource& stream_;
    VectorSource& vectors_;
    SnapshotStore& store_;
    PublishCallback callback_;

    Clock clock_ = now;
    Timestamp started_at_ = 0;
    Timestamp last_timestamp_ = 0;

    StreamSide stream_side_;
    VectorSide vector_side_;
    std::set<std::string> malformed_seen_;

    // Reads in flight; a read that misses its tick is picked up by the next
    std::future<std::optional<StreamReading>> stream_pending_;
    std::future<VectorReading> vector_pending_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace sakshi
