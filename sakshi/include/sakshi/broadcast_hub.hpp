#pragma once
// BroadcastHub: fan-out of published snapshots to live observers
//
// Each session owns a bounded outbound queue and its own send thread.
// Enqueueing never blocks on the network: when the queue is full the
// oldest pending snapshot is replaced by the newer one, so a slow
// observer sees fewer snapshots but never stale backlog, and never
// holds up anyone else. A failed write removes only that session.

#include <sakshi/snapshot_store.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sakshi {

using SessionId = uint64_t;

// Transport of one observer (a WebSocket in production)
class SessionWriter {
public:
    virtual ~SessionWriter() = default;

    // Delivers one payload within timeout_ms; false on failure or timeout
    virtual bool write(const std::string& payload, int64_t timeout_ms) = 0;

    // Closes the transport; a write blocked in another thread must return
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

struct HubConfig {
    size_t queue_depth = 1;
    int64_t write_timeout_ms = 150;
};

class Session {
public:
    using FailureHandler = std::function<void(SessionId)>;

    Session(SessionId id, std::unique_ptr<SessionWriter> writer, const HubConfig& config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionId id() const { return id_; }
    const std::string& description() const { return description_; }

    // Replace-pending enqueue. Ignores a snapshot older than (or the
    // same as) what is already pending or sent. Never blocks on I/O.
    bool enqueue(const SnapshotStore::Ptr& snapshot);

    void start(FailureHandler on_failure);
    void close();
    void join();

    bool alive() const { return alive_; }
    bool finished() const { return finished_; }

    size_t pending() const;
    uint64_t sent() const { return sent_; }
    uint64_t replaced() const { return replaced_; }
    Timestamp last_sent_timestamp() const { return last_sent_timestamp_; }

private:
    void send_loop();

    SessionId id_;
    std::unique_ptr<SessionWriter> writer_;
    std::string description_;
    size_t depth_;
    int64_t write_timeout_ms_;
    FailureHandler on_failure_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<SnapshotStore::Ptr> queue_;
    SnapshotStore::Ptr last_sent_;
    bool closed_ = false;

    std::atomic<bool> alive_{true};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> replaced_{0};
    std::atomic<Timestamp> last_sent_timestamp_{0};

    std::thread thread_;
};

class BroadcastHub {
public:
    BroadcastHub(HubConfig config, SnapshotStore& store);
    ~BroadcastHub();

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    // Adds a session and queues the current snapshot for it at once.
    // Returns 0 (and closes the writer) once the hub is stopped.
    SessionId register_session(std::unique_ptr<SessionWriter> writer);

    // Idempotent; unknown ids are ignored
    void unregister(SessionId id);

    // Queues the snapshot to every live session
    void on_tick(const SnapshotStore::Ptr& snapshot);

    size_t session_count() const;

    struct SessionInfo {
        SessionId id = 0;
        std::string description;
        size_t pending = 0;
        uint64_t sent = 0;
        uint64_t replaced = 0;
        Timestamp last_sent_timestamp = 0;
    };

    std::vector<SessionInfo> sessions() const;

    struct Stats {
        uint64_t registered = 0;
        uint64_t unregistered = 0;
        uint64_t write_failures = 0;
        uint64_t ticks = 0;
    };

    Stats stats() const;

    // Closes every session and joins all send threads
    void stop();

private:
    void remove(SessionId id, bool failed);
    void reap();

    HubConfig config_;
    SnapshotStore& store_;

    mutable std::mutex mutex_;   // sessions_, retired_, stats_; never held across I/O
    std::map<SessionId, std::shared_ptr<Session>> sessions_;
    std::vector<std::shared_ptr<Session>> retired_;
    SessionId next_id_ = 1;
    bool stopped_ = false;
    Stats stats_;
};

} // namespace sakshi
