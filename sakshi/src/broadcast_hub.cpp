#include <sakshi/broadcast_hub.hpp>
#include <sakshi/log.hpp>

namespace sakshi {

// ═══════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════

Session::Session(SessionId id, std::unique_ptr<SessionWriter> writer, const HubConfig& config)
    : id_(id)
    , writer_(std::move(writer))
    , description_(writer_->describe())
    , depth_(config.queue_depth > 0 ? config.queue_depth : 1)
    , write_timeout_ms_(config.write_timeout_ms)
{}

Session::~Session() {
    close();
    join();
}

bool Session::enqueue(const SnapshotStore::Ptr& snapshot) {
    if (!snapshot) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;

        // Per-session order is non-decreasing in snapshot time
        const SnapshotStore::Ptr& newest = queue_.empty() ? last_sent_ : queue_.back();
        if (newest) {
            if (newest == snapshot) return false;
            if (snapshot->snapshot.timestamp < newest->snapshot.timestamp) return false;
        }

        if (queue_.size() >= depth_) {
            queue_.pop_front();
            replaced_++;
        }
        queue_.push_back(snapshot);
    }
    ready_.notify_one();
    return true;
}

size_t Session::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Session::start(FailureHandler on_failure) {
    on_failure_ = std::move(on_failure);
    thread_ = std::thread([this]() {
        send_loop();
    });
}

void Session::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        queue_.clear();
    }
    ready_.notify_all();
    writer_->close();
}

void Session::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void Session::send_loop() {
    while (true) {
        SnapshotStore::Ptr next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (closed_) break;
            next = std::move(queue_.front());
            queue_.pop_front();
            last_sent_ = next;
        }

        if (!writer_->write(next->json, write_timeout_ms_)) {
            alive_ = false;
            bool was_closed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                was_closed = closed_;
            }
            // A write cut short by close() is not the session's failure
            if (!was_closed && on_failure_) on_failure_(id_);
            break;
        }
        sent_++;
        last_sent_timestamp_ = next->snapshot.timestamp;
    }
    alive_ = false;
    finished_ = true;
}

// ═══════════════════════════════════════════════════════════════════
// Hub
// ═══════════════════════════════════════════════════════════════════

BroadcastHub::BroadcastHub(HubConfig config, SnapshotStore& store)
    : config_(config), store_(store) {}

BroadcastHub::~BroadcastHub() {
    stop();
}

SessionId BroadcastHub::register_session(std::unique_ptr<SessionWriter> writer) {
    reap();

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            writer->close();
            return 0;
        }
        session = std::make_shared<Session>(next_id_++, std::move(writer), config_);
        sessions_[session->id()] = session;
        stats_.registered++;
    }

    // Out-of-band: a new observer never waits for the next tick
    session->enqueue(store_.current());
    session->start([this](SessionId id) { remove(id, true); });

    log_info("hub", "session %llu registered (%s)",
             static_cast<unsigned long long>(session->id()), session->description().c_str());
    return session->id();
}

void BroadcastHub::unregister(SessionId id) {
    remove(id, false);
}

void BroadcastHub::remove(SessionId id, bool failed) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
        retired_.push_back(session);
        if (failed) stats_.write_failures++;
        else stats_.unregistered++;
    }

    session->close();
    if (failed) {
        log_info("hub", "session %llu removed after write failure (%s)",
                 static_cast<unsigned long long>(id), session->description().c_str());
    } else {
        log_info("hub", "session %llu disconnected", static_cast<unsigned long long>(id));
    }
}

void BroadcastHub::reap() {
    std::vector<std::shared_ptr<Session>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = retired_.begin();
        while (it != retired_.end()) {
            if ((*it)->finished()) {
                done.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : done) s->join();
}

void BroadcastHub::on_tick(const SnapshotStore::Ptr& snapshot) {
    reap();

    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.ticks++;
        live.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) live.push_back(session);
    }
    for (const auto& session : live) {
        session->enqueue(snapshot);
    }
}

size_t BroadcastHub::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<BroadcastHub::SessionInfo> BroadcastHub::sessions() const {
    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) live.push_back(session);
    }

    std::vector<SessionInfo> out;
    out.reserve(live.size());
    for (const auto& s : live) {
        SessionInfo info;
        info.id = s->id();
        info.description = s->description();
        info.pending = s->pending();
        info.sent = s->sent();
        info.replaced = s->replaced();
        info.last_sent_timestamp = s->last_sent_timestamp();
        out.push_back(std::move(info));
    }
    return out;
}

BroadcastHub::Stats BroadcastHub::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void BroadcastHub::stop() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ && sessions_.empty() && retired_.empty()) return;
        stopped_ = true;
        for (auto& [id, session] : sessions_) all.push_back(std::move(session));
        sessions_.clear();
        for (auto& session : retired_) all.push_back(std::move(session));
        retired_.clear();
    }

    for (auto& s : all) s->close();
    for (auto& s : all) s->join();
    if (!all.empty()) {
        log_info("hub", "closed %zu sessions", all.size());
    }
}

} // namespace sakshi
