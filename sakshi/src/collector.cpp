#include <sakshi/collector.hpp>
#include <sakshi/log.hpp>
#include <chrono>
#include <exception>
#include <future>

namespace sakshi {

Collector::Collector(CollectorConfig config,
                     StreamSource& stream,
                     VectorSource& vectors,
                     SnapshotStore& store)
    : config_(std::move(config))
    , stream_(stream)
    , vectors_(vectors)
    , store_(store)
    , started_at_(now())
{
    for (const auto& name : known_actors()) {
        stream_side_.actors[name] = ActorStatus{};
    }
}

Collector::~Collector() {
    stop();
}

void Collector::set_clock(Clock clock) {
    clock_ = std::move(clock);
    started_at_ = clock_();
    last_timestamp_ = 0;
}

Collector::Stats Collector::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void Collector::mark(const char* source, bool ok, bool& stale, uint64_t& failures,
                     const std::string& error) {
    if (ok) {
        if (stale) log_info("collector", "%s store recovered", source);
        stale = false;
        return;
    }
    ++failures;
    if (!stale) log_warn("collector", "%s store unavailable: %s", source, error.c_str());
    stale = true;
}

void Collector::merge_stream(const StreamReading& reading, Timestamp tick_time) {
    StreamSide side;
    side.session_thoughts = reading.length;

    // Newest well-formed record carries the current emotional primitives
    bool have_primitives = false;
    std::set<std::string> malformed;
    uint64_t newly_malformed = 0;
    for (size_t i = 0; i < reading.entries.size(); ++i) {
        const auto& entry = reading.entries[i];
        auto thought = parse_thought(entry, tick_time);
        if (!thought) {
            // Records without an id are told apart by position
            std::string key = entry.id.empty() ? "#" + std::to_string(i) : entry.id;
            if (malformed.insert(key).second && !malformed_seen_.count(key)) {
                ++newly_malformed;
                log_debug("collector", "dropped malformed thought '%s'", key.c_str());
            }
            continue;
        }
        if (!have_primitives) {
            side.valence = thought->valence;
            side.arousal = thought->arousal;
            have_primitives = true;
        }
        if (side.recent.size() < RECENT_THOUGHTS) {
            side.recent.push_back(std::move(thought->summary));
        }
    }

    for (const auto& name : known_actors()) {
        side.actors[name] = ActorStatus{};
    }
    for (const auto& [name, status] : reading.actors) {
        side.actors[sanitize_utf8(name)] = parse_actor_status(status);
    }

    stream_side_ = std::move(side);
    malformed_seen_ = std::move(malformed);
    if (newly_malformed > 0) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.malformed_thoughts += newly_malformed;
    }
}

Collector::VectorReading Collector::fetch_vectors() {
    // Counts run beside the identity read; each request has its own timeout
    auto conscious = std::async(std::launch::async, [this] {
        return vectors_.count(config_.memory_collection);
    });
    auto unconscious = std::async(std::launch::async, [this] {
        return vectors_.count(config_.unconscious_collection);
    });

    VectorReading reading;
    reading.identity = vectors_.identity(config_.identity_collection);
    reading.conscious = conscious.get();
    reading.unconscious = unconscious.get();
    return reading;
}

bool Collector::merge_vectors(const VectorReading& reading) {
    // All or nothing, so counts and identity always come from one read
    if (!reading.identity || !reading.conscious || !reading.unconscious) return false;

    vector_side_.identity = *reading.identity;
    vector_side_.conscious = *reading.conscious;
    vector_side_.unconscious = *reading.unconscious;
    return true;
}

Snapshot Collector::build(Timestamp timestamp) const {
    Snapshot s;
    s.timestamp = timestamp;

    s.identity.name = config_.name;
    Timestamp up = timestamp - started_at_;
    s.identity.uptime_seconds = up > 0 ? static_cast<uint64_t>(up / 1000) : 0;
    s.identity.lifetime_thoughts = vector_side_.identity.lifetime_thoughts;
    s.identity.session_thoughts = stream_side_.session_thoughts;
    s.identity.restart_count = vector_side_.identity.restart_count;

    s.cognitive.conscious_memories = vector_side_.conscious;
    s.cognitive.unconscious_memories = vector_side_.unconscious;
    s.cognitive.lifetime_dreams = vector_side_.identity.lifetime_dreams;
    s.cognitive.current_cycle = stream_side_.session_thoughts;

    // Derived fields follow whatever primitives we hold, fresh or stale
    s.emotional = EmotionalState::derive(stream_side_.valence, stream_side_.arousal, 0.5f);

    s.actors = stream_side_.actors;
    s.recent_thoughts = stream_side_.recent;
    return s;
}

SnapshotStore::Ptr Collector::tick() {
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + std::chrono::milliseconds(config_.source_timeout_ms);
    Timestamp tick_time = clock_();

    // Both sources run at once under one deadline. A read still running
    // from an earlier tick is waited on again, never duplicated.
    if (!stream_pending_.valid()) {
        stream_pending_ = std::async(std::launch::async, [this] {
            return stream_.read(config_.stream_key, config_.actors_key, RECENT_THOUGHTS);
        });
    }
    if (!vector_pending_.valid()) {
        vector_pending_ = std::async(std::launch::async, [this] {
            return fetch_vectors();
        });
    }

    bool stream_ok = false;
    std::string stream_error;
    if (stream_pending_.wait_until(deadline) == std::future_status::ready) {
        try {
            auto reading = stream_pending_.get();
            if (reading) {
                merge_stream(*reading, tick_time);
                stream_ok = true;
            } else {
                stream_error = stream_.last_error();
            }
        } catch (const std::exception& e) {
            stream_error = e.what();
        }
    } else {
        stream_error = "no reply within " + std::to_string(config_.source_timeout_ms) + "ms";
    }

    bool vector_ok = false;
    std::string vector_error;
    if (vector_pending_.wait_until(deadline) == std::future_status::ready) {
        try {
            vector_ok = merge_vectors(vector_pending_.get());
            if (!vector_ok) vector_error = vectors_.last_error();
        } catch (const std::exception& e) {
            vector_error = e.what();
        }
    } else {
        vector_error = "no reply within " + std::to_string(config_.source_timeout_ms) + "ms";
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.ticks++;
        mark("stream", stream_ok, stats_.stream_stale, stats_.stream_failures, stream_error);
        mark("vector", vector_ok, stats_.vector_stale, stats_.vector_failures, vector_error);
    }

    // Never step backwards, even if the wall clock does
    Timestamp timestamp = std::max(tick_time, last_timestamp_);
    last_timestamp_ = timestamp;

    SnapshotStore::Ptr published = store_.publish(build(timestamp));
    if (callback_) callback_(published);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started).count();
    log_debug("collector", "tick %s%s in %.1fms",
              stream_ok ? "" : "[stream stale]",
              vector_ok ? "" : "[vector stale]",
              elapsed / 1000.0);
    return published;
}

void Collector::start() {
    if (running_.exchange(true)) return;  // Already running

    thread_ = std::thread([this]() {
        run_loop();
    });
    log_info("collector", "started (tick %lldms)",
             static_cast<long long>(config_.tick_interval_ms));
}

void Collector::stop() {
    if (!running_.exchange(false)) return;  // Not running

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    log_info("collector", "stopped");
}

void Collector::run_loop() {
    auto interval = std::chrono::milliseconds(config_.tick_interval_ms);
    auto next = std::chrono::steady_clock::now();

    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            log_error("collector", "tick failed: %s", e.what());
        }

        // Fixed rate; a late tick does not try to catch up
        next += interval;
        auto current = std::chrono::steady_clock::now();
        if (next < current) next = current;

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_until(lock, next, [this] { return !running_; });
    }
}

} // namespace sakshi
