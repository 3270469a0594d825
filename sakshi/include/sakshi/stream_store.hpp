#pragma once
// Stream store: read-only client for the append-only thought stream
//
// The observed process appends every thought to a stream and keeps its
// actors' status in a hash. One read issues XLEN, XREVRANGE and
// HGETALL; any failure makes the whole read unavailable and the caller
// keeps its previous state. Text leaving this layer is valid UTF-8.

#include <sakshi/config.hpp>
#include <sakshi/snapshot.hpp>
#include <sakshi/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace sakshi {

struct StreamEntry {
    std::string id;  // <ms>-<seq>
    std::unordered_map<std::string, std::string> fields;
};

struct StreamReading {
    uint64_t length = 0;                 // total entries in the stream
    std::vector<StreamEntry> entries;    // newest first
    std::unordered_map<std::string, std::string> actors;  // name -> status JSON
};

// Abstract read side of the stream store
class StreamSource {
public:
    virtual ~StreamSource() = default;

    // nullopt = source unavailable (see last_error())
    virtual std::optional<StreamReading> read(const std::string& stream_key,
                                              const std::string& actors_key,
                                              size_t count) = 0;

    virtual std::string last_error() const = 0;
};

// Redis client (redis++ over hiredis). Connection and socket timeouts
// are the source timeout; a broken connection is re-established by the
// pool on the next read.
class RedisStreamStore : public StreamSource {
public:
    RedisStreamStore(Endpoint endpoint, int64_t timeout_ms);
    ~RedisStreamStore() override;

    std::optional<StreamReading> read(const std::string& stream_key,
                                      const std::string& actors_key,
                                      size_t count) override;

    std::string last_error() const override { return last_error_; }

private:
    Endpoint endpoint_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::string last_error_;
};

// One well-formed thought and the emotional primitives it carries
struct ParsedThought {
    ThoughtSummary summary;
    float valence = 0.0f;
    float arousal = 0.5f;
};

// Returns nullopt for a malformed record (no id, or no parsable salience).
// fallback_time is used when neither the id nor a timestamp field gives one.
std::optional<ParsedThought> parse_thought(const StreamEntry& entry, Timestamp fallback_time);

// Content preview: the Symbol id of {"Symbol":{"id":..}} content, else
// the first PREVIEW_CHARS characters (UTF-8 aware) of the raw text
std::string content_preview(const std::string& content);

// Replaces every invalid UTF-8 sequence with U+FFFD
std::string sanitize_utf8(const std::string& text);

// Status record of one actor: {"alive":bool,"restart_count":int};
// anything unparsable reads as not alive
ActorStatus parse_actor_status(const std::string& json);

} // namespace sakshi
