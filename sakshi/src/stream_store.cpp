#include <sakshi/stream_store.hpp>
#include <sakshi/log.hpp>
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iterator>

namespace sakshi {

using json = nlohmann::json;

namespace {

// XREVRANGE item: id and its field/value pairs (nil for a trimmed entry)
using Attrs = std::vector<std::pair<std::string, std::string>>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;

std::optional<int64_t> parse_millis(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str()) return std::nullopt;
    if (*end != '\0' && *end != '-') return std::nullopt;
    return static_cast<int64_t>(v);
}

float number_or(const json& obj, const char* key, float fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<float>();
}

}  // anonymous namespace

RedisStreamStore::RedisStreamStore(Endpoint endpoint, int64_t timeout_ms)
    : endpoint_(std::move(endpoint))
{
    sw::redis::ConnectionOptions opts;
    opts.host = endpoint_.host;
    opts.port = endpoint_.port;
    opts.connect_timeout = std::chrono::milliseconds(timeout_ms);
    opts.socket_timeout = std::chrono::milliseconds(timeout_ms);

    // Reads are serialized by the Collector
    sw::redis::ConnectionPoolOptions pool;
    pool.size = 1;
    pool.wait_timeout = std::chrono::milliseconds(timeout_ms);

    redis_ = std::make_unique<sw::redis::Redis>(opts, pool);
}

RedisStreamStore::~RedisStreamStore() = default;

std::optional<StreamReading> RedisStreamStore::read(const std::string& stream_key,
                                                    const std::string& actors_key,
                                                    size_t count) {
    StreamReading reading;
    std::vector<Item> items;
    Attrs actors;
    try {
        long long length = redis_->xlen(stream_key);
        reading.length = length > 0 ? static_cast<uint64_t>(length) : 0;
        redis_->xrevrange(stream_key, "+", "-", static_cast<long long>(count),
                          std::back_inserter(items));
        redis_->hgetall(actors_key, std::back_inserter(actors));
    } catch (const sw::redis::ReplyError& e) {
        // Server answered; the connection is still usable
        last_error_ = std::string("stream store error: ") + e.what();
        return std::nullopt;
    } catch (const sw::redis::Error& e) {
        last_error_ = e.what();
        log_debug("stream", "%s:%u: %s", endpoint_.host.c_str(), endpoint_.port, e.what());
        return std::nullopt;
    }

    reading.entries.reserve(items.size());
    for (auto& [id, fields] : items) {
        // A nil field list stays in place so the caller counts it as malformed
        StreamEntry entry;
        entry.id = sanitize_utf8(id);
        if (fields) {
            for (auto& [key, value] : *fields) {
                entry.fields[key] = std::move(value);
            }
        }
        reading.entries.push_back(std::move(entry));
    }

    for (auto& [name, status] : actors) {
        reading.actors[sanitize_utf8(name)] = std::move(status);
    }
    return reading;
}

std::string sanitize_utf8(const std::string& text) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    static const uint32_t MIN_CODE_POINT[] = {0, 0, 0x80, 0x800, 0x10000};

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }

        bool ok = len > 0 && i + len <= text.size();
        for (size_t k = 1; ok && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, past U+10FFFF
        if (ok && (cp < MIN_CODE_POINT[len] || cp > 0x10FFFF ||
                   (cp >= 0xD800 && cp <= 0xDFFF))) {
            ok = false;
        }

        if (ok) {
            out.append(text, i, len);
            i += len;
        } else {
            out += REPLACEMENT;
            ++i;
        }
    }
    return out;
}

std::string content_preview(const std::string& content) {
    // Content is JSON: {"Symbol":{"id":"thought_123","data":[...]}}
    json parsed = json::parse(content, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto symbol = parsed.find("Symbol");
        if (symbol != parsed.end() && symbol->is_object()) {
            auto id = symbol->find("id");
            if (id != symbol->end() && id->is_string()) {
                return id->get<std::string>();
            }
        }
    }

    // First PREVIEW_CHARS code points of the repaired text
    std::string text = sanitize_utf8(content);
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size() && chars < PREVIEW_CHARS) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        i += len;
        ++chars;
    }
    text.resize(i);
    return text;
}

std::optional<ParsedThought> parse_thought(const StreamEntry& entry, Timestamp fallback_time) {
    if (entry.id.empty()) return std::nullopt;

    auto sal = entry.fields.find("salience");
    if (sal == entry.fields.end()) return std::nullopt;

    // Salience is a bare number or
    // {"importance":0.65,"novelty":0.71,"valence":0.038,"arousal":0.69,...}
    json s = json::parse(sal->second, nullptr, false);
    if (s.is_discarded()) return std::nullopt;

    ParsedThought t;
    if (s.is_number()) {
        t.summary.salience = s.get<float>();
    } else if (s.is_object()) {
        t.summary.salience = number_or(s, "importance", 0.5f);
        t.valence = number_or(s, "valence", 0.0f);
        t.arousal = number_or(s, "arousal", 0.5f);
    } else {
        return std::nullopt;
    }
    t.summary.salience = clamp_unit(t.summary.salience);
    t.valence = clamp_signed(t.valence);
    t.arousal = clamp_unit(t.arousal);

    t.summary.id = sanitize_utf8(entry.id);

    auto content = entry.fields.find("content");
    if (content != entry.fields.end()) {
        t.summary.content_preview = content_preview(content->second);
    }

    if (auto ms = parse_millis(entry.id)) {
        t.summary.timestamp = *ms;
    } else {
        auto ts = entry.fields.find("timestamp");
        std::optional<int64_t> field_ms;
        if (ts != entry.fields.end()) field_ms = parse_millis(ts->second);
        t.summary.timestamp = field_ms ? *field_ms : fallback_time;
    }

    return t;
}

ActorStatus parse_actor_status(const std::string& text) {
    ActorStatus status;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return status;

    auto alive = j.find("alive");
    if (alive != j.end() && alive->is_boolean()) {
        status.alive = alive->get<bool>();
    }
    auto restarts = j.find("restart_count");
    if (restarts != j.end() && restarts->is_number_unsigned()) {
        status.restart_count = restarts->get<uint32_t>();
    }
    return status;
}

} // namespace sakshi
