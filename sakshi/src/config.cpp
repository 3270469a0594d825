#include <sakshi/config.hpp>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace sakshi {

namespace {

int64_t parse_int(const char* name, const std::string& value) {
    if (value.empty()) {
        throw ConfigError(std::string(name) + " is empty");
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw ConfigError(std::string(name) + " is not an integer: '" + value + "'");
    }
    return static_cast<int64_t>(v);
}

uint64_t parse_uint(const char* name, const std::string& value) {
    int64_t v = parse_int(name, value);
    if (v < 0) {
        throw ConfigError(std::string(name) + " must not be negative");
    }
    return static_cast<uint64_t>(v);
}

uint16_t parse_port(const std::string& what, const std::string& value) {
    int64_t v = parse_int(what.c_str(), value);
    if (v < 1 || v > 65535) {
        throw ConfigError(what + " port out of range: " + value);
    }
    return static_cast<uint16_t>(v);
}

Endpoint parse_url(const std::string& url, const std::string& scheme, uint16_t default_port) {
    std::string prefix = scheme + "://";
    if (url.compare(0, prefix.size(), prefix) != 0) {
        throw ConfigError("expected " + prefix + " URL, got '" + url + "'");
    }
    std::string rest = url.substr(prefix.size());

    // Drop path (redis db index, trailing slash)
    size_t slash = rest.find('/');
    if (slash != std::string::npos) rest.erase(slash);

    // Drop userinfo
    size_t at = rest.rfind('@');
    if (at != std::string::npos) rest.erase(0, at + 1);

    Endpoint ep;
    ep.port = default_port;
    size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        ep.host = rest.substr(0, colon);
        ep.port = parse_port(url, rest.substr(colon + 1));
    } else {
        ep.host = rest;
    }
    if (ep.host.empty()) {
        throw ConfigError("missing host in '" + url + "'");
    }
    return ep;
}

}  // anonymous namespace

const char* projection_kind_name(ProjectionKind kind) {
    switch (kind) {
        case ProjectionKind::Random: return "random";
        case ProjectionKind::Pca: return "pca";
    }
    return "random";
}

Endpoint parse_redis_url(const std::string& url) {
    return parse_url(url, "redis", 6379);
}

Endpoint parse_http_url(const std::string& url) {
    return parse_url(url, "http", 80);
}

Config Config::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

Config Config::from_lookup(const Lookup& lookup) {
    Config c;
    auto get = [&lookup](const char* name, std::string& out) {
        const char* v = lookup(name);
        if (!v) return false;
        out = v;
        return true;
    };

    std::string v;
    if (get("REDIS_URL", v)) c.redis = parse_redis_url(v);
    if (get("QDRANT_URL", v)) c.qdrant = parse_http_url(v);
    if (get("PORT", v)) c.port = parse_port("PORT", v);
    if (get("SAKSHI_WS_PORT", v)) c.ws_port = parse_port("SAKSHI_WS_PORT", v);
    if (get("SAKSHI_BIND", v)) c.bind_address = v;

    if (get("SAKSHI_TICK_MS", v)) c.tick_interval_ms = parse_int("SAKSHI_TICK_MS", v);
    if (get("SAKSHI_REFRESH_MS", v)) c.refresh_interval_ms = parse_int("SAKSHI_REFRESH_MS", v);
    if (get("SAKSHI_SOURCE_TIMEOUT_MS", v)) {
        c.source_timeout_ms = parse_int("SAKSHI_SOURCE_TIMEOUT_MS", v);
    }
    if (get("SAKSHI_WRITE_TIMEOUT_MS", v)) {
        c.write_timeout_ms = parse_int("SAKSHI_WRITE_TIMEOUT_MS", v);
    }
    if (get("SAKSHI_SAMPLE_COUNT", v)) c.sample_count = parse_uint("SAKSHI_SAMPLE_COUNT", v);
    if (get("SAKSHI_QUEUE_DEPTH", v)) c.queue_depth = parse_uint("SAKSHI_QUEUE_DEPTH", v);
    if (get("SAKSHI_EMBED_DIM", v)) c.embed_dim = parse_uint("SAKSHI_EMBED_DIM", v);
    if (get("SAKSHI_SEED", v)) c.seed = parse_uint("SAKSHI_SEED", v);

    if (get("SAKSHI_PROJECTION", v)) {
        if (v == "random") c.projection = ProjectionKind::Random;
        else if (v == "pca") c.projection = ProjectionKind::Pca;
        else throw ConfigError("SAKSHI_PROJECTION must be 'random' or 'pca', got '" + v + "'");
    }
    if (get("SAKSHI_LOG", v)) {
        auto level = parse_log_level(v);
        if (!level) throw ConfigError("SAKSHI_LOG: unknown level '" + v + "'");
        c.log_level = *level;
    }

    if (get("SAKSHI_NAME", v)) c.name = v;
    if (get("SAKSHI_STREAM_KEY", v)) c.stream_key = v;
    if (get("SAKSHI_ACTORS_KEY", v)) c.actors_key = v;
    if (get("SAKSHI_MEMORY_COLLECTION", v)) c.memory_collection = v;
    if (get("SAKSHI_UNCONSCIOUS_COLLECTION", v)) c.unconscious_collection = v;
    if (get("SAKSHI_IDENTITY_COLLECTION", v)) c.identity_collection = v;
    if (get("SAKSHI_ANCHOR_COLLECTION", v)) c.anchor_collection = v;

    c.validate();
    return c;
}

void Config::validate() const {
    in_addr addr{};
    if (inet_pton(AF_INET, bind_address.c_str(), &addr) != 1) {
        throw ConfigError("SAKSHI_BIND is not an IPv4 address: '" + bind_address + "'");
    }
    if (ws_port == port) {
        throw ConfigError("SAKSHI_WS_PORT must differ from PORT");
    }
    if (tick_interval_ms < 10) {
        throw ConfigError("SAKSHI_TICK_MS must be at least 10");
    }
    if (refresh_interval_ms < tick_interval_ms) {
        throw ConfigError("SAKSHI_REFRESH_MS must not be shorter than SAKSHI_TICK_MS");
    }
    if (source_timeout_ms < 1 || source_timeout_ms >= tick_interval_ms) {
        throw ConfigError("SAKSHI_SOURCE_TIMEOUT_MS must be positive and below the tick interval");
    }
    if (write_timeout_ms < 1 || write_timeout_ms >= tick_interval_ms) {
        throw ConfigError("SAKSHI_WRITE_TIMEOUT_MS must be positive and below the tick interval");
    }
    if (sample_count < 1 || sample_count > 10000) {
        throw ConfigError("SAKSHI_SAMPLE_COUNT must be within 1..10000");
    }
    if (queue_depth < 1 || queue_depth > 4) {
        throw ConfigError("SAKSHI_QUEUE_DEPTH must be within 1..4");
    }
    if (embed_dim < 3) {
        throw ConfigError("SAKSHI_EMBED_DIM must be at least 3");
    }
    if (stream_key.empty() || memory_collection.empty() || identity_collection.empty()) {
        throw ConfigError("store keys and collection names must not be empty");
    }
}

std::string Config::summary() const {
    std::ostringstream ss;
    ss << "listen=" << bind_address << ":" << port
       << " ws=" << ws_port
       << " redis=" << redis.host << ":" << redis.port
       << " qdrant=" << qdrant.host << ":" << qdrant.port
       << " tick=" << tick_interval_ms << "ms"
       << " refresh=" << refresh_interval_ms << "ms"
       << " k=" << sample_count
       << " dim=" << embed_dim
       << " projection=" << projection_kind_name(projection)
       << " queue_depth=" << queue_depth
       << " log=" << log_level_name(log_level);
    return ss.str();
}

} // namespace sakshi
