#pragma once
// Config: everything the daemon needs, read once from the environment
//
// No hot reload. Any invalid value is a ConfigError at startup; nothing
// downstream re-validates.

#include <sakshi/log.hpp>
#include <sakshi/types.hpp>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace sakshi {

// Fatal at startup only
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

enum class ProjectionKind {
    Random,   // seeded Gaussian basis, ready immediately
    Pca       // top-3 principal axes of the first sample batch
};

const char* projection_kind_name(ProjectionKind kind);

// redis://host[:port][/db]  (db index ignored)
Endpoint parse_redis_url(const std::string& url);
// http://host[:port][/]
Endpoint parse_http_url(const std::string& url);

struct Config {
    Endpoint redis{"127.0.0.1", 6379};
    Endpoint qdrant{"127.0.0.1", 6333};
    std::string bind_address = "127.0.0.1";
    uint16_t port = 3000;      // HTTP endpoints
    uint16_t ws_port = 3001;   // /ws push channel

    int64_t tick_interval_ms = 200;
    int64_t refresh_interval_ms = 2000;
    int64_t source_timeout_ms = 150;
    int64_t write_timeout_ms = 150;
    size_t sample_count = 500;
    size_t queue_depth = 1;

    size_t embed_dim = EMBED_DIM;
    ProjectionKind projection = ProjectionKind::Random;
    uint64_t seed = 42;

    LogLevel log_level = LogLevel::Info;

    std::string name = "Timmy";
    std::string stream_key = "daneel:stream:awake";
    std::string actors_key = "daneel:actors";
    std::string memory_collection = "memories";
    std::string unconscious_collection = "unconscious";
    std::string identity_collection = "identity";
    std::string anchor_collection = "anchors";

    // Returns the value of a variable, or nullptr when unset
    using Lookup = std::function<const char*(const char*)>;

    static Config from_env();
    static Config from_lookup(const Lookup& lookup);

    // Throws ConfigError on the first violated constraint
    void validate() const;

    // One-line description for the startup log
    std::string summary() const;
};

} // namespace sakshi
