// sakshi: observation daemon
//
// Usage: sakshi [--verbose] [--version] [--help]
//
// All settings come from the environment (REDIS_URL, QDRANT_URL, PORT,
// SAKSHI_WS_PORT, SAKSHI_*); see --help.

#include <sakshi/sakshi.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace sakshi;

static std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int) {
    daemon_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "sakshi " << version::software() << " - observation daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --verbose          Enable debug logging\n"
              << "  -v, --version      Show version\n"
              << "  -h, --help         Show this help\n\n"
              << "Environment:\n"
              << "  REDIS_URL                      Stream store (redis://127.0.0.1:6379)\n"
              << "  QDRANT_URL                     Vector store (http://127.0.0.1:6333)\n"
              << "  PORT                           HTTP port (3000)\n"
              << "  SAKSHI_WS_PORT                 /ws push channel port (3001)\n"
              << "  SAKSHI_BIND                    Listen address (127.0.0.1)\n"
              << "  SAKSHI_TICK_MS                 Snapshot tick (200)\n"
              << "  SAKSHI_REFRESH_MS              Point cloud refresh (2000)\n"
              << "  SAKSHI_SAMPLE_COUNT            Embeddings per refresh (500)\n"
              << "  SAKSHI_SOURCE_TIMEOUT_MS       Per-source read timeout (150)\n"
              << "  SAKSHI_WRITE_TIMEOUT_MS        Per-session write timeout (150)\n"
              << "  SAKSHI_QUEUE_DEPTH             Per-session queue depth (1)\n"
              << "  SAKSHI_EMBED_DIM               Embedding dimension (384)\n"
              << "  SAKSHI_PROJECTION              random | pca (random)\n"
              << "  SAKSHI_SEED                    Random basis seed (42)\n"
              << "  SAKSHI_LOG                     error | warn | info | debug (info)\n"
              << "  SAKSHI_NAME                    Identity name (Timmy)\n"
              << "  SAKSHI_STREAM_KEY              Thought stream key\n"
              << "  SAKSHI_ACTORS_KEY              Actor status hash key\n"
              << "  SAKSHI_MEMORY_COLLECTION       Conscious memories (memories)\n"
              << "  SAKSHI_UNCONSCIOUS_COLLECTION  Unconscious memories (unconscious)\n"
              << "  SAKSHI_IDENTITY_COLLECTION     Identity record (identity)\n"
              << "  SAKSHI_ANCHOR_COLLECTION       Law anchor embeddings (anchors)\n";
}

int run_daemon(const Config& config) {
    SnapshotStore store;

    RedisStreamStore stream(config.redis, config.source_timeout_ms);
    QdrantVectorStore collector_vectors(config.qdrant, config.source_timeout_ms);
    QdrantVectorStore projection_vectors(config.qdrant, config.source_timeout_ms);

    CollectorConfig collector_config;
    collector_config.tick_interval_ms = config.tick_interval_ms;
    collector_config.source_timeout_ms = config.source_timeout_ms;
    collector_config.name = config.name;
    collector_config.stream_key = config.stream_key;
    collector_config.actors_key = config.actors_key;
    collector_config.memory_collection = config.memory_collection;
    collector_config.unconscious_collection = config.unconscious_collection;
    collector_config.identity_collection = config.identity_collection;

    ProjectionConfig projection_config;
    projection_config.refresh_interval_ms = config.refresh_interval_ms;
    projection_config.sample_count = config.sample_count;
    projection_config.embed_dim = config.embed_dim;
    projection_config.kind = config.projection;
    projection_config.seed = config.seed;
    projection_config.memory_collection = config.memory_collection;
    projection_config.anchor_collection = config.anchor_collection;

    HubConfig hub_config;
    hub_config.queue_depth = config.queue_depth;
    hub_config.write_timeout_ms = config.write_timeout_ms;

    GatewayConfig gateway_config;
    gateway_config.bind_address = config.bind_address;
    gateway_config.port = config.port;
    gateway_config.ws_port = config.ws_port;
    gateway_config.write_timeout_ms = config.write_timeout_ms;

    BroadcastHub hub(hub_config, store);
    Collector collector(collector_config, stream, collector_vectors, store);
    ProjectionEngine projection(projection_config, projection_vectors);
    Gateway gateway(gateway_config, store, projection, hub);

    // The hub pushes on the collector's cadence
    collector.on_publish([&hub](const SnapshotStore::Ptr& snapshot) {
        hub.on_tick(snapshot);
    });

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);

    projection.start();
    collector.start();
    if (!gateway.start()) {
        collector.stop();
        projection.stop();
        hub.stop();
        return 1;
    }

    log_info("daemon", "started (pid=%d)", static_cast<int>(getpid()));

    auto status_interval = std::chrono::seconds(10);
    auto last_status = std::chrono::steady_clock::now();
    while (daemon_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now_time = std::chrono::steady_clock::now();
        if (now_time - last_status < status_interval) continue;
        last_status = now_time;

        auto cs = collector.stats();
        auto ps = projection.stats();
        log_debug("status",
                  "ticks=%llu sessions=%zu connections=%zu stream=%s vector=%s "
                  "malformed=%llu dropped=%llu",
                  static_cast<unsigned long long>(cs.ticks),
                  hub.session_count(), gateway.connection_count(),
                  cs.stream_stale ? "stale" : "fresh",
                  cs.vector_stale ? "stale" : "fresh",
                  static_cast<unsigned long long>(cs.malformed_thoughts),
                  static_cast<unsigned long long>(ps.dropped_samples));
    }

    log_info("daemon", "shutting down");
    gateway.stop();
    projection.stop();
    collector.stop();
    hub.stop();

    auto cs = collector.stats();
    log_info("daemon", "stopped (ticks=%llu, stream failures=%llu, vector failures=%llu)",
             static_cast<unsigned long long>(cs.ticks),
             static_cast<unsigned long long>(cs.stream_failures),
             static_cast<unsigned long long>(cs.vector_failures));
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "sakshi " << version::software() << "\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Config config;
    try {
        config = Config::from_env();
    } catch (const ConfigError& e) {
        log_error("config", "%s", e.what());
        return 1;
    }

    if (verbose_mode) config.log_level = LogLevel::Debug;
    set_log_level(config.log_level);
    log_info("config", "%s", config.summary().c_str());

    try {
        return run_daemon(config);
    } catch (const ConfigError& e) {
        log_error("config", "%s", e.what());
        return 1;
    }
}
