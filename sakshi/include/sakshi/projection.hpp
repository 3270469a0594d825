#pragma once
// Projection: embeddings down to a stable 3-D point cloud
//
// A Projector maps a D-dimensional vector to three coordinates through
// a basis that never changes once ready. The ProjectionEngine samples
// the memory collection on its own cadence, projects every sample and
// the four law anchors through the same basis, and swaps in a new
// PointCloud. Anchors are resolved once per basis and cached.

#include <sakshi/config.hpp>
#include <sakshi/latest.hpp>
#include <sakshi/types.hpp>
#include <sakshi/vector_store.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sakshi {

using Embedding = std::vector<float>;

// ═══════════════════════════════════════════════════════════════════
// Projectors
// ═══════════════════════════════════════════════════════════════════

class Projector {
public:
    virtual ~Projector() = default;

    virtual size_t dimension() const = 0;

    // False until the basis exists; project() is only valid when ready
    virtual bool ready() const = 0;

    // Offers a batch of valid samples; a no-op once ready
    virtual void prepare(const std::vector<Embedding>& samples) = 0;

    virtual Point3 project(const Embedding& v) const = 0;

    virtual const char* name() const = 0;
};

// Seeded Gaussian basis with unit-length columns
class RandomProjector : public Projector {
public:
    RandomProjector(size_t dim, uint64_t seed);

    size_t dimension() const override { return dim_; }
    bool ready() const override { return true; }
    void prepare(const std::vector<Embedding>&) override {}
    Point3 project(const Embedding& v) const override;
    const char* name() const override { return "random"; }

private:
    size_t dim_;
    std::array<Embedding, 3> basis_;
};

// Top-3 principal axes of the first batch of at least MIN_SAMPLES
class PcaProjector : public Projector {
public:
    static constexpr size_t MIN_SAMPLES = 3;
    static constexpr int ITERATIONS = 64;

    explicit PcaProjector(size_t dim);

    size_t dimension() const override { return dim_; }
    bool ready() const override { return ready_; }
    void prepare(const std::vector<Embedding>& samples) override;
    Point3 project(const Embedding& v) const override;
    const char* name() const override { return "pca"; }

    const Embedding& mean() const { return mean_; }
    const std::array<Embedding, 3>& axes() const { return axes_; }

private:
    size_t dim_;
    bool ready_ = false;
    Embedding mean_;
    std::array<Embedding, 3> axes_;
};

// Throws ConfigError when dim < 3
std::unique_ptr<Projector> make_projector(ProjectionKind kind, size_t dim, uint64_t seed);

// ═══════════════════════════════════════════════════════════════════
// Point cloud
// ═══════════════════════════════════════════════════════════════════

struct AnchorPoint {
    std::string label;
    int law = 0;
    Point3 position;
};

struct VectorPoint {
    std::string id;
    Point3 position;
    float salience = 0.5f;
    double age_seconds = 0.0;
};

struct PointCloud {
    std::vector<VectorPoint> points;
    std::vector<AnchorPoint> anchors;
    Timestamp generated_at = 0;
    std::string projection_type;
    uint64_t dropped = 0;   // samples rejected in this refresh
};

void to_json(nlohmann::json& j, const AnchorPoint& a);
void to_json(nlohmann::json& j, const VectorPoint& p);
void to_json(nlohmann::json& j, const PointCloud& c);

// The four law concepts in law order
struct LawAnchor {
    const char* label;
    Point3 canonical;
};
const std::array<LawAnchor, 4>& law_anchors();

// ═══════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════

struct ProjectionConfig {
    int64_t refresh_interval_ms = 2000;
    size_t sample_count = 500;
    size_t embed_dim = EMBED_DIM;
    ProjectionKind kind = ProjectionKind::Random;
    uint64_t seed = 42;
    std::string memory_collection = "memories";
    std::string anchor_collection = "anchors";
};

class ProjectionEngine {
public:
    using Ptr = std::shared_ptr<const PointCloud>;

    // Throws ConfigError for an invalid dimensionality
    ProjectionEngine(ProjectionConfig config, VectorSource& vectors);
    ~ProjectionEngine();

    ProjectionEngine(const ProjectionEngine&) = delete;
    ProjectionEngine& operator=(const ProjectionEngine&) = delete;

    void set_clock(Clock clock) { clock_ = std::move(clock); }

    // One synchronous refresh; false when the previous cloud was kept
    bool refresh();

    // nullptr before the first cloud
    Ptr current() const { return cloud_.load(); }

    // Discards basis, anchors and cloud
    void reset();

    void start();
    void stop();
    bool is_running() const { return running_; }

    struct Stats {
        uint64_t refreshes = 0;
        uint64_t failures = 0;
        uint64_t dropped_samples = 0;
        bool stale = false;
        bool anchors_resolved = false;
    };

    Stats stats() const;

private:
    enum class AnchorRead { Resolved, Unavailable };

    AnchorRead resolve_anchors();
    void run_loop();

    ProjectionConfig config_;
    VectorSource& vectors_;
    Clock clock_ = now;

    std::mutex refresh_mutex_;   // serializes refresh() and reset()
    std::unique_ptr<Projector> projector_;
    std::vector<AnchorPoint> anchors_;   // empty = unresolved
    Latest<PointCloud> cloud_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace sakshi
