#include <sakshi/projection.hpp>
#include <sakshi/log.hpp>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>

namespace sakshi {

using json = nlohmann::json;

namespace {

float dot(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += double(a[i]) * double(b[i]);
    return static_cast<float>(sum);
}

// Normalizes in place; returns the norm before normalization
double normalize(Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += double(x) * double(x);
    double norm = std::sqrt(sum);
    if (norm > 0.0) {
        for (float& x : v) x = static_cast<float>(x / norm);
    }
    return norm;
}

// Removes the components along each of the first n axes
void orthogonalize(Embedding& v, const std::array<Embedding, 3>& axes, size_t n) {
    for (size_t k = 0; k < n; ++k) {
        float d = dot(v, axes[k]);
        for (size_t i = 0; i < v.size(); ++i) v[i] -= d * axes[k][i];
    }
}

bool finite(const Embedding& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

void check_dimension(size_t dim) {
    if (dim < 3) {
        throw ConfigError("projection needs at least 3 input dimensions, got " +
                          std::to_string(dim));
    }
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════════
// Projectors
// ═══════════════════════════════════════════════════════════════════

RandomProjector::RandomProjector(size_t dim, uint64_t seed) : dim_(dim) {
    check_dimension(dim);

    std::mt19937_64 rng(seed);
    std::normal_distribution<float> gauss(0.0f, 1.0f);
    for (auto& column : basis_) {
        column.resize(dim_);
        for (float& x : column) x = gauss(rng);
        normalize(column);
    }
}

Point3 RandomProjector::project(const Embedding& v) const {
    return Point3{dot(v, basis_[0]), dot(v, basis_[1]), dot(v, basis_[2])};
}

PcaProjector::PcaProjector(size_t dim) : dim_(dim) {
    check_dimension(dim);
}

void PcaProjector::prepare(const std::vector<Embedding>& samples) {
    if (ready_ || samples.size() < MIN_SAMPLES) return;

    const double n = static_cast<double>(samples.size());
    std::vector<double> mean(dim_, 0.0);
    for (const auto& s : samples) {
        for (size_t i = 0; i < dim_; ++i) mean[i] += s[i];
    }
    mean_.assign(dim_, 0.0f);
    for (size_t i = 0; i < dim_; ++i) mean_[i] = static_cast<float>(mean[i] / n);

    std::vector<Embedding> centered(samples.size(), Embedding(dim_));
    for (size_t r = 0; r < samples.size(); ++r) {
        for (size_t i = 0; i < dim_; ++i) centered[r][i] = samples[r][i] - mean_[i];
    }

    // Power iteration on C = X^T X / n without forming C; deflation by
    // re-orthogonalizing against the axes already found
    std::mt19937_64 rng(0x5a6b5348ULL);
    std::normal_distribution<float> gauss(0.0f, 1.0f);
    for (size_t k = 0; k < 3; ++k) {
        Embedding v(dim_);
        for (float& x : v) x = gauss(rng);
        orthogonalize(v, axes_, k);
        normalize(v);

        bool degenerate = false;
        for (int it = 0; it < ITERATIONS; ++it) {
            Embedding w(dim_, 0.0f);
            for (const auto& row : centered) {
                float d = dot(row, v);
                for (size_t i = 0; i < dim_; ++i) w[i] += d * row[i];
            }
            orthogonalize(w, axes_, k);
            if (normalize(w) < 1e-9) {
                degenerate = true;
                break;
            }
            v = std::move(w);
        }

        // Rank below 3: complete the basis with any orthogonal direction
        if (degenerate) {
            for (size_t j = 0; j < dim_; ++j) {
                Embedding e(dim_, 0.0f);
                e[j] = 1.0f;
                orthogonalize(e, axes_, k);
                if (normalize(e) > 1e-3) {
                    v = std::move(e);
                    break;
                }
            }
        }

        // Deterministic sign: largest component positive
        size_t largest = 0;
        for (size_t i = 1; i < dim_; ++i) {
            if (std::fabs(v[i]) > std::fabs(v[largest])) largest = i;
        }
        if (v[largest] < 0) {
            for (float& x : v) x = -x;
        }
        axes_[k] = std::move(v);
    }
    ready_ = true;
}

Point3 PcaProjector::project(const Embedding& v) const {
    Embedding c(dim_);
    for (size_t i = 0; i < dim_; ++i) c[i] = v[i] - mean_[i];
    return Point3{dot(c, axes_[0]), dot(c, axes_[1]), dot(c, axes_[2])};
}

std::unique_ptr<Projector> make_projector(ProjectionKind kind, size_t dim, uint64_t seed) {
    switch (kind) {
        case ProjectionKind::Pca:
            return std::make_unique<PcaProjector>(dim);
        case ProjectionKind::Random:
            break;
    }
    return std::make_unique<RandomProjector>(dim, seed);
}

// ═══════════════════════════════════════════════════════════════════
// Point cloud
// ═══════════════════════════════════════════════════════════════════

const std::array<LawAnchor, 4>& law_anchors() {
    static const std::array<LawAnchor, 4> anchors = {{
        {"Law 0: Humanity", {0.0f, 1.5f, 0.0f}},
        {"Law 1: No Harm", {1.4f, -0.5f, 0.0f}},
        {"Law 2: Obey", {-0.7f, -0.5f, 1.2f}},
        {"Law 3: Self", {-0.7f, -0.5f, -1.2f}},
    }};
    return anchors;
}

void to_json(json& j, const AnchorPoint& a) {
    j = json{
        {"label", a.label},
        {"law", a.law},
        {"x", a.position.x},
        {"y", a.position.y},
        {"z", a.position.z}
    };
}

void to_json(json& j, const VectorPoint& p) {
    j = json{
        {"id", p.id},
        {"x", p.position.x},
        {"y", p.position.y},
        {"z", p.position.z},
        {"salience", p.salience},
        {"age_seconds", p.age_seconds}
    };
}

void to_json(json& j, const PointCloud& c) {
    j = json{
        {"points", c.points},
        {"anchors", c.anchors},
        {"generated_at", format_rfc3339(c.generated_at)},
        {"projection_type", c.projection_type},
        {"dropped", c.dropped}
    };
}

// ═══════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════

ProjectionEngine::ProjectionEngine(ProjectionConfig config, VectorSource& vectors)
    : config_(std::move(config))
    , vectors_(vectors)
    , projector_(make_projector(config_.kind, config_.embed_dim, config_.seed))
{}

ProjectionEngine::~ProjectionEngine() {
    stop();
}

ProjectionEngine::Stats ProjectionEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ProjectionEngine::reset() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    projector_ = make_projector(config_.kind, config_.embed_dim, config_.seed);
    anchors_.clear();
    cloud_.clear();
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.anchors_resolved = false;
    }
    log_info("projection", "reset (%s basis)", projector_->name());
}

ProjectionEngine::AnchorRead ProjectionEngine::resolve_anchors() {
    const auto& laws = law_anchors();
    auto samples = vectors_.scroll(config_.anchor_collection, 64);
    if (!samples) return AnchorRead::Unavailable;

    std::vector<AnchorPoint> resolved;
    for (size_t law = 0; law < laws.size(); ++law) {
        AnchorPoint anchor;
        anchor.label = laws[law].label;
        anchor.law = static_cast<int>(law);
        anchor.position = laws[law].canonical;

        for (const auto& s : *samples) {
            auto label = s.payload.find("label");
            auto index = s.payload.find("law");
            bool matches =
                (label != s.payload.end() && label->is_string() &&
                 label->get<std::string>() == anchor.label) ||
                (index != s.payload.end() && index->is_number_integer() &&
                 index->get<int64_t>() == anchor.law);
            if (matches && s.vector.size() == config_.embed_dim && finite(s.vector)) {
                anchor.position = projector_->project(s.vector);
                break;
            }
        }
        resolved.push_back(anchor);
    }

    anchors_ = std::move(resolved);
    log_info("projection", "anchors resolved from '%s'", config_.anchor_collection.c_str());
    return AnchorRead::Resolved;
}

bool ProjectionEngine::refresh() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);

    auto fail = [this](const std::string& error) {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.failures++;
        if (!stats_.stale) log_warn("projection", "vector store unavailable: %s", error.c_str());
        stats_.stale = true;
        return false;
    };

    auto samples = vectors_.scroll(config_.memory_collection, config_.sample_count);
    if (!samples) return fail(vectors_.last_error());

    // Dimension mismatch or non-finite values: drop and count
    std::vector<const VectorSample*> valid;
    uint64_t dropped = 0;
    for (const auto& s : *samples) {
        if (s.vector.size() != config_.embed_dim || !finite(s.vector)) {
            ++dropped;
            log_debug("projection", "dropped sample '%s' (dim %zu)",
                      s.id.c_str(), s.vector.size());
            continue;
        }
        valid.push_back(&s);
    }

    if (!projector_->ready()) {
        std::vector<Embedding> batch;
        batch.reserve(valid.size());
        for (const auto* s : valid) batch.push_back(s->vector);
        projector_->prepare(batch);
        if (!projector_->ready()) {
            log_debug("projection", "%s basis waiting for samples (%zu valid)",
                      projector_->name(), valid.size());
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.dropped_samples += dropped;
            return false;
        }
        log_info("projection", "%s basis ready (%zu -> 3)",
                 projector_->name(), config_.embed_dim);
    }

    if (anchors_.empty() && resolve_anchors() == AnchorRead::Unavailable) {
        return fail(vectors_.last_error());
    }

    Timestamp t = clock_();
    auto cloud = std::make_shared<PointCloud>();
    cloud->generated_at = t;
    cloud->projection_type = projector_->name();
    cloud->anchors = anchors_;
    cloud->dropped = dropped;
    cloud->points.reserve(valid.size());

    for (const auto* s : valid) {
        VectorPoint p;
        p.id = s->id;
        p.position = projector_->project(s->vector);

        auto sal = s->payload.find("semantic_salience");
        if (sal != s->payload.end() && sal->is_number()) {
            p.salience = clamp_unit(sal->get<float>());
        }
        auto encoded = s->payload.find("encoded_at");
        if (encoded != s->payload.end() && encoded->is_string()) {
            if (auto at = parse_rfc3339(encoded->get<std::string>())) {
                p.age_seconds = t > *at ? (t - *at) / 1000.0 : 0.0;
            }
        }
        cloud->points.push_back(std::move(p));
    }

    size_t point_count = cloud->points.size();
    cloud_.store(std::move(cloud));

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    if (stats_.stale) log_info("projection", "vector store recovered");
    stats_.stale = false;
    stats_.refreshes++;
    stats_.dropped_samples += dropped;
    stats_.anchors_resolved = true;
    log_debug("projection", "refreshed %zu points (%llu dropped)",
              point_count, static_cast<unsigned long long>(dropped));
    return true;
}

void ProjectionEngine::start() {
    if (running_.exchange(true)) return;  // Already running

    thread_ = std::thread([this]() {
        run_loop();
    });
    log_info("projection", "started (refresh %lldms, K=%zu)",
             static_cast<long long>(config_.refresh_interval_ms), config_.sample_count);
}

void ProjectionEngine::stop() {
    if (!running_.exchange(false)) return;  // Not running

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    log_info("projection", "stopped");
}

void ProjectionEngine::run_loop() {
    auto interval = std::chrono::milliseconds(config_.refresh_interval_ms);
    auto next = std::chrono::steady_clock::now();

    while (running_) {
        try {
            refresh();
        } catch (const std::exception& e) {
            log_error("projection", "refresh failed: %s", e.what());
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.failures++;
        }

        next += interval;
        auto current = std::chrono::steady_clock::now();
        if (next < current) next = current;

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_until(lock, next, [this] { return !running_; });
    }
}

} // namespace sakshi
