#pragma once
// Vector store: read-only REST client for the embedding store
//
// Counts, the identity record and embedding samples over the Qdrant
// REST API. Every call uses its own httplib client, so one instance may
// serve several threads at once.

#include <sakshi/config.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sakshi {

// Fixed id of the identity point
constexpr const char* IDENTITY_POINT_ID = "00000000-0000-0000-0000-000000000001";

struct VectorSample {
    std::string id;
    std::vector<float> vector;
    nlohmann::json payload = nlohmann::json::object();
};

// Lifetime counters persisted by the observed process
struct IdentityRecord {
    uint64_t lifetime_thoughts = 0;
    uint32_t restart_count = 0;
    uint64_t lifetime_dreams = 0;
};

// Abstract read side of the vector store. nullopt = source unavailable.
class VectorSource {
public:
    virtual ~VectorSource() = default;

    // Points in a collection; a missing collection counts 0
    virtual std::optional<uint64_t> count(const std::string& collection) = 0;

    // Identity point; a missing point or collection reads as zeros
    virtual std::optional<IdentityRecord> identity(const std::string& collection) = 0;

    // Up to limit points with vectors and payloads
    virtual std::optional<std::vector<VectorSample>> scroll(const std::string& collection,
                                                            size_t limit) = 0;

    virtual std::string last_error() const = 0;
};

class QdrantVectorStore : public VectorSource {
public:
    QdrantVectorStore(Endpoint endpoint, int64_t timeout_ms);

    std::optional<uint64_t> count(const std::string& collection) override;
    std::optional<IdentityRecord> identity(const std::string& collection) override;
    std::optional<std::vector<VectorSample>> scroll(const std::string& collection,
                                                    size_t limit) override;

    std::string last_error() const override;

private:
    Endpoint endpoint_;
    int64_t timeout_ms_;

    mutable std::mutex error_mutex_;
    std::string last_error_;

    void set_error(const std::string& error);

    // Sends one GET or POST; returns the parsed body of a 2xx reply, or
    // json(nullptr) for 404. nullopt on transport or protocol failure.
    std::optional<nlohmann::json> call(const std::string& method,
                                       const std::string& path,
                                       const std::string& body);
};

// Extracts the embedding of one point: a plain array, or the first
// array of a named-vector object. Non-numeric entries make it empty.
std::vector<float> extract_vector(const nlohmann::json& v);

} // namespace sakshi
