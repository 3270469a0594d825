#include <sakshi/vector_store.hpp>
#include <sakshi/log.hpp>
#include <httplib.h>
#include <chrono>

namespace sakshi {

using json = nlohmann::json;

namespace {

uint64_t uint_or_zero(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    if (it->is_number_float()) {
        double d = it->get<double>();
        return d > 0 ? static_cast<uint64_t>(d) : 0;
    }
    if (it->is_number_integer() && it->get<int64_t>() < 0) return 0;
    return it->get<uint64_t>();
}

std::string id_string(const json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number()) return id.dump();
    return "";
}

}  // anonymous namespace

std::vector<float> extract_vector(const json& v) {
    const json* arr = &v;
    if (v.is_object()) {
        arr = nullptr;
        for (const auto& [name, value] : v.items()) {
            if (value.is_array()) {
                arr = &value;
                break;
            }
        }
        if (!arr) return {};
    }
    if (!arr->is_array()) return {};

    std::vector<float> out;
    out.reserve(arr->size());
    for (const auto& x : *arr) {
        if (!x.is_number()) return {};
        out.push_back(x.get<float>());
    }
    return out;
}

QdrantVectorStore::QdrantVectorStore(Endpoint endpoint, int64_t timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {}

std::string QdrantVectorStore::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void QdrantVectorStore::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

std::optional<json> QdrantVectorStore::call(const std::string& method,
                                            const std::string& path,
                                            const std::string& body) {
    httplib::Client client(endpoint_.host, endpoint_.port);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_write_timeout(std::chrono::milliseconds(timeout_ms_));

    httplib::Result reply = method == "POST"
        ? client.Post(path, body, "application/json")
        : client.Get(path);
    if (!reply) {
        set_error(method + " " + path + ": " + httplib::to_string(reply.error()));
        return std::nullopt;
    }
    if (reply->status == 404) return json(nullptr);
    if (reply->status < 200 || reply->status >= 300) {
        set_error(method + " " + path + ": HTTP " + std::to_string(reply->status));
        return std::nullopt;
    }

    json parsed = json::parse(reply->body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        set_error(method + " " + path + ": invalid JSON body");
        return std::nullopt;
    }
    return parsed;
}

std::optional<uint64_t> QdrantVectorStore::count(const std::string& collection) {
    auto body = call("GET", "/collections/" + collection, "");
    if (!body) return std::nullopt;
    if (body->is_null()) return 0;

    auto result = body->find("result");
    if (result == body->end() || !result->is_object()) {
        set_error("collection info without result: " + collection);
        return std::nullopt;
    }
    return uint_or_zero(*result, "points_count");
}

std::optional<IdentityRecord> QdrantVectorStore::identity(const std::string& collection) {
    json request = {
        {"ids", json::array({IDENTITY_POINT_ID})},
        {"with_payload", true}
    };
    auto body = call("POST", "/collections/" + collection + "/points", request.dump());
    if (!body) return std::nullopt;

    IdentityRecord record;
    if (body->is_null()) return record;

    auto result = body->find("result");
    if (result == body->end() || !result->is_array() || result->empty()) {
        return record;
    }
    const json& point = result->front();
    auto payload = point.find("payload");
    if (payload == point.end() || !payload->is_object()) return record;

    record.lifetime_thoughts = uint_or_zero(*payload, "lifetime_thought_count");
    record.restart_count = static_cast<uint32_t>(uint_or_zero(*payload, "restart_count"));
    record.lifetime_dreams = uint_or_zero(*payload, "lifetime_dream_count");
    return record;
}

std::optional<std::vector<VectorSample>> QdrantVectorStore::scroll(const std::string& collection,
                                                                   size_t limit) {
    json request = {
        {"limit", limit},
        {"with_payload", true},
        {"with_vector", true}
    };
    auto body = call("POST", "/collections/" + collection + "/points/scroll", request.dump());
    if (!body) return std::nullopt;

    std::vector<VectorSample> samples;
    if (body->is_null()) return samples;

    auto result = body->find("result");
    if (result == body->end() || !result->is_object()) {
        set_error("scroll without result: " + collection);
        return std::nullopt;
    }
    auto points = result->find("points");
    if (points == result->end() || !points->is_array()) return samples;

    samples.reserve(points->size());
    for (const auto& p : *points) {
        if (!p.is_object()) continue;
        VectorSample s;
        if (p.contains("id")) s.id = id_string(p["id"]);
        if (p.contains("vector")) s.vector = extract_vector(p["vector"]);
        if (p.contains("payload") && p["payload"].is_object()) s.payload = p["payload"];
        samples.push_back(std::move(s));
    }
    log_debug("vectors", "scrolled %zu points from %s", samples.size(), collection.c_str());
    return samples;
}

} // namespace sakshi
