#pragma once
// SnapshotStore: the process-wide "latest snapshot"
//
// Exactly one writer (the Collector) publishes; any number of readers
// take current(). A published Snapshot carries its JSON encoding,
// produced once at publish time, so every reader and every session
// sends the same bytes for the same tick.

#include <sakshi/latest.hpp>
#include <sakshi/snapshot.hpp>
#include <memory>
#include <string>

namespace sakshi {

struct PublishedSnapshot {
    Snapshot snapshot;
    std::string json;
};

class SnapshotStore {
public:
    using Ptr = std::shared_ptr<const PublishedSnapshot>;

    SnapshotStore() = default;
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    // Last write wins. Returns the published value.
    Ptr publish(Snapshot snapshot) {
        auto published = std::make_shared<PublishedSnapshot>();
        // Invalid UTF-8 that slipped past the adapters becomes U+FFFD
        published->json = nlohmann::json(snapshot).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
        published->snapshot = std::move(snapshot);
        Ptr ptr = std::move(published);
        cell_.store(ptr);
        return ptr;
    }

    // nullptr until the first publish ("not yet initialized")
    Ptr current() const { return cell_.load(); }

    bool initialized() const { return !cell_.empty(); }

private:
    Latest<PublishedSnapshot> cell_;
};

} // namespace sakshi
