#pragma once
// Snapshot: one immutable point-in-time view of the observed mind
//
// A new tick builds a wholly new Snapshot; nothing mutates one after
// construction. Counts and the thoughts they came from therefore always
// agree within a single Snapshot.

#include <sakshi/types.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sakshi {

// Length cap of Snapshot::recent_thoughts
constexpr size_t RECENT_THOUGHTS = 20;

// Characters kept from raw thought content
constexpr size_t PREVIEW_CHARS = 80;

struct IdentityState {
    std::string name;
    uint64_t uptime_seconds = 0;
    uint64_t lifetime_thoughts = 0;
    uint64_t session_thoughts = 0;
    uint32_t restart_count = 0;
};

struct CognitiveState {
    uint64_t conscious_memories = 0;
    uint64_t unconscious_memories = 0;
    uint64_t lifetime_dreams = 0;
    uint64_t current_cycle = 0;
};

// valence in [-1,1]; everything else in [0,1]
struct EmotionalState {
    float valence = 0.0f;
    float arousal = 0.5f;
    float dominance = 0.5f;
    float connection_drive = 0.5f;
    float emotional_intensity = 0.0f;

    // Clamps the primitives and computes the derived fields from them
    static EmotionalState derive(float valence, float arousal, float dominance);
};

// |valence| * arousal
float emotional_intensity(float valence, float arousal);
// 0.5 + 0.25*valence + 0.25*(2*arousal - 1), clamped to [0,1]
float connection_drive(float valence, float arousal);

struct ActorStatus {
    bool alive = false;
    uint32_t restart_count = 0;
};

// Ordered so serialization is deterministic
using ActorMap = std::map<std::string, ActorStatus>;

// The four actors of the observed process; always present in a Snapshot
const std::vector<std::string>& known_actors();

struct ThoughtSummary {
    std::string id;
    std::string content_preview;
    float salience = 0.0f;
    Timestamp timestamp = 0;
};

struct Snapshot {
    Timestamp timestamp = 0;
    IdentityState identity;
    CognitiveState cognitive;
    EmotionalState emotional;
    ActorMap actors;
    std::vector<ThoughtSummary> recent_thoughts;  // newest first
};

void to_json(nlohmann::json& j, const IdentityState& s);
void to_json(nlohmann::json& j, const CognitiveState& s);
void to_json(nlohmann::json& j, const EmotionalState& s);
void to_json(nlohmann::json& j, const ActorStatus& s);
void to_json(nlohmann::json& j, const ThoughtSummary& s);
void to_json(nlohmann::json& j, const Snapshot& s);

} // namespace sakshi
