#include <sakshi/snapshot.hpp>
#include <cmath>

namespace sakshi {

float emotional_intensity(float valence, float arousal) {
    return clamp_unit(std::fabs(clamp_signed(valence)) * clamp_unit(arousal));
}

float connection_drive(float valence, float arousal) {
    float v = clamp_signed(valence);
    float a = clamp_unit(arousal);
    return clamp_unit(0.5f + 0.25f * v + 0.25f * (2.0f * a - 1.0f));
}

EmotionalState EmotionalState::derive(float valence, float arousal, float dominance) {
    EmotionalState e;
    e.valence = clamp_signed(valence);
    e.arousal = clamp_unit(arousal);
    e.dominance = clamp_unit(dominance);
    e.connection_drive = sakshi::connection_drive(e.valence, e.arousal);
    e.emotional_intensity = sakshi::emotional_intensity(e.valence, e.arousal);
    return e;
}

const std::vector<std::string>& known_actors() {
    static const std::vector<std::string> actors = {
        "MemoryActor", "AttentionActor", "SalienceActor", "VolitionActor"
    };
    return actors;
}

void to_json(nlohmann::json& j, const IdentityState& s) {
    j = nlohmann::json{
        {"name", s.name},
        {"uptime_seconds", s.uptime_seconds},
        {"lifetime_thoughts", s.lifetime_thoughts},
        {"session_thoughts", s.session_thoughts},
        {"restart_count", s.restart_count}
    };
}

void to_json(nlohmann::json& j, const CognitiveState& s) {
    j = nlohmann::json{
        {"conscious_memories", s.conscious_memories},
        {"unconscious_memories", s.unconscious_memories},
        {"lifetime_dreams", s.lifetime_dreams},
        {"current_cycle", s.current_cycle}
    };
}

void to_json(nlohmann::json& j, const EmotionalState& s) {
    j = nlohmann::json{
        {"valence", s.valence},
        {"arousal", s.arousal},
        {"dominance", s.dominance},
        {"connection_drive", s.connection_drive},
        {"emotional_intensity", s.emotional_intensity}
    };
}

void to_json(nlohmann::json& j, const ActorStatus& s) {
    j = nlohmann::json{
        {"alive", s.alive},
        {"restart_count", s.restart_count}
    };
}

void to_json(nlohmann::json& j, const ThoughtSummary& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"content_preview", s.content_preview},
        {"salience", s.salience},
        {"timestamp", format_rfc3339(s.timestamp)}
    };
}

void to_json(nlohmann::json& j, const Snapshot& s) {
    nlohmann::json actors = nlohmann::json::object();
    for (const auto& [name, status] : s.actors) {
        actors[name] = status;
    }
    j = nlohmann::json{
        {"timestamp", format_rfc3339(s.timestamp)},
        {"identity", s.identity},
        {"cognitive", s.cognitive},
        {"emotional", s.emotional},
        {"actors", std::move(actors)},
        {"recent_thoughts", s.recent_thoughts}
    };
}

} // namespace sakshi
