#include "core/types.h"

namespace cabin_voice {

void to_json(Json& j, const PendingCommand& c) {
    j = Json{{"type", c.type}, {"parameters", c.parameters}};
}

void from_json(const Json& j, PendingCommand& c) {
    c.type = j.value("type", std::string());
    if (j.contains("parameters") && j["parameters"].is_object()) {
        c.parameters = j["parameters"];
    } else {
        c.parameters = Json::object();
    }
}

void to_json(Json& j, const ConversationTurn& t) {
    j = Json{
        {"timestamp", t.timestamp_ms},
        {"speaker", t.speaker},
        {"text", t.text},
        {"intent", t.intent},
        {"entities", t.entities}
    };
}

void from_json(const Json& j, ConversationTurn& t) {
    t.timestamp_ms = j.value("timestamp", int64_t{0});
    t.speaker = j.value("speaker", std::string());
    t.text = j.value("text", std::string());
    t.intent = j.value("intent", std::string());
    t.entities = j.contains("entities") ? j["entities"] : Json::object();
}

void to_json(Json& j, const NluResult& r) {
    j = Json{{"intent", r.intent}, {"entities", r.entities}, {"confidence", r.confidence}};
}

void to_json(Json& j, const DialogueResponse& r) {
    j = Json{
        {"speech_response", r.speech_response},
        {"commands", r.commands},
        {"ui_update", r.ui_update},
        {"end_conversation", r.end_conversation}
    };
}

void to_json(Json& j, const ProactiveNotification& n) {
    j = Json{{"event_type", n.event_type}, {"speech", n.speech}, {"commands", n.commands}};
}

} // namespace cabin_voice
