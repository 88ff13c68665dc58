#include "sim/keyword_understanding.h"
#include "logger.h"
#include "utils.h"

namespace cabin_voice {
namespace sim {

KeywordUnderstanding::KeywordUnderstanding() : running_(false) {
    // Checked in order; first match wins
    intent_keywords_ = {
        {"farewell", {"goodbye", "bye", "that's all", "thats all", "thank you", "thanks", "stop listening"}},
        {"climate_control", {"temperature", "degrees", "warmer", "cooler", "heat", "heating",
                             "air conditioning", "ac", "fan", "climate", "defrost"}},
        {"navigation", {"navigate", "directions", "route", "take me", "drive to", "go to", "navigation"}},
        {"media_control", {"play", "pause", "music", "song", "track", "radio", "volume",
                           "skip", "next", "previous", "mute", "unmute"}},
        {"phone_call", {"call", "dial", "phone"}},
        {"vehicle_status", {"fuel", "battery", "range", "tire", "tyre", "status", "how much gas"}},
        {"settings", {"setting", "settings", "lights", "seat", "mirror", "lock", "unlock"}},
        {"weather", {"weather", "rain", "forecast", "sunny"}},
        {"traffic", {"traffic", "congestion", "jam"}},
        {"help", {"help", "what can you do"}},
        {"greeting", {"hello", "hi", "hey", "good morning", "good afternoon", "good evening"}}
    };
}

std::string KeywordUnderstanding::name() const {
    return component::UNDERSTANDING;
}

VoidResult KeywordUnderstanding::start() {
    running_ = true;
    return VoidResult();
}

VoidResult KeywordUnderstanding::stop() {
    running_ = false;
    return VoidResult();
}

VoidResult KeywordUnderstanding::restart() {
    running_ = true;
    return VoidResult();
}

bool KeywordUnderstanding::health_check() {
    return running_;
}

Result<NluResult> KeywordUnderstanding::process(const std::string& text) {
    if (!running_) {
        return make_provider_error("understanding is not running");
    }

    NluResult result;
    const std::string normalized = utils::normalize_copy(utils::trim_copy(text));
    if (normalized.empty()) {
        return result;
    }

    for (const auto& [intent, keywords] : intent_keywords_) {
        if (utils::contains_any(normalized, keywords)) {
            result.intent = intent;
            result.confidence = 0.9f;
            break;
        }
    }
    if (result.intent == "unknown") {
        result.confidence = 0.3f;
    }

    result.entities = extract_entities(result.intent, normalized);
    Logger::debug("[NLU] '" + text + "' -> " + result.intent + " " + result.entities.dump());
    return result;
}

Json KeywordUnderstanding::extract_entities(const std::string& intent, const std::string& normalized) const {
    Json entities = Json::object();
    std::vector<double> numbers = utils::extract_numbers(normalized);

    if (intent == "climate_control") {
        if (utils::contains_word(normalized, "fan")) {
            if (!numbers.empty()) entities["fan_speed"] = static_cast<int>(numbers[0]);
        } else if (!numbers.empty()) {
            entities["temperature"] = numbers[0];
        } else if (utils::contains_any(normalized, {"warmer", "heat", "heating"})) {
            entities["adjust"] = "warmer";
        } else if (utils::contains_any(normalized, {"cooler", "ac", "air conditioning"})) {
            entities["adjust"] = "cooler";
        }
    } else if (intent == "navigation") {
        std::string destination = utils::text_after(normalized, {"navigate to", "directions to", "take me to",
                                                                 "drive to", "go to", "to"});
        if (!destination.empty()) {
            entities["destination"] = destination;
        }
    } else if (intent == "media_control") {
        static const std::vector<std::pair<std::string, std::vector<std::string>>> actions = {
            {"unmute", {"unmute"}},
            {"mute", {"mute"}},
            {"pause", {"pause"}},
            {"stop", {"stop"}},
            {"next", {"next", "skip"}},
            {"previous", {"previous", "go back"}},
            {"volume_up", {"louder", "volume up", "turn it up"}},
            {"volume_down", {"quieter", "volume down", "turn it down"}},
            {"play", {"play"}}
        };
        for (const auto& [action, phrases] : actions) {
            if (utils::contains_any(normalized, phrases)) {
                entities["action"] = action;
                break;
            }
        }
        if (utils::contains_word(normalized, "volume") && !numbers.empty()) {
            entities["volume"] = static_cast<int>(numbers[0]);
        }
        if (utils::contains_word(normalized, "radio")) {
            entities["source"] = "radio";
        }
    } else if (intent == "phone_call") {
        std::string contact = utils::text_after(normalized, {"call", "dial"});
        if (!contact.empty()) {
            entities["contact"] = contact;
        }
    } else if (intent == "settings") {
        if (utils::contains_word(normalized, "lights")) {
            entities["setting"] = "lights";
            if (utils::contains_word(normalized, "off")) entities["value"] = "off";
            else if (utils::contains_word(normalized, "on")) entities["value"] = "on";
            else if (utils::contains_word(normalized, "auto")) entities["value"] = "auto";
        } else if (utils::contains_word(normalized, "unlock")) {
            entities["setting"] = "doors_locked";
            entities["value"] = false;
        } else if (utils::contains_word(normalized, "lock")) {
            entities["setting"] = "doors_locked";
            entities["value"] = true;
        }
    }

    return entities;
}

} // namespace sim
} // namespace cabin_voice
