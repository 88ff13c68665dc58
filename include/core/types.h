#pragma once

/**
 * @file types.h
 * @brief Core type definitions shared by the orchestrator and its collaborators
 *
 * Payloads that the collaborators own the shape of (entities, vehicle state,
 * command parameters, UI updates) are carried as JSON values.
 */

#include "common.h"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace cabin_voice {

using Json = nlohmann::json;

// =============================================================================
// Speech / Understanding
// =============================================================================

/// Text delivered by the speech-input collaborator
struct Transcription {
    std::string text;
    float confidence = 0.0f;    ///< 0.0 - 1.0
};

/// Output of the understanding collaborator
struct NluResult {
    std::string intent = "unknown";
    Json entities = Json::object();
    float confidence = 0.0f;
};

// =============================================================================
// Commands / Dialogue
// =============================================================================

/// Command types understood by the command executor
namespace command_type {
    constexpr const char* CLIMATE = "climate_control";
    constexpr const char* NAVIGATION = "navigation";
    constexpr const char* MEDIA = "media";
    constexpr const char* SETTINGS = "vehicle_settings";
}

/// A vehicle/dialogue-issued instruction awaiting execution
struct PendingCommand {
    std::string type;
    Json parameters = Json::object();
};

/// Response of the dialogue collaborator for one user turn
struct DialogueResponse {
    std::string speech_response;
    std::vector<PendingCommand> commands;
    Json ui_update;                     ///< null = no UI update
    bool end_conversation = false;
};

/// System-initiated speech decided by the dialogue collaborator for a vehicle event
struct ProactiveNotification {
    std::string event_type;
    std::string speech;
    std::vector<PendingCommand> commands;
};

// =============================================================================
// Conversation
// =============================================================================

/// Speaker of a conversation turn
namespace speaker {
    constexpr const char* USER = "user";
    constexpr const char* ASSISTANT = "assistant";
}

/// One exchange unit appended to conversation history; immutable once appended
struct ConversationTurn {
    int64_t timestamp_ms = 0;
    std::string speaker;
    std::string text;
    std::string intent;
    Json entities = Json::object();
};

// =============================================================================
// Callback Types
// =============================================================================

/// Speech-input delivery of a finished utterance
using TranscriptionCallback = std::function<void(const Transcription&)>;

/// Vehicle event delivery: (event_type, payload)
using VehicleEventHandler = std::function<void(const std::string&, const Json&)>;

// JSON conversions
void to_json(Json& j, const PendingCommand& c);
void from_json(const Json& j, PendingCommand& c);
void to_json(Json& j, const ConversationTurn& t);
void from_json(const Json& j, ConversationTurn& t);
void to_json(Json& j, const NluResult& r);
void to_json(Json& j, const DialogueResponse& r);
void to_json(Json& j, const ProactiveNotification& n);

} // namespace cabin_voice
