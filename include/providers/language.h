#pragma once

/**
 * @file language.h
 * @brief Understanding and dialogue collaborator interfaces
 */

#include "providers/component.h"
#include "core/types.h"
#include <optional>
#include <string>

namespace cabin_voice {

/**
 * @brief Intent classification and entity extraction
 */
class IUnderstanding : public Component {
public:
    virtual Result<NluResult> process(const std::string& text) = 0;
};

/**
 * @brief Response generation and proactive trigger decisions
 */
class IDialogue : public Component {
public:
    /**
     * @brief Produce the response for one user turn
     * @param nlu Understanding result for the utterance
     * @param context Snapshot of the conversation context (JSON form)
     */
    virtual Result<DialogueResponse> process_turn(const NluResult& nlu, const Json& context) = 0;

    /**
     * @brief Decide whether a vehicle event warrants a spoken notification
     * @return Notification, or std::nullopt when the event should stay silent
     */
    virtual Result<std::optional<ProactiveNotification>> check_proactive_trigger(
        const std::string& event_type, const Json& event_data, const Json& context) = 0;
};

} // namespace cabin_voice
