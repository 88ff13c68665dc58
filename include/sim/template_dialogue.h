#pragma once

#include "providers/language.h"
#include <atomic>
#include <string>

namespace cabin_voice {
namespace sim {

/**
 * @brief Intent-to-template dialogue
 *
 * Turns intents and entities into a spoken response plus vehicle commands.
 * Proactive triggers: low_fuel, low_battery, door_open, maintenance_due,
 * tire_pressure. Every other event stays silent.
 */
class TemplateDialogue : public IDialogue {
public:
    TemplateDialogue();

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    Result<DialogueResponse> process_turn(const NluResult& nlu, const Json& context) override;

    Result<std::optional<ProactiveNotification>> check_proactive_trigger(
        const std::string& event_type, const Json& event_data, const Json& context) override;

private:
    std::atomic<bool> running_;
};

} // namespace sim
} // namespace cabin_voice
