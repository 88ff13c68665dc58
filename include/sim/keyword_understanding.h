#pragma once

#include "providers/language.h"
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace cabin_voice {
namespace sim {

/**
 * @brief Keyword intent classifier with simple entity extraction
 *
 * Intents: greeting, farewell, help, climate_control, navigation,
 * media_control, phone_call, vehicle_status, settings, weather, traffic,
 * unknown. Entities: temperature / fan_speed (climate), destination
 * (navigation), action / volume (media), contact (phone), setting / value
 * (settings).
 */
class KeywordUnderstanding : public IUnderstanding {
public:
    KeywordUnderstanding();

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    Result<NluResult> process(const std::string& text) override;

private:
    Json extract_entities(const std::string& intent, const std::string& normalized) const;

    std::vector<std::pair<std::string, std::vector<std::string>>> intent_keywords_;
    std::atomic<bool> running_;
};

} // namespace sim
} // namespace cabin_voice
