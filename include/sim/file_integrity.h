#pragma once

#include "providers/vehicle.h"
#include <string>
#include <vector>

namespace cabin_voice {
namespace sim {

/**
 * @brief Startup integrity check: every listed file must exist and be readable
 */
class FileIntegrityVerifier : public ISecurity {
public:
    explicit FileIntegrityVerifier(std::vector<std::string> required_files);

    VoidResult start() override;
    VoidResult stop() override;
    bool verify_system_integrity() override;

    /// Files that failed the last verification
    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> required_files_;
    std::vector<std::string> missing_;
};

} // namespace sim
} // namespace cabin_voice
