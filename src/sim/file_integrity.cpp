#include "sim/file_integrity.h"
#include "logger.h"
#include <filesystem>
#include <fstream>

namespace cabin_voice {
namespace sim {

FileIntegrityVerifier::FileIntegrityVerifier(std::vector<std::string> required_files)
    : required_files_(std::move(required_files)) {}

VoidResult FileIntegrityVerifier::start() {
    Logger::info("[Security] Integrity verifier watching " + std::to_string(required_files_.size()) + " file(s)");
    return VoidResult();
}

VoidResult FileIntegrityVerifier::stop() {
    return VoidResult();
}

bool FileIntegrityVerifier::verify_system_integrity() {
    missing_.clear();
    for (const auto& path : required_files_) {
        std::error_code ec;
        bool ok = std::filesystem::is_regular_file(path, ec) && !ec;
        if (ok) {
            std::ifstream file(path);
            ok = file.good();
        }
        if (!ok) {
            Logger::error("[Security] Integrity check failed for " + path);
            missing_.push_back(path);
        }
    }
    return missing_.empty();
}

} // namespace sim
} // namespace cabin_voice
