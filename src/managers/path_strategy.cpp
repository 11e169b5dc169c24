#include "path_strategy.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>

namespace fs = std::filesystem;

UnifiedPathStrategy::UnifiedPathStrategy(fs::path root, std::string prefix)
    : root_(std::move(root)), prefix_(prefix.empty() ? DEFAULT_ISSUE_PREFIX : std::move(prefix)) {}

fs::path UnifiedPathStrategy::dump_directory(const std::string& device_id,
                                             const std::string& timestamp,
                                             DumpTrigger) const {
    return root_ / prefix_ / timestamp / device_id;
}

IndividualPathStrategy::IndividualPathStrategy(fs::path root)
    : root_(std::move(root)) {}

fs::path IndividualPathStrategy::dump_directory(const std::string& device_id,
                                                const std::string&,
                                                DumpTrigger) const {
    return root_ / INDIVIDUAL_DUMP_DIR / device_id;
}

HybridPathStrategy::HybridPathStrategy(fs::path root, std::string prefix)
    : unified_(root, std::move(prefix)), individual_(root) {}

fs::path HybridPathStrategy::dump_directory(const std::string& device_id,
                                            const std::string& timestamp,
                                            DumpTrigger trigger) const {
    if (trigger == DumpTrigger::HealthCheck) {
        return unified_.dump_directory(device_id, timestamp, trigger);
    }
    return individual_.dump_directory(device_id, timestamp, trigger);
}

std::unique_ptr<PathNamingStrategy> make_path_strategy(const std::string& name,
                                                       const fs::path& root,
                                                       const std::string& prefix) {
    if (name == "individual") {
        return std::make_unique<IndividualPathStrategy>(root);
    }
    if (name == "hybrid") {
        return std::make_unique<HybridPathStrategy>(root, prefix);
    }
    if (name != "unified") {
        dumpfleet_log("path strategy: unknown '" + name + "', falling back to unified");
    }
    return std::make_unique<UnifiedPathStrategy>(root, prefix);
}
