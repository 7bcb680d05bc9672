#pragma once

#include "Inspection/JvmInstallationMetadata.hpp"

#include <nlohmann/json.hpp>
#include <span>
#include <string>

namespace jvminspect {

// Resolves the (lazily probed) capabilities of every valid installation,
// in parallel.  Failed installations are skipped.
void probeCapabilities(std::span<const JvmInstallationMetadata> installations);

nlohmann::json toJson(const JvmInstallationMetadata& metadata);
nlohmann::json toJson(std::span<const JvmInstallationMetadata> installations);

// `<display name> (<java home>)`
std::string toText(const JvmInstallationMetadata& metadata);

} // namespace jvminspect
