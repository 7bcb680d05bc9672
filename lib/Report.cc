#include "Report.hpp"

#include "Inspection/JavaInstallationCapability.hpp"
#include "Inspection/JvmInstallationMetadata.hpp"
#include "Inspection/JvmVendor.hpp"
#include "Parallelism.hpp"

#include <cstddef>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <utility>

namespace jvminspect {

void probeCapabilities(
    const std::span<const JvmInstallationMetadata> installations) {
  spdlog::debug("Probing {} installation(s) on up to {} thread(s)",
                installations.size(), getParallelism());
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, installations.size()),
      [&](const tbb::blocked_range<std::size_t>& rng) {
        for (std::size_t i = rng.begin(); i != rng.end(); ++i) {
          const JvmInstallationMetadata& metadata = installations[i];
          if (metadata.isValidInstallation()) {
            static_cast<void>(metadata.getCapabilities());
          }
        }
      });
}

nlohmann::json toJson(const JvmInstallationMetadata& metadata) {
  nlohmann::json json;
  json["javaHome"] = metadata.getJavaHome().string();
  json["displayName"] = metadata.getDisplayName();
  json["valid"] = metadata.isValidInstallation();
  if (!metadata.isValidInstallation()) {
    json["errorMessage"] = metadata.getErrorMessage();
    return json;
  }

  const JvmVendor vendor = metadata.getVendor();
  json["languageVersion"] = metadata.getLanguageVersion().toString();
  json["majorVersion"] = metadata.getLanguageVersion().getMajorVersion();
  json["vendor"] = vendor.getRawVendor();
  json["knownVendor"] = std::string(toString(vendor.getKnownVendor()));
  json["implementationName"] = metadata.getImplementationName();

  nlohmann::json capabilities = nlohmann::json::array();
  for (const JavaInstallationCapability capability :
       metadata.getCapabilities()) {
    capabilities.push_back(std::string(toString(capability)));
  }
  json["capabilities"] = std::move(capabilities);
  return json;
}

nlohmann::json
toJson(const std::span<const JvmInstallationMetadata> installations) {
  nlohmann::json json = nlohmann::json::array();
  for (const JvmInstallationMetadata& metadata : installations) {
    json.push_back(toJson(metadata));
  }
  return json;
}

std::string toText(const JvmInstallationMetadata& metadata) {
  return fmt::format("{} ({})", metadata.getDisplayName(),
                     metadata.getJavaHome().string());
}

} // namespace jvminspect
