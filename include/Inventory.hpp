#pragma once

#include "Inspection/JvmInstallationMetadata.hpp"

#include <cstddef>
#include <filesystem>
#include <rs/result.hpp>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace jvminspect {

namespace fs = std::filesystem;

// The raw probe results an external discovery step recorded in `jvms.toml`,
// turned into installation metadata.
struct Inventory {
  static constexpr const char* FILE_NAME = "jvms.toml";

  fs::path path;
  std::vector<JvmInstallationMetadata> installations;

  static rs::Result<Inventory>
  tryParse(fs::path path = fs::current_path() / FILE_NAME,
           bool findParents = true) noexcept;
  static rs::Result<Inventory> tryFromToml(const toml::value& data,
                                           fs::path path) noexcept;

  static rs::Result<fs::path>
  findPath(fs::path candidateDir = fs::current_path()) noexcept;

  std::size_t numInvalid() const noexcept;

private:
  Inventory(fs::path path,
            std::vector<JvmInstallationMetadata> installations) noexcept
      : path(std::move(path)), installations(std::move(installations)) {}
};

} // namespace jvminspect
