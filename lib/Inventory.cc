#include "Inventory.hpp"

#include "Diag.hpp"
#include "Inspection/JvmInstallationMetadata.hpp"
#include "JavaVersion.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <toml.hpp>
#include <unordered_set>
#include <utility>
#include <vector>

namespace jvminspect {

// toml11 reports problems by throwing; turn them into results and strip the
// "[error] " prefix since Diag::error prints its own.
static rs::Result<toml::value> parseToml(const fs::path& path) noexcept {
  using std::string_view_literals::operator""sv;

  if (shouldColorStderr()) {
    toml::color::enable();
  } else {
    toml::color::disable();
  }

  try {
    return rs::Ok(toml::parse(path));
  } catch (const std::exception& e) {
    std::string what = e.what();

    static constexpr std::size_t errorPrefixSize = "[error] "sv.size();
    static constexpr std::size_t colorErrorPrefixSize =
        "\033[31m\033[01m[error]\033[00m "sv.size();

    if (what.starts_with("[error] ")) {
      what = what.substr(errorPrefixSize);
    } else if (what.starts_with("\033[31m")) {
      what = what.substr(std::min(colorErrorPrefixSize, what.size()));
    }
    if (!what.empty() && what.back() == '\n') {
      what.pop_back();
    }
    return rs::Err(rs::anyhow(what));
  }
}

static fs::path resolveHome(const fs::path& baseDir, const std::string& home) {
  fs::path resolved = home;
  if (resolved.is_relative()) {
    std::error_code ec;
    const fs::path absBase = fs::absolute(baseDir, ec);
    resolved = (ec ? baseDir : absBase) / resolved;
  }
  return resolved.lexically_normal();
}

static rs::Result<std::string> findString(const toml::value& entry,
                                          const std::size_t index,
                                          const char* key) noexcept {
  rs_ensure(entry.contains(key), "installation #{}: missing `{}`", index, key);
  const toml::value& val = entry.at(key);
  rs_ensure(val.is_string(), "installation #{}: `{}` must be a string", index,
            key);
  return rs::Ok(val.as_string());
}

static rs::Result<JvmInstallationMetadata>
parseInstallation(const toml::value& entry, const std::size_t index,
                  const fs::path& baseDir) noexcept {
  rs_ensure(entry.is_table(), "installation #{} must be a table", index);

  const std::string home = rs_try(findString(entry, index, "home"));
  rs_ensure(!home.empty(), "installation #{}: `home` must not be empty", index);
  fs::path javaHome = resolveHome(baseDir, home);

  if (entry.contains("error")) {
    rs_ensure(!entry.contains("version"),
              "installation #{}: `error` and `version` are mutually exclusive",
              index);
    std::string errorMessage = rs_try(findString(entry, index, "error"));
    return rs::Ok(JvmInstallationMetadata::failure(std::move(javaHome),
                                                   std::move(errorMessage)));
  }

  const std::string versionStr = rs_try(findString(entry, index, "version"));
  auto version = JavaVersion::parse(versionStr);
  if (version.is_err()) {
    rs_bail("installation #{}: {}", index, version.unwrap_err()->what());
  }
  std::string vendor = rs_try(findString(entry, index, "vendor"));
  std::string implementationName;
  if (entry.contains("implementation")) {
    implementationName = rs_try(findString(entry, index, "implementation"));
  }

  return rs::Ok(JvmInstallationMetadata::from(
      std::move(javaHome), version.unwrap(), std::move(vendor),
      std::move(implementationName)));
}

rs::Result<Inventory> Inventory::tryParse(fs::path path,
                                          const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }
  spdlog::debug("Reading inventory: {}", path.string());
  return tryFromToml(rs_try(parseToml(path)), std::move(path));
}

rs::Result<Inventory> Inventory::tryFromToml(const toml::value& data,
                                             fs::path path) noexcept {
  std::vector<JvmInstallationMetadata> installations;
  if (!data.is_table() || !data.contains("installation")) {
    spdlog::debug("[[installation]] not found in {}", path.string());
    return rs::Ok(Inventory(std::move(path), std::move(installations)));
  }

  const toml::value& entries = data.at("installation");
  rs_ensure(entries.is_array(), "`installation` must be an array of tables");

  const fs::path baseDir = path.parent_path();
  std::unordered_set<std::string> seenHomes;
  std::size_t index = 0;
  for (const toml::value& entry : entries.as_array()) {
    ++index;
    JvmInstallationMetadata metadata =
        rs_try(parseInstallation(entry, index, baseDir));
    if (!seenHomes.insert(metadata.getJavaHome().string()).second) {
      Diag::warn("installation `{}` is listed more than once in {}",
                 metadata.getJavaHome().string(), path.string());
    }
    installations.emplace_back(std::move(metadata));
  }
  return rs::Ok(Inventory(std::move(path), std::move(installations)));
}

rs::Result<fs::path> Inventory::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding inventory: {}", configPath.string());
    std::error_code ec;
    const bool exists = fs::exists(configPath, ec);
    rs_ensure(!ec, "cannot access `{}`: {}", configPath.string(),
              ec.message());
    if (exists) {
      return rs::Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path() && parentPath != candidateDir) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

std::size_t Inventory::numInvalid() const noexcept {
  return static_cast<std::size_t>(std::ranges::count_if(
      installations, [](const JvmInstallationMetadata& metadata) {
        return !metadata.isValidInstallation();
      }));
}

} // namespace jvminspect

#ifdef JVMINSPECT_TEST

#  include <fmt/format.h>
#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>

// NOLINTBEGIN
using namespace jvminspect;
using namespace toml::literals::toml_literals;
// NOLINTEND

namespace tests {

static void testTryFromToml() {
  const toml::value val = R"(
    [[installation]]
    home = "/usr/lib/jvm/java-17-openjdk"
    version = "17.0.8"
    vendor = "Oracle Corporation"
    implementation = "OpenJDK 64-Bit Server VM"

    [[installation]]
    home = "jdks/temurin-11"
    version = "11"
    vendor = "Eclipse Adoptium"

    [[installation]]
    home = "/opt/broken"
    error = "home directory does not exist"
  )"_toml;

  const auto inventory =
      Inventory::tryFromToml(val, "/work/jvms.toml").unwrap();
  assertEq(inventory.installations.size(), 3UL);
  assertEq(inventory.numInvalid(), 1UL);

  const auto& openJdk = inventory.installations[0];
  assertTrue(openJdk.isValidInstallation());
  assertEq(openJdk.getJavaHome().string(), "/usr/lib/jvm/java-17-openjdk");
  assertEq(openJdk.getLanguageVersion(), JavaVersion(17, 0, 8));
  assertEq(openJdk.getImplementationName(), "OpenJDK 64-Bit Server VM");

  const auto& temurin = inventory.installations[1];
  assertEq(temurin.getJavaHome().string(), "/work/jdks/temurin-11");
  assertEq(temurin.getImplementationName(), "");
  assertEq(temurin.getVendor().getDisplayName(), "Eclipse Temurin");

  const auto& broken = inventory.installations[2];
  assertFalse(broken.isValidInstallation());
  assertEq(broken.getErrorMessage(), "home directory does not exist");

  pass();
}

static void testEmptyInventory() {
  const toml::value val{};
  const auto inventory = Inventory::tryFromToml(val, "jvms.toml").unwrap();
  assertTrue(inventory.installations.empty());

  pass();
}

static void testTryFromTomlErrors() {
  const auto errorOf = [](const toml::value& val) {
    return std::string(
        Inventory::tryFromToml(val, "/work/jvms.toml").unwrap_err()->what());
  };

  assertEq(errorOf(R"(installation = 1)"_toml),
           "`installation` must be an array of tables");
  assertEq(errorOf(R"(
             [[installation]]
             version = "17"
             vendor = "Oracle Corporation"
           )"_toml),
           "installation #1: missing `home`");
  assertEq(errorOf(R"(
             [[installation]]
             home = ""
             error = "broken"
           )"_toml),
           "installation #1: `home` must not be empty");
  assertEq(errorOf(R"(
             [[installation]]
             home = "/opt/a"
             error = "broken"

             [[installation]]
             home = "/opt/b"
             version = 17
             vendor = "Oracle Corporation"
           )"_toml),
           "installation #2: `version` must be a string");
  assertEq(errorOf(R"(
             [[installation]]
             home = "/opt/a"
             version = "17-ea"
             vendor = "Oracle Corporation"
           )"_toml),
           "installation #1: invalid Java version `17-ea`: `17-ea` is not a "
           "number");
  assertEq(errorOf(R"(
             [[installation]]
             home = "/opt/a"
             version = "17"
           )"_toml),
           "installation #1: missing `vendor`");
  assertEq(errorOf(R"(
             [[installation]]
             home = "/opt/a"
             version = "17"
             error = "broken"
           )"_toml),
           "installation #1: `error` and `version` are mutually exclusive");

  pass();
}

static void testFindPathOnIoError() {
  const fs::path tooLong = fs::temp_directory_path() / std::string(300, 'a');
  const auto result = Inventory::findPath(tooLong);
  assertTrue(result.is_err());
  assertTrue(std::string_view(result.unwrap_err()->what())
                 .starts_with(fmt::format("cannot access `{}`: ",
                                          (tooLong / "jvms.toml").string())));

  pass();
}

} // namespace tests

int main() {
  setColorMode(ColorMode::Never);

  tests::testTryFromToml();
  tests::testEmptyInventory();
  tests::testTryFromTomlErrors();
  tests::testFindPathOnIoError();
}

#endif
