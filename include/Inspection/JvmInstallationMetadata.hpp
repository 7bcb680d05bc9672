#pragma once

#include "Inspection/JavaInstallationCapability.hpp"
#include "Inspection/JvmVendor.hpp"
#include "JavaVersion.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace jvminspect {

namespace fs = std::filesystem;

// Thrown when an accessor is called on the wrong kind of installation, e.g.
// `getVendor()` on a failed probe.  This is a programming error; check
// `isValidInstallation()` first.
class UnsupportedOperation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// What is known about a JVM home: either the facts probed from a working
// installation, or the reason probing it failed.
class JvmInstallationMetadata {
public:
  static JvmInstallationMetadata from(fs::path javaHome,
                                      JavaVersion languageVersion,
                                      std::string vendor,
                                      std::string implementationName);
  static JvmInstallationMetadata failure(fs::path javaHome,
                                         std::string errorMessage);

  // A moved-from Valid instance throws UnsupportedOperation from the Valid
  // accessors; it may still be destroyed or assigned to.
  JvmInstallationMetadata(JvmInstallationMetadata&&) noexcept = default;
  JvmInstallationMetadata&
  operator=(JvmInstallationMetadata&&) noexcept = default;
  JvmInstallationMetadata(const JvmInstallationMetadata&) = delete;
  JvmInstallationMetadata& operator=(const JvmInstallationMetadata&) = delete;

  bool isValidInstallation() const noexcept;
  const fs::path& getJavaHome() const noexcept;
  std::string getDisplayName() const;

  // Valid installations only.
  const JavaVersion& getLanguageVersion() const;
  JvmVendor getVendor() const;
  const std::string& getImplementationName() const;
  // Probed on first use, then cached; safe to call from several threads.
  const JavaInstallationCapabilities& getCapabilities() const;
  bool hasCapability(JavaInstallationCapability capability) const;

  // Failed installations only.
  const std::string& getErrorMessage() const;

private:
  struct CapabilitiesCell {
    std::once_flag once;
    JavaInstallationCapabilities value;
  };

  struct Valid {
    fs::path javaHome;
    JavaVersion languageVersion;
    std::string vendor;
    std::string implementationName;
    std::unique_ptr<CapabilitiesCell> capabilities;
  };

  struct Failure {
    fs::path javaHome;
    std::string errorMessage;
  };

  explicit JvmInstallationMetadata(Valid valid) noexcept;
  explicit JvmInstallationMetadata(Failure failure) noexcept;

  const Valid& valid() const;

  std::string determineVendorName() const;

  std::variant<Valid, Failure> state;
};

} // namespace jvminspect
