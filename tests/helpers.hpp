#pragma once

#include "Inspection/JavaInstallationCapability.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <system_error>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

inline std::string readFile(const fs::path& file);

inline fs::path jvminspectBinary() {
  if (const char* env = std::getenv("JVMINSPECT")) {
    return fs::path(env);
  }
#ifdef JVMINSPECT_BINARY
  return fs::path(JVMINSPECT_BINARY);
#else
  return fs::current_path() / "jvminspect";
#endif
}

struct RunResult {
  int status;
  std::string out;
  std::string err;

  bool success() const { return status == 0; }
};

inline std::string replaceAll(std::string text, std::string_view from,
                              std::string_view to) {
  if (from.empty()) {
    return text;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

inline std::string shellQuote(std::string_view arg) {
  return fmt::format("'{}'", replaceAll(std::string(arg), "'", "'\\''"));
}

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "jvminspect-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

// Runs the jvminspect binary with colors disabled, capturing both streams.
inline rs::Result<RunResult> runJvminspect(const std::vector<std::string>& args,
                                           const fs::path& workdir = {}) {
  const TempDir errDir;
  const fs::path errFile = errDir / "stderr";

  std::string cmd;
  if (!workdir.empty()) {
    cmd += fmt::format("cd {} && ", shellQuote(workdir.string()));
  }
  cmd += fmt::format("JVMINSPECT_TERM_COLOR=never {}",
                     shellQuote(jvminspectBinary().string()));
  for (const auto& arg : args) {
    cmd += ' ';
    cmd += shellQuote(arg);
  }
  cmd += fmt::format(" 2>{}", shellQuote(errFile.string()));

  std::FILE* pipe = popen(cmd.c_str(), "r");
  rs_ensure(pipe != nullptr, "failed to spawn `{}`", cmd);

  std::string out;
  std::array<char, 4096> buf{};
  std::size_t size = 0;
  while ((size = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    out.append(buf.data(), size);
  }
  const int rc = pclose(pipe);
  rs_ensure(rc != -1, "failed to wait for `{}`", cmd);

  const int status = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
  return rs::Ok(RunResult{ status, std::move(out), readFile(errFile) });
}

inline rs::Result<RunResult>
runJvminspect(std::initializer_list<std::string> args,
              const fs::path& workdir = {}) {
  return runJvminspect(std::vector<std::string>(args), workdir);
}

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  std::ofstream ofs(file);
  ofs << content;
}

// Lays out a minimal JVM home: `bin/java`, plus `bin/javac` for a JDK.
inline fs::path makeJavaHome(const fs::path& root, std::string_view name,
                             const bool withCompiler) {
  const fs::path home = root / name;
  fs::create_directories(home / "bin");
  writeFile(home / "bin" / "java", "#!/bin/sh\n");
  if (withCompiler) {
    writeFile(jvminspect::javaCompilerPath(home), "#!/bin/sh\n");
  }
  return home;
}

} // namespace tests
