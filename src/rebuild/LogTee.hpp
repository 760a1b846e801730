#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace rebuild {

// RAII helper that mirrors std::cout/std::cerr into a log file.
//
// The pipeline itself never logs; the CLI prints progress and warnings to the
// standard streams and `--log <file>` installs a LogTee so batch runs leave a
// record behind. Console output is unchanged.
//
// Each log file line is prefixed with a UTC timestamp and a stream tag:
//   2026-01-27T16:40:12.345Z [OUT] wrote report.json
//
// Rotation: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Number of rotated backups to keep (>=0).
  // keepFiles=0 disables rotation (existing file is truncated).
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // Timestamp + [OUT]/[ERR] prefix on each log file line.
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. If already active, it will be stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Stop logging and restore original std::cout/std::cerr streambufs.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  // Rotate log files: base -> base.1 -> base.2 ... up to keepFiles.
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace rebuild
