#pragma once

#include <filesystem>
#include <string>
#include <utility>

namespace fs = std::filesystem;

class Environment;

/// Delivers a persisted report transaction to the collector
class Transport {
 public:
  virtual ~Transport() noexcept = default;

  /**
   * Send the transaction stored in a log directory.
   *
   * \returns zero if the collector accepted the report, or a non-zero failure status
   */
  virtual int send(const fs::path& txn_dir) noexcept = 0;
};

/**
 * Sends reports by running an external command with the log directory as its only argument. The
 * command's exit status is the transport status.
 */
class CommandTransport final : public Transport {
 public:
  CommandTransport(std::string command, const Environment& env) noexcept :
      _command(std::move(command)), _env(env) {}

  int send(const fs::path& txn_dir) noexcept override;

 private:
  std::string _command;
  const Environment& _env;
};
