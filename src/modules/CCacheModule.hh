#pragma once

#include <filesystem>
#include <string>

#include "modules/Module.hh"

namespace fs = std::filesystem;

struct Config;

/**
 * Points compiler caching at a per-animal cache directory. After a failed run the cache can be
 * discarded, so a poisoned cache never outlives the failure it caused.
 */
class CCacheModule final : public Module {
 public:
  CCacheModule(const Config& config) noexcept;

  std::string getName() const noexcept override { return "ccache"; }

  void setupTarget(RunContext& ctx) noexcept override;

  void cleanup(RunContext& ctx) noexcept override;

  /// Get the cache directory, or an empty path if ccache's own default is used
  const fs::path& getCacheDir() const noexcept { return _dir; }

 private:
  fs::path _dir;
  bool _remove_on_failure;
};
