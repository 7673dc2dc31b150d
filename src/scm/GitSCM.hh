#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "scm/SCM.hh"

namespace fs = std::filesystem;

class RunContext;

/**
 * Keeps a persistent git clone of the configured repository in the branch root and produces the
 * build tree from it. Change detection walks the working tree and compares modification times,
 * which git updates for every file a checkout rewrites.
 */
class GitSCM final : public SCM {
 public:
  /// Create an SCM for the run. The context must outlive the SCM.
  GitSCM(const RunContext& ctx) noexcept;

  StepResult checkout(const std::string& branch) noexcept override;

  ChangeSet findChanged(std::optional<std::time_t> since,
                        std::optional<std::time_t> since_success) noexcept override;

  bool copySourceRequired() const noexcept override;

  StepResult copySource() noexcept override;

  void getVersions(std::vector<std::string>& files) noexcept override;

  void cleanup() noexcept override;

  void removeWorktree() noexcept override;

  std::string getHeadRef() const noexcept override { return _head; }

 private:
  /// Run a git command in the persistent tree, appending its output to `result`
  bool git(const std::string& args, StepResult& result) noexcept;

 private:
  const RunContext& _ctx;
  std::string _head;
};
