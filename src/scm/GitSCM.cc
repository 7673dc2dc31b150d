#include "scm/GitSCM.hh"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "runtime/RunContext.hh"
#include "runtime/Subprocess.hh"
#include "scm/ChangeScan.hh"
#include "util/log.hh"
#include "util/shell.hh"
#include "util/wrappers.hh"

using std::optional;
using std::string;
using std::vector;

GitSCM::GitSCM(const RunContext& ctx) noexcept : _ctx(ctx) {}

bool GitSCM::git(const string& args, StepResult& result) noexcept {
  auto r = run_log("git " + args, _ctx.env, _ctx.source_dir);
  result.append(r.log);
  if (!r.ok()) result.status = r.status;
  return r.ok();
}

StepResult GitSCM::checkout(const string& branch) noexcept {
  StepResult result;
  result.stage = "SCM-checkout";

  string remote_ref = "origin/" + branch;

  if (!dirExists(_ctx.source_dir / ".git")) {
    // A partial tree left by an interrupted clone cannot be reused
    removeTree(_ctx.source_dir);

    string cmd = "git clone -q ";
    if (branch != "HEAD") cmd += "--branch " + shell_escaped(branch) + " ";
    cmd += shell_escaped(_ctx.config.scm_url) + " " + shell_escaped(_ctx.source_dir.string());

    LOG(phase) << "cloning " << _ctx.config.scm_url;
    auto r = run_log(cmd, _ctx.env, _ctx.config.build_root);
    result.append(r.log);
    if (!r.ok()) {
      result.status = r.status;
      return result;
    }
  } else {
    LOG(phase) << "updating source tree";
    if (!git("fetch -q --prune origin", result)) return result;
  }

  if (!git("reset -q --hard " + shell_escaped(remote_ref), result)) return result;
  if (!git("clean -q -dfx", result)) return result;

  auto head = run_log("git rev-parse HEAD", _ctx.env, _ctx.source_dir);
  if (head.ok() && !head.log.empty()) {
    _head = head.log.front();
    result.log.push_back("git checkout at " + _head);
  }

  return result;
}

ChangeSet GitSCM::findChanged(optional<std::time_t> since,
                              optional<std::time_t> since_success) noexcept {
  return scan_changes(_ctx.source_dir, since, since_success);
}

bool GitSCM::copySourceRequired() const noexcept {
  return !_ctx.config.use_vpath;
}

StepResult GitSCM::copySource() noexcept {
  StepResult result;
  result.stage = "SCM-checkout";

  removeTree(_ctx.build_dir);

  std::error_code ec;
  fs::create_directories(_ctx.build_dir, ec);
  if (ec) {
    result.status = 1;
    result.log.push_back("cannot create " + _ctx.build_dir.string() + ": " + ec.message());
    return result;
  }

  for (auto iter = fs::directory_iterator(_ctx.source_dir, ec);
       !ec && iter != fs::directory_iterator(); iter.increment(ec)) {
    if (iter->path().filename() == ".git") continue;

    fs::copy(iter->path(), _ctx.build_dir / iter->path().filename(),
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) break;
  }

  if (ec) {
    result.status = 1;
    result.log.push_back("copying source to " + _ctx.build_dir.string() + " failed: " +
                         ec.message());
  }
  return result;
}

void GitSCM::getVersions(vector<string>& files) noexcept {
  for (auto& file : files) {
    auto r = run_log("git log -1 --pretty=format:%h -- " + shell_escaped(file), _ctx.env,
                     _ctx.source_dir);
    if (r.ok() && !r.log.empty()) file += " " + r.log.front();
  }
}

void GitSCM::cleanup() noexcept {
  // A vpath build can leave generated files in the source tree
  if (!_ctx.config.use_vpath || !dirExists(_ctx.source_dir / ".git")) return;

  StepResult ignored;
  WARN_IF(!git("clean -q -dfx", ignored)) << "Unable to clean " << _ctx.source_dir;
}

void GitSCM::removeWorktree() noexcept {
  LOG(phase) << "removing " << _ctx.source_dir;
  WARN_IF(!removeTree(_ctx.source_dir)) << "Unable to remove " << _ctx.source_dir;
}
