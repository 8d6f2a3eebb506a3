#pragma once

#include <string>

namespace xpratt {

/// Captures library build version and source provenance details.
/// MUST be stable and available to the CLI.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current build.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns "version (commit[-dirty])".
std::string version_string();

}  // namespace xpratt
