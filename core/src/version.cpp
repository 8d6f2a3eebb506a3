#include "xpratt/version.h"

namespace xpratt {

namespace {

#ifndef XPRATT_VERSION
#define XPRATT_VERSION "0.0.0"
#endif

#ifndef XPRATT_GIT_COMMIT
#define XPRATT_GIT_COMMIT "unknown"
#endif

#ifndef XPRATT_GIT_DIRTY
#define XPRATT_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = XPRATT_VERSION;
  info.git_commit = XPRATT_GIT_COMMIT;
  info.git_dirty = (XPRATT_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  const VersionInfo info = get_version_info();
  std::string out = "xpratt " + info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace xpratt
