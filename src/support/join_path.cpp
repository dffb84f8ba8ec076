#include "wrapcc/support/path.h"

#include <filesystem>
#include <string>

namespace wrapcc::support {

/***
 * Name: wrapcc::support::JoinPath
 * Purpose: Join a directory and a file name.
 */
std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) { return name; }
  return (std::filesystem::path(dir) / name).string();
}

}  // namespace wrapcc::support
