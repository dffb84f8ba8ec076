/***
 * Name: wrapcc::support::DirName
 * Purpose: Return the directory part of a path string.
 * Inputs: path
 * Outputs: parent path; empty when the path has no directory part
 */
#include "wrapcc/support/path.h"

#include <filesystem>
#include <string>

namespace wrapcc {
namespace support {

std::string DirName(const std::string& path) {
  return std::filesystem::path(path).parent_path().string();
}

}  // namespace support
}  // namespace wrapcc
