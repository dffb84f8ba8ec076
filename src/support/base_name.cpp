/***
 * Name: wrapcc::support::BaseName
 * Purpose: Return the final component of a path string.
 * Inputs: path
 * Outputs: base name; empty when the path ends in a separator
 */
#include "wrapcc/support/path.h"

#include <filesystem>
#include <string>

namespace wrapcc {
namespace support {

std::string BaseName(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

}  // namespace support
}  // namespace wrapcc
