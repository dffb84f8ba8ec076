/***
 * Name: wrapcc::support::StripExtension
 * Purpose: Drop the final extension from a base name.
 * Inputs: name (a single path component)
 * Outputs: name without its last ".ext"; dot-files keep their name
 * Theory of Operation: std::filesystem::path::stem treats a leading dot as part of the name.
 */
#include "wrapcc/support/path.h"

#include <filesystem>
#include <string>

namespace wrapcc {
namespace support {

std::string StripExtension(const std::string& name) {
  return std::filesystem::path(name).stem().string();
}

}  // namespace support
}  // namespace wrapcc
