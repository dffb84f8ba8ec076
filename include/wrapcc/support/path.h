/***
 * Name: wrapcc::support (path)
 * Purpose: Path-string helpers used to derive artifact names.
 * Inputs: Paths as opaque strings
 * Outputs: Derived strings; the filesystem is never touched
 * Theory of Operation: Thin wrappers over std::filesystem::path lexical operations.
 */
#pragma once

#include <string>

namespace wrapcc {
namespace support {

/*** BaseName: Final path component ("dir/x.cpp" -> "x.cpp"; "dir/" -> ""). */
std::string BaseName(const std::string& path);

/*** DirName: Everything before the final component, without trailing separator. */
std::string DirName(const std::string& path);

/*** StripExtension: Drop the final extension of a base name ("a.tar.gz" -> "a.tar"; ".rc" -> ".rc"). */
std::string StripExtension(const std::string& name);

/*** JoinPath: Join dir and name; an empty dir yields name unchanged. */
std::string JoinPath(const std::string& dir, const std::string& name);

}  // namespace support
}  // namespace wrapcc
