/***
 * Name: wrapcc::support (parse_util)
 * Purpose: Small helpers for parsing textual option values.
 * Inputs: std::string_view inputs, outputs via refs/pointers
 * Outputs: Parsed values and status booleans
 * Theory of Operation: Non-throwing; callers decide how to report the error text.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace wrapcc {
namespace support {

/*** ParseArity: Parse a non-empty run of base-10 digits; set err on failure. */
bool ParseArity(std::string_view text, std::size_t& value, std::string* err);

}  // namespace support
}  // namespace wrapcc
