/***
 * Name: wrapcc::support (logger)
 * Purpose: Leveled diagnostic output for the classifier and the CLI.
 * Inputs: Message level, message text, destination stream
 * Outputs: `wrapcc: <level>: <message>` lines on the sink
 * Theory of Operation: A Logger holds a non-owning stream pointer and a threshold;
 *   messages below the threshold are discarded. Levels are parsed from option values
 *   and from the WRAPCC_OUTPUT_LEVEL environment variable.
 */
#pragma once

#include <iosfwd>
#include <string_view>

namespace wrapcc {
namespace support {

enum class LogLevel { Debug, Info, Warning, Error, Silent };

class Logger {
 public:
  explicit Logger(std::ostream& sink, LogLevel threshold = LogLevel::Warning);

  void Log(LogLevel level, std::string_view message) const;
  bool Enabled(LogLevel level) const;

  void Debug(std::string_view message) const { Log(LogLevel::Debug, message); }
  void Info(std::string_view message) const { Log(LogLevel::Info, message); }
  void Warning(std::string_view message) const { Log(LogLevel::Warning, message); }
  void Error(std::string_view message) const { Log(LogLevel::Error, message); }

  LogLevel threshold() const { return threshold_; }

 private:
  std::ostream* sink_;
  LogLevel threshold_;
};

/*** LogLevelName: Lower-case name used in message prefixes. */
const char* LogLevelName(LogLevel level);

/*** ParseLogLevel: Case-insensitive name to level; unknown names fall back to Warning. */
LogLevel ParseLogLevel(std::string_view name);

/*** LogLevelFromEnv: Level named by WRAPCC_OUTPUT_LEVEL, or fallback when unset/empty. */
LogLevel LogLevelFromEnv(LogLevel fallback);

}  // namespace support
}  // namespace wrapcc
