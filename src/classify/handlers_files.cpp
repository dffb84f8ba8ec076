/***
 * Name: wrapcc::classify::handlers (files and streams)
 * Purpose: Record inputs, objects, the output path and stdin sources.
 * Inputs: HandlerContext, flag (the token itself for pattern matches), trailing args
 * Outputs: Appends to input_files/object_files or sets output_filename/is_standard_in
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/exceptions/config_error.h"

#include <string>

namespace wrapcc::classify::handlers {

void StandardIn(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("standard input: " + flag);
  }
  ctx.result.is_standard_in = true;
}

void OutputFile(HandlerContext& ctx, const std::string& flag, const Args& args) {
  if (args.empty()) {
    throw exceptions::ConfigError("handler 'output-file' bound to '" + flag + "' needs arity 1");
  }
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("output file: " + flag + " " + args.front());
  }
  ctx.result.output_filename = args.front();
}

void InputFile(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("input file: " + flag);
  }
  ctx.result.input_files.push_back(flag);
  if (flag.size() > 2 && flag[flag.size() - 2] == '.') {
    const char suffix = flag.back();
    if (suffix == 's' || suffix == 'S') {
      ctx.result.is_assembly = true;
    }
  }
}

void ObjectFile(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("object file: " + flag);
  }
  ctx.result.object_files.push_back(flag);
}

}  // namespace wrapcc::classify::handlers
