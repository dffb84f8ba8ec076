/***
 * Name: wrapcc::classify::handlers (phase routing and rejections)
 * Purpose: Route flags and their arguments to the compile and/or link step, or drop them.
 * Inputs: HandlerContext, flag, trailing args
 * Outputs: Appends to compile_args, link_args or forbidden_args
 * Theory of Operation: Binary variants keep the flag and every consumed argument together
 *   and in order. Abort raises AbortError for flags the wrapper cannot honor at all.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/exceptions/abort_error.h"

#include <string>
#include <vector>

namespace wrapcc {
namespace classify {
namespace handlers {

static std::string JoinArgs(const Args& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) { joined += ' '; }
    joined += arg;
  }
  return joined;
}

static void Append(std::vector<std::string>& dst, const std::string& flag, const Args& args) {
  dst.push_back(flag);
  dst.insert(dst.end(), args.begin(), args.end());
}

void CompileUnary(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("compile unary: " + flag);
  }
  ctx.result.compile_args.push_back(flag);
}

void CompileBinary(HandlerContext& ctx, const std::string& flag, const Args& args) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("compile binary: " + flag + " " + JoinArgs(args));
  }
  Append(ctx.result.compile_args, flag, args);
}

void LinkUnary(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("link unary: " + flag);
  }
  ctx.result.link_args.push_back(flag);
}

void LinkBinary(HandlerContext& ctx, const std::string& flag, const Args& args) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("link binary: " + flag + " " + JoinArgs(args));
  }
  Append(ctx.result.link_args, flag, args);
}

// Coverage and similar flags are needed by both steps.
void CompileLinkUnary(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("compile+link unary: " + flag);
  }
  ctx.result.compile_args.push_back(flag);
  ctx.result.link_args.push_back(flag);
}

void LinkingGroup(HandlerContext& ctx, const std::string& flag, const Args& args) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("linking group: " + flag + " " + JoinArgs(args));
  }
  Append(ctx.result.link_args, flag, args);
}

void Forbidden(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  ctx.log.Warning("the flag \"" + flag + "\" cannot be used with this tool; ignoring it");
  ctx.result.forbidden_args.push_back(flag);
}

void IgnoreBinary(HandlerContext& ctx, const std::string& flag, const Args& args) {
  ctx.log.Warning("ignoring compiler arg pair: \"" + flag + " " + JoinArgs(args) + "\"");
}

void Abort(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  ctx.log.Warning("out of context experience: \"" + flag + "\"");
  throw exceptions::AbortError("cannot handle flag '" + flag + "'");
}

}  // namespace handlers
}  // namespace classify
}  // namespace wrapcc
