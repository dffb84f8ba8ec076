/***
 * Name: wrapcc::classify::handlers (mode switches)
 * Purpose: Set the boolean mode flags of ClassificationResult.
 * Inputs: HandlerContext, flag, trailing args
 * Outputs: Flag mutations; dependency flags are also kept for the compile step
 * Theory of Operation: PreprocessOnly and AssembleOnly are terminal: the classifier
 *   stops as soon as either flag is set.
 */
#include "wrapcc/classify/handlers.h"

#include <string>

namespace wrapcc {
namespace classify {
namespace handlers {

void CompileOnly(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("compile only: " + flag);
  }
  ctx.result.is_compile_only = true;
}

void PreprocessOnly(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("preprocess only: " + flag);
  }
  ctx.result.is_preprocess_only = true;
}

void AssembleOnly(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("assemble only: " + flag);
  }
  ctx.result.is_assemble_only = true;
}

void Verbose(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("verbose: " + flag);
  }
  ctx.result.is_verbose = true;
}

void EmitLlvm(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("emit llvm: " + flag);
  }
  ctx.result.is_emit_llvm = true;
  ctx.result.is_compile_only = true;
}

void DependencyOnly(HandlerContext& ctx, const std::string& flag, const Args& /*args*/) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("dependency only: " + flag);
  }
  ctx.result.is_dependency_only = true;
  ctx.result.compile_args.push_back(flag);
}

void DependencyBinary(HandlerContext& ctx, const std::string& flag, const Args& args) {
  if (ctx.log.Enabled(support::LogLevel::Debug)) {
    ctx.log.Debug("dependency binary: " + flag);
  }
  ctx.result.is_dependency_only = true;
  ctx.result.compile_args.push_back(flag);
  ctx.result.compile_args.insert(ctx.result.compile_args.end(), args.begin(), args.end());
}

}  // namespace handlers
}  // namespace classify
}  // namespace wrapcc
