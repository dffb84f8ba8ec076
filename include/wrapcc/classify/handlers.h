/***
 * Name: wrapcc::classify::handlers
 * Purpose: Stock handlers used by the default tables and available to caller overrides.
 * Inputs: HandlerContext, matched flag, consumed trailing tokens
 * Outputs: Mutations of ClassificationResult; diagnostics through ctx.log
 * Theory of Operation: Each handler is a free function with the Handler signature so it
 *   can be stored directly in a rule. Handlers that need trailing tokens throw ConfigError
 *   when a rule gives them fewer than they read.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wrapcc/classify/rules.h"

namespace wrapcc {
namespace classify {
namespace handlers {

using Args = std::vector<std::string>;

// Files and streams
void StandardIn(HandlerContext& ctx, const std::string& flag, const Args& args);
void OutputFile(HandlerContext& ctx, const std::string& flag, const Args& args);
void InputFile(HandlerContext& ctx, const std::string& flag, const Args& args);
void ObjectFile(HandlerContext& ctx, const std::string& flag, const Args& args);

// Mode switches
void CompileOnly(HandlerContext& ctx, const std::string& flag, const Args& args);
void PreprocessOnly(HandlerContext& ctx, const std::string& flag, const Args& args);
void AssembleOnly(HandlerContext& ctx, const std::string& flag, const Args& args);
void Verbose(HandlerContext& ctx, const std::string& flag, const Args& args);
void EmitLlvm(HandlerContext& ctx, const std::string& flag, const Args& args);
void DependencyOnly(HandlerContext& ctx, const std::string& flag, const Args& args);
void DependencyBinary(HandlerContext& ctx, const std::string& flag, const Args& args);

// Phase routing
void CompileUnary(HandlerContext& ctx, const std::string& flag, const Args& args);
void CompileBinary(HandlerContext& ctx, const std::string& flag, const Args& args);
void LinkUnary(HandlerContext& ctx, const std::string& flag, const Args& args);
void LinkBinary(HandlerContext& ctx, const std::string& flag, const Args& args);
void CompileLinkUnary(HandlerContext& ctx, const std::string& flag, const Args& args);
void LinkingGroup(HandlerContext& ctx, const std::string& flag, const Args& args);

// Rejections
void Forbidden(HandlerContext& ctx, const std::string& flag, const Args& args);
void IgnoreBinary(HandlerContext& ctx, const std::string& flag, const Args& args);
void Abort(HandlerContext& ctx, const std::string& flag, const Args& args);

/*** LookupHandler: Stock handler by its kebab-case name; throws ConfigError if unknown. */
Handler LookupHandler(std::string_view name);

/*** HandlerNames: Every name LookupHandler accepts, sorted. */
std::vector<std::string> HandlerNames();

}  // namespace handlers
}  // namespace classify
}  // namespace wrapcc
