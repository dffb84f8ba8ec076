/***
 * Name: wrapcc::classify::ArgumentClassifier::ConsumeLinkingGroup
 * Purpose: Pass a -Wl,--start-group ... -Wl,--end-group block to the link step verbatim.
 * Inputs: opener (the start marker, already popped)
 * Outputs: The group, markers included, appended to link_args as one block
 * Theory of Operation: Greedy pop up to and including the end marker. A missing end
 *   marker is tolerated: a warning is logged and the captured tokens are flushed.
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/classify/handlers.h"

#include <string>
#include <vector>

namespace wrapcc {
namespace classify {

void ArgumentClassifier::ConsumeLinkingGroup(const std::string& opener) {
  std::vector<std::string> group;
  bool terminated = false;
  while (!queue_.Empty()) {
    group.push_back(queue_.Pop());
    if (group.back() == kEndGroup) {
      terminated = true;
      break;
    }
  }
  if (!terminated) {
    log_.Warning(std::string("did not find a closing \"") + kEndGroup + "\" to match \"" + opener + "\"");
  }
  HandlerContext ctx{result_, log_};
  handlers::LinkingGroup(ctx, opener, group);
}

}  // namespace classify
}  // namespace wrapcc
