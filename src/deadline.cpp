#include "trialbox/deadline.hpp"

#include "trialbox/types.hpp"

namespace trialbox {

void Deadline::check(const std::string& operation) const {
  if (!expired()) return;
  throw Error(ErrorCode::timeout,
              operation + " timed out after " + std::to_string(budget_sec()) + " seconds");
}

}  // namespace trialbox
