#include "active_rule_set.hpp"

#include <mutex>

namespace rule_advisor {

namespace {

struct State {
  ActiveRuleSetState active;
  std::mutex mutex;
};

State &state() {
  static State s;
  return s;
}

} // namespace

void ActiveRuleSet::install(const RuleSetSelection &selection,
                            bool log_comparison_faults) {
  State &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.active.rules = selection.rules;
  s.active.source = selection.source;
  s.active.fell_back = selection.fell_back;
  s.active.error = selection.error;
  s.active.log_comparison_faults = log_comparison_faults;
  s.active.installed = true;
}

ActiveRuleSetState ActiveRuleSet::snapshot() {
  State &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.active;
}

bool ActiveRuleSet::is_installed() {
  State &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.active.installed;
}

void ActiveRuleSet::reset() {
  State &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.active = ActiveRuleSetState{};
}

} // namespace rule_advisor
