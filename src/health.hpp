#pragma once

#include <string>

#include "active_rule_set.hpp"
#include "rule_advisor.pb.h"

namespace advisor_health {

inline rule_advisor::v1::ProviderHealth
make_provider_health(const rule_advisor::ActiveRuleSetState &active) {
  rule_advisor::v1::ProviderHealth h;
  if (!active.installed) {
    h.set_state(rule_advisor::v1::ProviderHealth::STATE_DEGRADED);
    h.set_message("no rule set installed");
  } else if (active.fell_back) {
    h.set_state(rule_advisor::v1::ProviderHealth::STATE_DEGRADED);
    h.set_message("configured rules rejected, using built-in rule set: " +
                  active.error);
  } else {
    h.set_state(rule_advisor::v1::ProviderHealth::STATE_OK);
    h.set_message("ok");
  }
  (*h.mutable_metrics())["rule_count"] = std::to_string(active.rules.size());
  (*h.mutable_metrics())["rule_source"] = active.source;
  return h;
}

} // namespace advisor_health
