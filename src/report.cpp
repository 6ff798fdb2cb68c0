#include "report.hpp"

#include <sstream>
#include <yaml-cpp/yaml.h>

#include "rules_yaml.hpp"

namespace rule_advisor {

std::string decision_banner(const std::string &decision) {
  if (decision == "AWARD FULL") {
    return "FULL SCHOLARSHIP RECOMMENDED";
  } else if (decision == "AWARD PARTIAL") {
    return "PARTIAL SCHOLARSHIP RECOMMENDED";
  } else if (decision == "REJECT") {
    return "REJECTION RECOMMENDED";
  } else {
    return "MANUAL REVIEW REQUIRED";
  }
}

static std::string action_decision(const Rule &rule) {
  return rule.action ? rule.action->decision : "(none)";
}

std::string render_text_report(const FactMap &facts,
                               const MatchResult &result) {
  std::ostringstream out;

  out << "Applicant facts:\n";
  for (const auto &kv : facts) {
    out << "  " << kv.first << ": " << kv.second.to_string() << "\n";
  }

  out << "\n" << decision_banner(result.action.decision) << "\n";
  out << "Decision: " << result.action.decision << "\n";
  out << "Reason: "
      << (result.action.reason.empty() ? "No reason provided."
                                       : result.action.reason)
      << "\n\n";

  out << "Fired rules (match history):\n";
  if (result.fired.empty()) {
    out << "  No rules matched the applicant's profile.\n";
    return out.str();
  }

  for (std::size_t i = 0; i < result.fired.size(); ++i) {
    const Rule &rule = result.fired[i];
    out << "  " << (i + 1) << ". " << rule.name
        << " (priority: " << rule.priority << ")"
        << (i == 0 ? " [winner]" : "") << "\n";
    out << "     decision: " << action_decision(rule) << "\n";
    for (const auto &cond : rule.conditions) {
      out << "     - " << describe(cond) << "\n";
    }
  }

  return out.str();
}

std::string render_yaml_report(const FactMap &facts,
                               const MatchResult &result) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "facts" << YAML::Value << YAML::BeginMap;
  for (const auto &kv : facts) {
    out << YAML::Key << kv.first << YAML::Value;
    emit_value(out, kv.second);
  }
  out << YAML::EndMap;

  out << YAML::Key << "decision" << YAML::Value << result.action.decision;
  out << YAML::Key << "reason" << YAML::Value << result.action.reason;
  out << YAML::Key << "banner" << YAML::Value
      << decision_banner(result.action.decision);
  out << YAML::Key << "matched" << YAML::Value << result.matched;

  out << YAML::Key << "fired" << YAML::Value << YAML::BeginSeq;
  for (const auto &rule : result.fired) {
    emit_rule(out, rule);
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return out.c_str();
}

} // namespace rule_advisor
