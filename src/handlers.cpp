#include "handlers.hpp"

#include <string>

#include "active_rule_set.hpp"
#include "core/resolution_engine.hpp"
#include "health.hpp"
#include "protocol_convert.hpp"
#include "transport/framed_stdio.hpp"

namespace handlers {

using rule_advisor::v1::EvaluateRequest;
using rule_advisor::v1::GetHealthRequest;
using rule_advisor::v1::HelloRequest;
using rule_advisor::v1::ListRulesRequest;
using rule_advisor::v1::Status;

static inline void set_status_ok(rule_advisor::v1::Response &resp) {
  resp.mutable_status()->set_code(Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

static inline void set_status(rule_advisor::v1::Response &resp,
                              Status::Code code, const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

void handle_hello(const HelloRequest &req, rule_advisor::v1::Response &resp) {
  if (req.protocol_version() != "v1") {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  auto *hello = resp.mutable_hello();
  hello->set_protocol_version("v1");
  hello->set_provider_name("rule-advisor");
  hello->set_provider_version("0.1.0");

  (*hello->mutable_metadata())["transport"] = "stdio+uint32_le";
  (*hello->mutable_metadata())["max_frame_bytes"] =
      std::to_string(transport::kMaxFrameBytes);
  (*hello->mutable_metadata())["supports_inline_rules"] = "true";

  set_status_ok(resp);
}

void handle_evaluate(const EvaluateRequest &req,
                     rule_advisor::v1::Response &resp) {
  rule_advisor::FactMap facts;
  for (const auto &kv : req.facts()) {
    auto value = protocol_convert::from_wire(kv.second);
    if (!value) {
      set_status(resp, Status::CODE_INVALID_ARGUMENT,
                 "fact '" + kv.first + "' has no value");
      return;
    }
    facts.emplace(kv.first, *value);
  }

  const auto active = rule_advisor::ActiveRuleSet::snapshot();

  rule_advisor::RuleSet inline_rules;
  if (req.use_inline_rules()) {
    inline_rules.reserve(static_cast<size_t>(req.rules_size()));
    for (const auto &r : req.rules()) {
      inline_rules.push_back(protocol_convert::from_wire(r));
    }
  } else if (!active.installed) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "no active rule set; send use_inline_rules");
    return;
  }

  rule_advisor::DiagnosticSink sink;
  if (active.log_comparison_faults) {
    sink = rule_advisor::log_comparison_fault;
  }

  const auto result = rule_advisor::resolve(
      facts, req.use_inline_rules() ? inline_rules : active.rules, sink);

  auto *out = resp.mutable_evaluate();
  out->mutable_decision()->set_decision(result.action.decision);
  out->mutable_decision()->set_reason(result.action.reason);
  out->set_matched(result.matched);
  for (const auto &rule : result.fired) {
    protocol_convert::to_wire(rule, out->add_fired());
  }

  set_status_ok(resp);
}

void handle_list_rules(const ListRulesRequest & /*req*/,
                       rule_advisor::v1::Response &resp) {
  const auto active = rule_advisor::ActiveRuleSet::snapshot();
  if (!active.installed) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "no active rule set");
    return;
  }

  auto *out = resp.mutable_list_rules();
  out->set_source(active.source);
  for (const auto &rule : active.rules) {
    protocol_convert::to_wire(rule, out->add_rules());
  }

  set_status_ok(resp);
}

void handle_get_health(const GetHealthRequest & /*req*/,
                       rule_advisor::v1::Response &resp) {
  auto *out = resp.mutable_get_health();
  *out->mutable_provider() =
      advisor_health::make_provider_health(
          rule_advisor::ActiveRuleSet::snapshot());

  set_status_ok(resp);
}

void handle_unimplemented(rule_advisor::v1::Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "operation not implemented");
}

void dispatch(const rule_advisor::v1::Request &req,
              rule_advisor::v1::Response &resp) {
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  if (req.has_hello()) {
    handle_hello(req.hello(), resp);
  } else if (req.has_evaluate()) {
    handle_evaluate(req.evaluate(), resp);
  } else if (req.has_list_rules()) {
    handle_list_rules(req.list_rules(), resp);
  } else if (req.has_get_health()) {
    handle_get_health(req.get_health(), resp);
  } else {
    handle_unimplemented(resp);
  }
}

} // namespace handlers
