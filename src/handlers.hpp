#pragma once

#include "rule_advisor.pb.h"

namespace handlers {

void handle_hello(const rule_advisor::v1::HelloRequest &req,
                  rule_advisor::v1::Response &resp);

void handle_evaluate(const rule_advisor::v1::EvaluateRequest &req,
                     rule_advisor::v1::Response &resp);

void handle_list_rules(const rule_advisor::v1::ListRulesRequest &req,
                       rule_advisor::v1::Response &resp);

void handle_get_health(const rule_advisor::v1::GetHealthRequest &req,
                       rule_advisor::v1::Response &resp);

void handle_unimplemented(rule_advisor::v1::Response &resp);

// Route one request to its handler; resp carries request_id and a status
void dispatch(const rule_advisor::v1::Request &req,
              rule_advisor::v1::Response &resp);

} // namespace handlers
