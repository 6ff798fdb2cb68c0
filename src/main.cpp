#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "active_rule_set.hpp"
#include "config.hpp"
#include "core/default_policy.hpp"
#include "core/resolution_engine.hpp"
#include "handlers.hpp"
#include "report.hpp"
#include "rule_advisor.pb.h"
#include "rules_yaml.hpp"
#include "transport/framed_stdio.hpp"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "rule-advisor: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: rule-advisor [--config <advisor.yaml>] [--rules <rules.yaml>] "
          "[--facts <facts.yaml>] [--output text|yaml] [--dump-default-rules]");
}

static int serve(const rule_advisor::RuleSetSelection &selection) {
  set_binary_mode_stdio();
  log_err("serving " + std::to_string(selection.rules.size()) +
          " rules from " + selection.source +
          " (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    frame.clear();
    const auto status = transport::read_frame(std::cin, frame, io_err);
    if (status == transport::ReadStatus::Eof) {
      log_err("EOF on stdin; exiting cleanly");
      return 0;
    }
    if (status == transport::ReadStatus::Error) {
      log_err("read_frame error: " + io_err);
      return 2;
    }

    rule_advisor::v1::Request req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      log_err("failed to parse Request protobuf");
      return 3;
    }

    rule_advisor::v1::Response resp;
    handlers::dispatch(req, resp);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      return 4;
    }

    if (!transport::write_frame(std::cout, resp_bytes, io_err)) {
      log_err("write_frame error: " + io_err);
      return 5;
    }
  }
}

int main(int argc, char **argv) {
  // Parse command-line arguments
  std::optional<std::string> config_path;
  std::optional<std::string> rules_path;
  std::optional<std::string> facts_path;
  std::string output = "text";
  bool dump_default_rules = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--rules" && i + 1 < argc) {
      rules_path = argv[++i];
    } else if (arg == "--facts" && i + 1 < argc) {
      facts_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output = argv[++i];
    } else if (arg == "--dump-default-rules") {
      dump_default_rules = true;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (output != "text" && output != "yaml") {
    log_err("invalid --output value: " + output);
    print_usage();
    return 1;
  }

  if (dump_default_rules) {
    std::cout << rule_advisor::emit_rule_set_yaml(
                     rule_advisor::default_rule_set())
              << "\n";
    return 0;
  }

  // Load configuration and pick the rule set
  rule_advisor::AdvisorConfig config;
  rule_advisor::RuleSetSelection selection;
  try {
    if (config_path) {
      log_err("loading configuration from: " + *config_path);
      config = rule_advisor::load_config(*config_path);
    }
    if (rules_path) {
      config.rules_path = *rules_path;
    }
    selection = rule_advisor::select_rule_set(config);
    log_err("loaded " + std::to_string(selection.rules.size()) +
            " rules from " + selection.source);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return 1;
  }

  rule_advisor::ActiveRuleSet::install(selection, config.log_comparison_faults);

  if (!facts_path) {
    return serve(selection);
  }

  // One-shot evaluation
  rule_advisor::FactMap facts;
  try {
    facts = rule_advisor::load_facts(*facts_path);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load facts: " + std::string(e.what()));
    return 1;
  }

  rule_advisor::DiagnosticSink sink;
  if (config.log_comparison_faults) {
    sink = rule_advisor::log_comparison_fault;
  }
  const auto result = rule_advisor::resolve(facts, selection.rules, sink);

  if (output == "yaml") {
    std::cout << rule_advisor::render_yaml_report(facts, result) << "\n";
  } else {
    std::cout << rule_advisor::render_text_report(facts, result);
  }
  return 0;
}
