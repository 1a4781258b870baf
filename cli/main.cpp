/**
 * @file main.cpp
 * @brief commandlines-inspect: show how commandlines classifies an argument list.
 *
 * Responsibilities:
 *  - Parse the tool's own options (CLI11) and collect the list to classify as positionals.
 *  - Build a commandlines::Command from that list (first token = executable).
 *  - Print it as pretty text, JSON or the raw one-line form.
 *  - With --query, answer option / definition / argument lookups for each needle.
 *
 * Usage:
 *   commandlines-inspect [--format pretty|json|raw] [--no-color] [--query NEEDLE]... -- app [args...]
 *
 * Notes:
 *  - Tokens that start with '-' must come after "--" or CLI11 takes them as our own options.
 *  - A second "--" inside the inspected list is kept and classified normally.
 *  - Needles that start with '-' are passed as --query=-o.
 */

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "commandlines/command.hpp"
#include "commandlines/serializer.hpp"

using json = nlohmann::json;
using namespace commandlines;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string quoted(const std::string& s) { return "'" + s + "'"; }

static void print_list_pretty(const char* title, const std::vector<std::string>& items, const Ansi& ansi) {
  std::cout << ansi.bold(title) << "\n";
  if (items.empty()) { std::cout << "  " << ansi.dim("(none)") << "\n"; return; }
  for (const auto& it : items) std::cout << "  " << quoted(it) << "\n";
}

static void print_optional_list_pretty(const char* title,
                                       const std::optional<std::vector<std::string>>& items,
                                       const Ansi& ansi) {
  if (!items) {
    std::cout << ansi.bold(title) << "\n  " << ansi.dim("(absent)") << "\n";
    return;
  }
  print_list_pretty(title, *items, ansi);
}

static void print_definitions_pretty(const Command::DefinitionMap& defs, const Ansi& ansi) {
  std::cout << ansi.bold("definitions:") << "\n";
  if (defs.empty()) { std::cout << "  " << ansi.dim("(none)") << "\n"; return; }
  for (const auto& kv : defs) {
    std::cout << "  " << std::left << std::setw(16) << kv.first << " ";
    if (kv.second.empty()) std::cout << ansi.dim("[empty]") << "\n";
    else                   std::cout << quoted(kv.second) << "\n";
  }
}

static std::string opt_or_dash(const std::optional<std::string>& v) {
  return v ? quoted(*v) : std::string("-");
}

static void print_command_pretty(const Command& cmd, const Ansi& ansi) {
  std::cout << cmd << "\n\n";
  std::cout << ansi.bold("executable: ") << quoted(cmd.get_executable()) << "  "
            << ansi.dim("(argc=" + std::to_string(cmd.argc()) + ")") << "\n";
  std::cout << ansi.bold("first:      ") << opt_or_dash(cmd.get_arg_first()) << "\n";
  std::cout << ansi.bold("last:       ") << opt_or_dash(cmd.get_arg_last()) << "\n\n";

  print_list_pretty("options:", cmd.options(), ansi);
  print_definitions_pretty(cmd.definitions(), ansi);
  print_optional_list_pretty("mops:", cmd.mops(), ansi);
  print_optional_list_pretty("after --:", cmd.get_double_hyphen_args(), ansi);

  std::cout << "\n" << ansi.bold("last option index: ") << cmd.get_index_of_last_option() << "\n";
  std::cout << ansi.bold("help/version/usage: ")
            << (cmd.is_help_request() ? "help " : "")
            << (cmd.is_version_request() ? "version " : "")
            << (cmd.is_usage_request() ? "usage " : "")
            << ((cmd.is_help_request() || cmd.is_version_request() || cmd.is_usage_request())
                  ? "" : ansi.dim("(none)"))
            << "\n";
}

// One JSON object per needle with every lookup that takes a single needle.
static json query_json(const Command& cmd, const std::string& needle) {
  json q;
  q["contains_arg"]        = cmd.contains_arg(needle);
  q["contains_option"]     = cmd.contains_option(needle);
  q["contains_definition"] = cmd.contains_definition(needle);
  q["contains_mops"]       = cmd.contains_mops(needle);

  auto idx = cmd.get_index_of(needle);
  q["index_of"] = idx ? json(*idx) : json(nullptr);
  auto after = cmd.get_arg_after(needle);
  q["arg_after"] = after ? json(*after) : json(nullptr);
  auto rest = cmd.get_args_after(needle);
  q["args_after"] = rest ? json(*rest) : json(nullptr);
  auto def = cmd.get_definition_for(needle);
  q["definition"] = def ? json(*def) : json(nullptr);
  return q;
}

static void print_query_pretty(const std::string& needle, const json& q, const Ansi& ansi) {
  std::cout << ansi.bold("query " + quoted(needle)) << "\n";
  for (auto it = q.begin(); it != q.end(); ++it) {
    std::cout << "  " << std::left << std::setw(20) << it.key() << " ";
    if (it.value().is_null()) std::cout << ansi.dim("(absent)") << "\n";
    else                      std::cout << it.value().dump() << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json|raw
  bool opt_no_color = false;
  std::vector<std::string> opt_queries;
  std::vector<std::string> inspected;

  CLI::App app{"commandlines-inspect: classify an argument list"};

  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->capture_default_str()
     ->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--query", opt_queries, "Needle to look up (repeatable; use --query=-o for dashed needles)")
     ->allow_extra_args(false);
  app.add_option("argv", inspected, "Argument list to classify; the first token is the executable")
     ->required();

  CLI11_PARSE(app, argc, argv);

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  try {
    Command cmd(inspected);

    if (opt_format=="json") {
      json j = serializer::to_json(cmd);
      if (!opt_queries.empty()) {
        json qs = json::object();
        for (const auto& n : opt_queries) qs[n] = query_json(cmd, n);
        j["queries"] = qs;
      }
      std::cout << j.dump(2) << "\n";
    } else if (opt_format=="raw") {
      std::cout << cmd.to_string() << "\n";
    } else {
      print_command_pretty(cmd, ansi);
      for (const auto& n : opt_queries) {
        std::cout << "\n";
        print_query_pretty(n, query_json(cmd, n), ansi);
      }
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << ansi.red("status=error reason=invalid_argv") << " detail=" << quoted(e.what()) << "\n";
    return 2;
  }

  return 0;
}
