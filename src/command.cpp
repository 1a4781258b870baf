/**
 * @file command.cpp
 * @brief Command construction and queries.
 *
 * All classification happens in the constructor through parsers.hpp.
 * Queries below only read stored fields, except the argv-positional ones
 * (contains_arg, contains_sequence, get_arg_at, get_index_of, get_arg_after,
 * get_args_after) which need raw positions.
 */
#include "commandlines/command.hpp"
#include "commandlines/parsers.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace commandlines {

namespace {

Command::ArgVector require_executable(Command::ArgVector argv) {
    if (argv.empty()) {
        throw std::invalid_argument("commandlines::Command needs at least the executable path");
    }
    return argv;
}

bool in_list(const std::vector<std::string>& haystack, const std::string& needle) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

} // namespace

Command::Command(ArgVector argv)
    : argv_(require_executable(std::move(argv))),
      argc_(argv_.size()),
      executable_(argv_[0]),
      options_(parsers::parse_options(argv_)),
      definitions_(parsers::parse_definitions(argv_)),
      first_arg_(parsers::parse_first_arg(argv_)),
      last_arg_(parsers::parse_last_arg(argv_)),
      double_hyphen_argv_(parsers::parse_double_hyphen_args(argv_)),
      mops_(parsers::parse_mops(options_)),
      last_option_index_(parsers::parse_last_option_index(argv_)) {}

Command Command::from_main(int argc, char** argv) {
    if (argc < 1 || argv == nullptr) {
        throw std::invalid_argument("commandlines::Command::from_main: empty argument vector");
    }
    ArgVector args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }
    return Command(std::move(args));
}

// ---------- presence ----------

bool Command::has_args() const { return argc_ > 1; }
bool Command::has_definitions() const { return !definitions_.empty(); }
bool Command::has_options() const { return !options_.empty(); }
bool Command::has_mops() const { return mops_.has_value(); }
bool Command::has_double_hyphen_args() const { return double_hyphen_argv_.has_value(); }

// ---------- membership ----------

bool Command::contains_arg(const std::string& needle) const {
    return std::find(argv_.begin() + 1, argv_.end(), needle) != argv_.end();
}

bool Command::contains_option(const std::string& needle) const {
    return in_list(options_, needle);
}

bool Command::contains_definition(const std::string& needle) const {
    return definitions_.count(needle) != 0;
}

bool Command::contains_mops(const std::string& needle) const {
    return mops_ && in_list(*mops_, needle);
}

bool Command::contains_all_args(const std::vector<std::string>& needles) const {
    return std::all_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_arg(n); });
}

bool Command::contains_any_arg(const std::vector<std::string>& needles) const {
    return std::any_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_arg(n); });
}

bool Command::contains_all_options(const std::vector<std::string>& needles) const {
    return std::all_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_option(n); });
}

bool Command::contains_any_option(const std::vector<std::string>& needles) const {
    return std::any_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_option(n); });
}

bool Command::contains_all_definitions(const std::vector<std::string>& needles) const {
    return std::all_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_definition(n); });
}

bool Command::contains_any_definition(const std::vector<std::string>& needles) const {
    return std::any_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return contains_definition(n); });
}

bool Command::contains_all_mops(const std::vector<std::string>& needles) const {
    if (!mops_) return false;
    return std::all_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return in_list(*mops_, n); });
}

bool Command::contains_any_mops(const std::vector<std::string>& needles) const {
    if (!mops_) return false;
    return std::any_of(needles.begin(), needles.end(),
                       [this](const std::string& n) { return in_list(*mops_, n); });
}

bool Command::contains_sequence(const std::vector<std::string>& needles) const {
    if (needles.size() > argc_ - 1) return false;
    return std::equal(needles.begin(), needles.end(), argv_.begin() + 1);
}

// ---------- lookups ----------

std::optional<std::string> Command::get_arg_at(std::size_t index) const {
    if (index < argc_) return argv_[index];
    return std::nullopt;
}

std::optional<std::size_t> Command::get_index_of(const std::string& needle) const {
    auto it = std::find(argv_.begin(), argv_.end(), needle);
    if (it == argv_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - argv_.begin());
}

std::optional<std::string> Command::get_arg_after(const std::string& needle) const {
    auto idx = get_index_of(needle);
    if (!idx || *idx + 1 >= argc_) return std::nullopt;
    return argv_[*idx + 1];
}

std::optional<Command::ArgVector> Command::get_args_after(const std::string& needle) const {
    auto idx = get_index_of(needle);
    if (!idx || *idx + 1 >= argc_) return std::nullopt;
    return ArgVector(argv_.begin() + static_cast<std::ptrdiff_t>(*idx + 1), argv_.end());
}

std::optional<std::string> Command::get_definition_for(const std::string& needle) const {
    auto it = definitions_.find(needle);
    if (it == definitions_.end()) return std::nullopt;
    return it->second;
}

// ---------- conventions ----------

bool Command::is_help_request() const {
    return contains_any_option({"-h", "--help"});
}

bool Command::is_version_request() const {
    return contains_any_option({"-v", "--version"});
}

bool Command::is_usage_request() const {
    return contains_option("--usage");
}

// ---------- validation ----------

bool Command::has_invalid_options(const std::vector<std::string>& valid) const {
    return std::any_of(options_.begin(), options_.end(),
                       [&valid](const std::string& opt) { return !in_list(valid, opt); });
}

bool Command::has_invalid_definitions(const std::vector<std::string>& valid) const {
    return std::any_of(definitions_.begin(), definitions_.end(),
                       [&valid](const auto& kv) { return !in_list(valid, kv.first); });
}

// ---------- display ----------

std::string Command::to_string() const {
    std::ostringstream ss;
    ss << "Command: '";
    for (std::size_t i = 0; i < argc_; ++i) {
        if (i > 0) ss << ' ';
        ss << argv_[i];
    }
    ss << "'";
    return ss.str();
}

bool Command::operator==(const Command& other) const {
    return argv_ == other.argv_ &&
           argc_ == other.argc_ &&
           executable_ == other.executable_ &&
           options_ == other.options_ &&
           definitions_ == other.definitions_ &&
           first_arg_ == other.first_arg_ &&
           last_arg_ == other.last_arg_ &&
           double_hyphen_argv_ == other.double_hyphen_argv_ &&
           mops_ == other.mops_ &&
           last_option_index_ == other.last_option_index_;
}

std::ostream& operator<<(std::ostream& os, const Command& cmd) {
    return os << cmd.to_string();
}

} // namespace commandlines
