/**
 * @file command.hpp
 * @brief commandlines Command: immutable, pre-classified view of a process argument list.
 *
 * A `Command` is built once from the raw argument list (index 0 = executable path). The
 * constructor runs every classifier in parsers.hpp exactly once and stores the results;
 * after that the object is never modified and every query is a read over stored fields.
 *
 * ## What a Command holds
 *
 *  - `argv` / `argc`        : the list itself and its length (argc ≥ 1)
 *  - `options`              : option names in argv order, up to the first `--`
 *  - `definitions`          : `--name=value` pairs, up to the first `--`
 *  - first / last argument  : argv[1] and argv[argc-1], when argc > 1
 *  - double hyphen argv     : everything after the first `--` (absent if nothing follows)
 *  - mops                   : short options expanded one switch per entry (absent if none)
 *  - last option index      : argv index of the rightmost option, or 0
 *
 * ## Absent vs empty
 * `get_double_hyphen_args()` and `mops()` return `std::optional`. An absent value means the
 * idiom was not used at all, which callers test before looking at the content.
 *
 * ## Example
 * @code
 * int main(int argc, char** argv) {
 *     auto cmd = commandlines::Command::from_main(argc, argv);
 *
 *     if (cmd.is_help_request()) { print_help(); return 0; }
 *     if (cmd.has_invalid_options({"-o", "--output", "-v"})) return 2;
 *
 *     if (auto out = cmd.get_definition_for("--output")) write_to(*out);
 *     else if (auto o = cmd.get_arg_after("-o"))         write_to(*o);
 *
 *     if (auto files = cmd.get_double_hyphen_args()) {
 *         for (const auto& f : *files) process(f);   // "-weird-name.txt" is safe here
 *     }
 * }
 * @endcode
 *
 * ## Threading
 * Nothing in a constructed Command changes, so it can be read from several threads.
 *
 * ## Testing hints
 * - `{"app"}`: has_args() false, no first/last, no options, last option index 0.
 * - `{"app","-o","--","--keep"}`: options `{"-o"}`, double hyphen argv `{"--keep"}`.
 * - `{"app","-hij","-l"}`: mops `{"-h","-i","-j","-l"}`.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace commandlines {

class Command {
public:
    using ArgVector     = std::vector<std::string>;
    using DefinitionMap = std::map<std::string, std::string>;

    /**
     * @brief Classify `argv` and keep it.
     * @param argv Full argument list; argv[0] is the executable path.
     * @throws std::invalid_argument if `argv` is empty.
     */
    explicit Command(ArgVector argv);

    /**
     * @brief Build from the parameters of `main`.
     * @throws std::invalid_argument if argc < 1 or argv is null.
     */
    static Command from_main(int argc, char** argv);

    // ---- stored fields ----

    const ArgVector&     argv() const { return argv_; }
    std::size_t          argc() const { return argc_; }
    const ArgVector&     options() const { return options_; }
    const DefinitionMap& definitions() const { return definitions_; }

    /// @brief Expanded short options; absent when no short option was given.
    const std::optional<ArgVector>& mops() const { return mops_; }

    // ---- presence ----

    /// @brief True if anything follows the executable.
    bool has_args() const;
    bool has_definitions() const;
    bool has_options() const;
    bool has_mops() const;
    bool has_double_hyphen_args() const;

    // ---- membership ----

    /// @brief Exact match against argv[1..]; the executable is not searched.
    bool contains_arg(const std::string& needle) const;
    bool contains_option(const std::string& needle) const;

    /// @brief True if `needle` was defined (`needle=...`).
    bool contains_definition(const std::string& needle) const;

    /// @brief Membership in the mops expansion; false when mops is absent.
    bool contains_mops(const std::string& needle) const;

    /**
     * @brief All / any needle found among the arguments.
     *
     * `contains_all_*` is true for an empty needle list.
     * `contains_any_*` is false for an empty needle list.
     */
    bool contains_all_args(const std::vector<std::string>& needles) const;
    bool contains_any_arg(const std::vector<std::string>& needles) const;

    bool contains_all_options(const std::vector<std::string>& needles) const;
    bool contains_any_option(const std::vector<std::string>& needles) const;

    bool contains_all_definitions(const std::vector<std::string>& needles) const;
    bool contains_any_definition(const std::vector<std::string>& needles) const;

    /// @brief Both return false whenever mops is absent, whatever the needles.
    bool contains_all_mops(const std::vector<std::string>& needles) const;
    bool contains_any_mops(const std::vector<std::string>& needles) const;

    /**
     * @brief True if argv[1..needles.size()] equals `needles`, in order and without gaps.
     *
     * Used for sub-command chains, e.g. `{"remote", "add"}` for `git remote add ...`.
     * False straight away if there are more needles than arguments.
     */
    bool contains_sequence(const std::vector<std::string>& needles) const;

    // ---- lookups ----

    /// @brief argv[index]; index 0 is the executable.
    std::optional<std::string> get_arg_at(std::size_t index) const;

    /// @brief argv index of the first exact match.
    std::optional<std::size_t> get_index_of(const std::string& needle) const;

    /**
     * @brief The token right after the first occurrence of `needle`.
     * @return Absent if `needle` is not in argv or is the last token.
     */
    std::optional<std::string> get_arg_after(const std::string& needle) const;

    /**
     * @brief Every token after the first occurrence of `needle`, to the end of argv.
     * @return Absent if `needle` is not in argv or is the last token.
     */
    std::optional<ArgVector> get_args_after(const std::string& needle) const;

    /// @brief Value of `needle=value`; an empty value is returned as an empty string.
    std::optional<std::string> get_definition_for(const std::string& needle) const;

    const std::string& get_executable() const { return executable_; }
    const std::optional<std::string>& get_arg_first() const { return first_arg_; }
    const std::optional<std::string>& get_arg_last() const { return last_arg_; }
    const std::optional<ArgVector>& get_double_hyphen_args() const { return double_hyphen_argv_; }

    /// @brief argv index of the rightmost option before `--`; 0 when there is none.
    std::size_t get_index_of_last_option() const { return last_option_index_; }

    // ---- conventions ----

    /// @brief `-h` or `--help` given.
    bool is_help_request() const;

    /// @brief `-v` or `--version` given.
    bool is_version_request() const;

    /// @brief `--usage` given.
    bool is_usage_request() const;

    // ---- validation ----

    /// @brief True if any parsed option is missing from `valid`. No options → false.
    bool has_invalid_options(const std::vector<std::string>& valid) const;

    /// @brief True if any definition name is missing from `valid`. No definitions → false.
    bool has_invalid_definitions(const std::vector<std::string>& valid) const;

    // ---- display ----

    /// @brief `Command: '<argv joined by spaces>'`.
    std::string to_string() const;

    bool operator==(const Command& other) const;
    bool operator!=(const Command& other) const { return !(*this == other); }

private:
    ArgVector                  argv_;
    std::size_t                argc_;
    std::string                executable_;
    ArgVector                  options_;
    DefinitionMap              definitions_;
    std::optional<std::string> first_arg_;
    std::optional<std::string> last_arg_;
    std::optional<ArgVector>   double_hyphen_argv_;
    std::optional<ArgVector>   mops_;
    std::size_t                last_option_index_;
};

/// @brief Writes Command::to_string().
std::ostream& operator<<(std::ostream& os, const Command& cmd);

} // namespace commandlines
