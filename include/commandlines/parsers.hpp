/**
 * @file parsers.hpp
 * @brief commandlines classifiers: stateless argv scanners for options, definitions and idioms.
 *
 * This header declares the leaf layer of the library: a handful of free functions that each
 * take the full, ordered argument list of a process (index 0 is the executable path) and
 * produce exactly one classification of it. `commandlines::Command` calls every one of them
 * once at construction and stores the results; nothing here keeps state between calls.
 *
 * ---
 *
 * @section commandlines_parsers_tokens Token Rules
 *
 * - **Option**: starts with `-`, is not exactly `-` and is not exactly `--`
 *   - short option: one leading hyphen (`-o`, `-abc`)
 *   - long option: two leading hyphens (`--output`)
 * - **Definition option**: an option containing `=`; it is split on the FIRST `=` only
 *   - `--opt=val`   → `--opt` / `val`
 *   - `--opt=a=b`   → `--opt` / `a=b`
 *   - `--opt=`      → `--opt` / `` (empty definition is valid)
 * - **Double hyphen** (`--`): exact match only. Option and definition scanning stops here;
 *   everything after it is raw positional data.
 * - **Single hyphen** (`-`): the POSIX stdin/stdout placeholder, never an option.
 * - **Mops** (multi-option short syntax): `-abc` is read as `-a -b -c`.
 *
 * ---
 *
 * @section commandlines_parsers_example Example
 *
 * ```cpp
 * std::vector<std::string> argv{"app", "-o", "--mode=fast", "--", "-x"};
 *
 * auto opts = commandlines::parsers::parse_options(argv);        // {"-o", "--mode"}
 * auto defs = commandlines::parsers::parse_definitions(argv);    // {"--mode" → "fast"}
 * auto tail = commandlines::parsers::parse_double_hyphen_args(argv); // {"-x"}
 * ```
 *
 * ---
 *
 * @section commandlines_parsers_limits Limitations
 *
 * - Mops expansion walks UTF-8 scalar values, so a multi-byte character is kept whole,
 *   but option syntax is otherwise assumed to be Basic Latin.
 * - No schema: a token after `-o` is never treated as the value of `-o`. Callers use
 *   `Command::get_arg_after()` for that.
 */

#ifndef COMMANDLINES_PARSERS_HPP
#define COMMANDLINES_PARSERS_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace commandlines {
namespace parsers {

/// Ordered argument list; index 0 is the executable path.
using ArgVector = std::vector<std::string>;

/// Option name → definition value.
using DefinitionMap = std::map<std::string, std::string>;

/// The POSIX end-of-options sentinel.
static constexpr const char* DOUBLE_HYPHEN = "--";

/// The POSIX stdin/stdout placeholder.
static constexpr const char* SINGLE_HYPHEN = "-";

/**
 * @brief Ordered option names found before the first `--`.
 *
 * Definition options contribute only their name (`--opt=val` → `--opt`).
 * `-` is skipped; scanning stops entirely at the first `--`. argv[0] is never an option.
 *
 * @param argv Full argument list.
 * @return Option names in argv order (possibly empty).
 */
std::vector<std::string> parse_options(const ArgVector& argv);

/**
 * @brief Option name → definition value for every definition option before the first `--`.
 *
 * When the same name is defined twice, the later occurrence wins.
 *
 * @param argv Full argument list.
 * @return Definition map (possibly empty).
 */
DefinitionMap parse_definitions(const ArgVector& argv);

/// @brief argv[1] if present.
std::optional<std::string> parse_first_arg(const ArgVector& argv);

/// @brief argv[argc - 1] if argc > 1; never the executable.
std::optional<std::string> parse_last_arg(const ArgVector& argv);

/**
 * @brief Every token strictly after the first `--`.
 *
 * Returned tokens are not interpreted; `--keep` after the sentinel stays `--keep`.
 *
 * @param argv Full argument list.
 * @return The trailing tokens, or `std::nullopt` when there is no `--` or nothing follows it.
 */
std::optional<std::vector<std::string>> parse_double_hyphen_args(const ArgVector& argv);

/**
 * @brief Expand short options written with multi-option short syntax.
 *
 * Operates on the output of parse_options(), so it inherits the `--` cut-off.
 * Long options are ignored. `-abc` becomes `-a`, `-b`, `-c`; `-l` passes through.
 *
 * @param options Option names as produced by parse_options().
 * @return Expanded short options, or `std::nullopt` when no short option was present.
 */
std::optional<std::vector<std::string>> parse_mops(const std::vector<std::string>& options);

/**
 * @brief argv index of the rightmost option token before the first `--`.
 * @param argv Full argument list.
 * @return The index, or 0 when no option is present.
 */
std::size_t parse_last_option_index(const ArgVector& argv);

/// @brief True for `-x`, `--xyz`, `-x=1`; false for `-`, `--` and anything not starting with `-`.
bool is_option(const std::string& token);

/// @brief True when `token` contains `=`.
bool is_definition_option(const std::string& token);

/// @brief True for an option with exactly one leading hyphen.
bool is_short_option(const std::string& token);

/// @brief True for an option with two leading hyphens.
bool is_long_option(const std::string& token);

/// @brief True when `token` is exactly `--`.
bool is_double_hyphen(const std::string& token);

/// @brief True when `token` is exactly `-`.
bool is_single_hyphen(const std::string& token);

/**
 * @brief Split a definition option on its first `=`.
 *
 * Only call this after is_definition_option() returned true.
 *
 * @param token e.g. `--opt=a=b`.
 * @return `{"--opt", "a=b"}`.
 * @throws std::invalid_argument if `token` contains no `=`.
 */
std::pair<std::string, std::string> get_definition_parts(const std::string& token);

} // namespace parsers
} // namespace commandlines

#endif // COMMANDLINES_PARSERS_HPP
