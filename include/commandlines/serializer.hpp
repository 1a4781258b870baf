#pragma once
/**
 * @file serializer.hpp
 * @brief JSON rendering of a classified Command.
 * @details
 *   Tools built on commandlines often need to show what was parsed (debug dumps, `--print`
 *   style output, test fixtures). This module turns a Command into a
 *   [nlohmann::json](https://github.com/nlohmann/json) object with one key per stored field:
 *
 *   @code
 *   {
 *     "argv": ["app", "-o", "--", "x"],
 *     "argc": 4,
 *     "executable": "app",
 *     "options": ["-o"],
 *     "definitions": {},
 *     "first_arg": "-o",
 *     "last_arg": "x",
 *     "double_hyphen_argv": ["x"],
 *     "mops": ["-o"],
 *     "last_option_index": 1
 *   }
 *   @endcode
 *
 *   Absent optionals become `null`, so "not used" and "used but empty" stay distinguishable.
 *   Rendering never fails for a constructed Command.
 */

#include <string>
#include <nlohmann/json.hpp>

#include "commandlines/command.hpp"

namespace commandlines {
namespace serializer {

/**
 * @brief Build the JSON object for `cmd`.
 * @param cmd  A constructed Command.
 * @return An object with keys argv, argc, executable, options, definitions, first_arg,
 *         last_arg, double_hyphen_argv, mops, last_option_index.
 */
nlohmann::json to_json(const Command& cmd);

/**
 * @brief to_json() dumped as text.
 * @param cmd     A constructed Command.
 * @param indent  Passed to nlohmann::json::dump(); -1 gives a single line.
 */
std::string to_json_string(const Command& cmd, int indent = -1);

} // namespace serializer
} // namespace commandlines
