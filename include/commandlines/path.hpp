#pragma once
/**
 * @file path.hpp
 * @brief Filesystem path helpers for option values and positional arguments.
 *
 * Option values are plain strings; these helpers turn them into `std::filesystem::path`
 * so callers can ask for the parent directory, swap the filename, and so on.
 *
 * @code
 * if (auto out = cmd.get_definition_for("--output")) {
 *     auto dir = commandlines::path::make_path_from(*out).parent_path();
 * }
 * @endcode
 */

#include <filesystem>
#include <string_view>

namespace commandlines {
namespace path {

/// @brief Path view of `pathstring`, e.g. for `parent_path()` / `extension()` queries.
std::filesystem::path make_path_from(std::string_view pathstring);

/// @brief Path built from `pathstring` for the caller to modify (`replace_filename()`, `/=`).
std::filesystem::path make_mut_path_from(std::string_view pathstring);

} // namespace path
} // namespace commandlines
