/**
 * @file parsers.cpp
 * @brief Classifier implementations (single pass scanners over argv).
 *
 * Refer to parsers.hpp for the token rules. Every scanner here:
 *   - starts at argv[1] (argv[0] is the executable, never an option)
 *   - stops at the first exact `--` unless it is the trailing-argument scanner
 *   - allocates only its own result
 */
#include "commandlines/parsers.hpp"

#include <algorithm>
#include <stdexcept>

namespace commandlines {
namespace parsers {

namespace {

// Byte length of the UTF-8 sequence introduced by `lead`.
// Continuation or invalid lead bytes count as a single byte so that
// malformed input still advances.
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80)           return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// Split a string into its UTF-8 scalar values, one string per value.
std::vector<std::string> split_scalars(const std::string& s) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t n = utf8_sequence_length(static_cast<unsigned char>(s[i]));
        n = std::min(n, s.size() - i);
        out.push_back(s.substr(i, n));
        i += n;
    }
    return out;
}

} // namespace

bool is_double_hyphen(const std::string& token) {
    return token == DOUBLE_HYPHEN;
}

bool is_single_hyphen(const std::string& token) {
    return token == SINGLE_HYPHEN;
}

bool is_option(const std::string& token) {
    if (token.empty() || token[0] != '-') return false;
    return !is_single_hyphen(token) && !is_double_hyphen(token);
}

bool is_definition_option(const std::string& token) {
    return token.find('=') != std::string::npos;
}

bool is_short_option(const std::string& token) {
    return is_option(token) && token.compare(0, 2, "--") != 0;
}

bool is_long_option(const std::string& token) {
    return is_option(token) && token.compare(0, 2, "--") == 0;
}

std::pair<std::string, std::string> get_definition_parts(const std::string& token) {
    const std::size_t eq = token.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("definition option without '=': " + token);
    }
    return { token.substr(0, eq), token.substr(eq + 1) };
}


// parse_options(): option names in argv order
// -------------------------------------------
// "-" is skipped, "--" ends the scan. Definition options are reduced to
// the part before the first '='.
std::vector<std::string> parse_options(const ArgVector& argv) {
    std::vector<std::string> options;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (is_double_hyphen(arg)) break;
        if (!is_option(arg)) continue;

        if (is_definition_option(arg)) {
            options.push_back(get_definition_parts(arg).first);
        } else {
            options.push_back(arg);
        }
    }
    return options;
}


// parse_definitions(): name → value for "-x=..." / "--xyz=..."
// ------------------------------------------------------------
// Same cut-off as parse_options(). operator[] assignment means a repeated
// name keeps the value of its last occurrence.
DefinitionMap parse_definitions(const ArgVector& argv) {
    DefinitionMap definitions;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (is_double_hyphen(arg)) break;
        if (!is_option(arg) || !is_definition_option(arg)) continue;

        auto parts = get_definition_parts(arg);
        definitions[parts.first] = std::move(parts.second);
    }
    return definitions;
}

std::optional<std::string> parse_first_arg(const ArgVector& argv) {
    if (argv.size() > 1) return argv[1];
    return std::nullopt;
}

std::optional<std::string> parse_last_arg(const ArgVector& argv) {
    if (argv.size() > 1) return argv.back();
    return std::nullopt;
}


// parse_double_hyphen_args(): raw tail after the first "--"
// ---------------------------------------------------------
std::optional<std::vector<std::string>> parse_double_hyphen_args(const ArgVector& argv) {
    if (argv.size() < 2) return std::nullopt;

    auto it = std::find(argv.begin() + 1, argv.end(), DOUBLE_HYPHEN);
    if (it == argv.end() || it + 1 == argv.end()) return std::nullopt;

    return std::vector<std::string>(it + 1, argv.end());
}


// parse_mops(): expand "-abc" into "-a", "-b", "-c"
// -------------------------------------------------
// Input is the option list, so tokens after "--" never get here.
std::optional<std::vector<std::string>> parse_mops(const std::vector<std::string>& options) {
    std::vector<std::string> mops;
    for (const auto& opt : options) {
        if (!is_short_option(opt)) continue;

        const auto switches = split_scalars(opt.substr(1));
        if (switches.size() > 1) {
            for (const auto& sw : switches) {
                mops.push_back("-" + sw);
            }
        } else {
            mops.push_back(opt);
        }
    }

    if (mops.empty()) return std::nullopt;
    return mops;
}

std::size_t parse_last_option_index(const ArgVector& argv) {
    std::size_t last = 0;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        if (is_double_hyphen(argv[i])) break;
        if (is_option(argv[i])) last = i;
    }
    return last;
}

} // namespace parsers
} // namespace commandlines
