/**
 * @file serializer.cpp
 * @brief Command → nlohmann::json.
 */
#include "commandlines/serializer.hpp"

using nlohmann::json;

namespace commandlines {
namespace serializer {

namespace {

// Optional values map to null when absent.
template <typename T>
json optional_to_json(const std::optional<T>& value) {
    if (!value) return nullptr;
    return json(*value);
}

} // namespace

json to_json(const Command& cmd) {
    json j;
    j["argv"]               = cmd.argv();
    j["argc"]               = cmd.argc();
    j["executable"]         = cmd.get_executable();
    j["options"]            = cmd.options();
    j["definitions"]        = json::object();
    for (const auto& kv : cmd.definitions()) {
        j["definitions"][kv.first] = kv.second;
    }
    j["first_arg"]          = optional_to_json(cmd.get_arg_first());
    j["last_arg"]           = optional_to_json(cmd.get_arg_last());
    j["double_hyphen_argv"] = optional_to_json(cmd.get_double_hyphen_args());
    j["mops"]               = optional_to_json(cmd.mops());
    j["last_option_index"]  = cmd.get_index_of_last_option();
    return j;
}

std::string to_json_string(const Command& cmd, int indent) {
    return to_json(cmd).dump(indent);
}

} // namespace serializer
} // namespace commandlines
