/**
 * @file tasks/builtins/TaskArgs.hpp
 * @brief Positional argument access and shell quoting shared by the built-in tasks.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace SysTask::Tasks {

/// Non-empty string at `index` of the positional argument array, if present.
inline std::optional<std::string> string_arg(const nlohmann::json& args, size_t index) {
    if (!args.is_array() || index >= args.size()) return std::nullopt;
    const auto& value = args[index];
    if (!value.is_string()) return std::nullopt;
    auto text = value.get<std::string>();
    if (text.empty()) return std::nullopt;
    return text;
}

/// True if `index` holds something other than null, false, zero or an empty string.
inline bool has_arg(const nlohmann::json& args, size_t index) {
    if (!args.is_array() || index >= args.size()) return false;
    const auto& value = args[index];
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    return true;
}

/// Argument at `index` as text: strings verbatim, other values in their JSON form.
inline std::string arg_text(const nlohmann::json& args, size_t index) {
    const auto& value = args.at(index);
    return value.is_string() ? value.get<std::string>() : value.dump();
}

/// Wrap `value` in double quotes, escaping the characters the shell expands inside them.
inline std::string double_quote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace SysTask::Tasks
