#pragma once

#include <fmt/format.h>

#include <string>

void init_localization();
const std::string& get_string(const std::string& key);

// Formats a localized template with runtime arguments.
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return fmt::vformat(get_string(key), fmt::make_format_args(args...));
    } catch (const fmt::format_error& e) {
        return "Setupctl Formatting Error [key: " + key + "]: " + e.what();
    }
}
