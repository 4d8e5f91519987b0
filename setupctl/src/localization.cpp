#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    // Catalog values may carry "\n" and "\t" escapes.
    std::string unescape(std::string_view value) {
        std::string result;
        result.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '\\' && i + 1 < value.size()) {
                switch (value[i + 1]) {
                    case 'n': result += '\n'; ++i; continue;
                    case 't': result += '\t'; ++i; continue;
                    case '\\': result += '\\'; ++i; continue;
                    default: break;
                }
            }
            result += value[i];
        }
        return result;
    }

    // Overlays one catalog on top of what is already loaded.
    bool load_catalog(const std::string& lang) {
        std::ifstream file(L10N_DIR / (lang + ".txt"));
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos == std::string::npos) continue;
            // Values keep their spacing; "info.log_prefix" ends in a blank.
            translations[trim(line.substr(0, pos))] = unescape(std::string_view(line).substr(pos + 1));
        }
        return true;
    }

    // "de_DE.UTF-8" -> "de"
    std::string language_from_env() {
        const char* lang_env = std::getenv("LANG");
        if (!lang_env || !*lang_env) return "en";
        std::string env(lang_env);
        std::string lang = env.substr(0, env.find_first_of("_.@"));
        if (lang.empty() || lang == "C" || lang == "POSIX") return "en";
        return lang;
    }
}

void init_localization() {
    translations.clear();

    // English is the base layer, so a partial translation falls back key by key.
    const bool have_english = load_catalog("en");
    const std::string lang = language_from_env();
    if (lang != "en" && !load_catalog(lang)) {
        log_warning(string_format("warning.no_catalog", lang));
    }
    if (!have_english) {
        log_warning(string_format("warning.no_catalog", "en"));
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
