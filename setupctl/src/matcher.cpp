#include "matcher.hpp"

#include <cctype>

std::string normalize_name(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            result += static_cast<char>(std::tolower(c));
        }
    }
    return result;
}

std::vector<InstalledRecord> NameRecordMatcher::match_for(const std::vector<InstalledRecord>& records,
                                                          const std::string& target_id) {
    std::vector<InstalledRecord> matches;
    const std::string target = normalize_name(target_id);
    if (target.empty()) {
        return matches;
    }

    for (const auto& record : records) {
        if (normalize_name(record.package_id) == target ||
            normalize_name(record.display_name).starts_with(target)) {
            matches.push_back(record);
        }
    }
    return matches;
}
