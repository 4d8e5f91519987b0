#pragma once

#include "collaborators.hpp"

#include <string>
#include <string_view>

// Loose matching: a record matches when its package id equals the target or
// its display name starts with it, ignoring case and punctuation.
class NameRecordMatcher : public RecordMatcher {
public:
    std::vector<InstalledRecord> match_for(const std::vector<InstalledRecord>& records,
                                           const std::string& target_id) override;
};

// Lowercase alphanumerics only.
std::string normalize_name(std::string_view name);
