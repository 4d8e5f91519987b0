#pragma once

#include "manifest.hpp"
#include "whisperer.hpp"

#include <string>
#include <string_view>

enum class InteractivityLevel {
    SILENT,
    PASSIVE,
    INTERACTIVE
};

// Throws SetupctlException on unknown names.
InteractivityLevel parse_interactivity(std::string_view name);
std::string to_string(InteractivityLevel level);

bool supports_silent(const ManifestArgs& package_args, const InstallerAdapter& adapter);
bool supports_passive(const ManifestArgs& package_args, const InstallerAdapter& adapter);

// Degrades an unsupported Silent or Passive request to the other
// non-interactive level, then to Interactive. Interactive is always granted.
InteractivityLevel resolve_interactivity(InteractivityLevel requested, const ManifestArgs& package_args,
                                         const InstallerAdapter& adapter);
