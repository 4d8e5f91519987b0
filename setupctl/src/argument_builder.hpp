#pragma once

#include "interactivity.hpp"
#include "manifest.hpp"
#include "whisperer.hpp"

#include <filesystem>
#include <optional>
#include <string>

struct BuiltArguments {
    std::string arguments;
    // Set only when a logging template was applied.
    std::optional<std::filesystem::path> log_file;
};

// Adapter tokens for the level, then the package's, then the logging arguments.
BuiltArguments build_arguments(InteractivityLevel level, const ManifestArgs& package_args,
                               const InstallerAdapter& adapter, const std::filesystem::path& log_file);
