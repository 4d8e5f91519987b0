#include "interactivity.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

InteractivityLevel parse_interactivity(std::string_view name) {
    const std::string value = to_lower(name);
    if (value == "silent") return InteractivityLevel::SILENT;
    if (value == "passive") return InteractivityLevel::PASSIVE;
    if (value == "interactive") return InteractivityLevel::INTERACTIVE;
    throw SetupctlException(string_format("error.invalid_interactivity", std::string(name)));
}

std::string to_string(InteractivityLevel level) {
    switch (level) {
        case InteractivityLevel::SILENT:
            return "silent";
        case InteractivityLevel::PASSIVE:
            return "passive";
        case InteractivityLevel::INTERACTIVE:
        default:
            return "interactive";
    }
}

bool supports_silent(const ManifestArgs& package_args, const InstallerAdapter& adapter) {
    return package_args.silent.has_value() || adapter.silent_args.has_value();
}

bool supports_passive(const ManifestArgs& package_args, const InstallerAdapter& adapter) {
    return package_args.passive.has_value() || adapter.passive_args.has_value();
}

InteractivityLevel resolve_interactivity(InteractivityLevel requested, const ManifestArgs& package_args,
                                         const InstallerAdapter& adapter) {
    if (requested == InteractivityLevel::SILENT && !supports_silent(package_args, adapter)) {
        if (supports_passive(package_args, adapter)) {
            log_info(get_string("info.silent_to_passive"));
            return InteractivityLevel::PASSIVE;
        }
        log_warning(get_string("warning.fallback_interactive"));
        return InteractivityLevel::INTERACTIVE;
    }

    if (requested == InteractivityLevel::PASSIVE && !supports_passive(package_args, adapter)) {
        if (supports_silent(package_args, adapter)) {
            log_info(get_string("info.passive_to_silent"));
            return InteractivityLevel::SILENT;
        }
        log_warning(get_string("warning.fallback_interactive"));
        return InteractivityLevel::INTERACTIVE;
    }

    return requested;
}
