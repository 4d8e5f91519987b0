#include "argument_builder.hpp"

#include "localization.hpp"
#include "utils.hpp"

namespace {

std::string join_trimmed(std::string_view first, std::string_view second) {
    std::string left = trim(first);
    std::string right = trim(second);
    if (left.empty()) return right;
    if (right.empty()) return left;
    return left + " " + right;
}

std::pair<std::string, std::string> level_templates(InteractivityLevel level, const ManifestArgs& package_args,
                                                    const InstallerAdapter& adapter) {
    switch (level) {
        case InteractivityLevel::SILENT:
            return {adapter.silent_args.value_or(""), package_args.silent.value_or("")};
        case InteractivityLevel::PASSIVE:
            return {adapter.passive_args.value_or(""), package_args.passive.value_or("")};
        case InteractivityLevel::INTERACTIVE:
        default:
            return {adapter.interactive_args.value_or(""), package_args.interactive.value_or("")};
    }
}

} // anonymous namespace

BuiltArguments build_arguments(InteractivityLevel level, const ManifestArgs& package_args,
                               const InstallerAdapter& adapter, const std::filesystem::path& log_file) {
    const auto [adapter_args, package_override] = level_templates(level, package_args, adapter);

    BuiltArguments built;
    built.arguments = join_trimmed(adapter_args, package_override);

    const std::optional<std::string>& log_template = package_args.log ? package_args.log : adapter.log_args;
    if (log_template) {
        const std::string logging_args = replace_all(*log_template, "{path}", "\"" + log_file.string() + "\"");
        log_info(string_format("info.installer_log_file", log_file.string()));
        built.arguments = join_trimmed(built.arguments, logging_args);
        built.log_file = log_file;
    }

    return built;
}
