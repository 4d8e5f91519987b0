#include "install_service.hpp"

#include "argument_builder.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

void InstallService::install(const PackageManifest& manifest, const InstallOptions& options) {
    log_info(string_format("info.install_begin", manifest.id, manifest.version));
    deps_.events.publish(InitializationEvent{manifest.id});

    const InstallerDescriptor& installer = deps_.selector.best_installer(manifest.installers);
    const auto installer_path = deps_.transfer.fetch(installer.location, get_tmp_dir(), installer.sha256);

    // Earlier installations may hold files the installer needs to replace.
    for (const auto& update : deps_.prior_installations.updates_for(manifest.id)) {
        if (update.installation_path) {
            deps_.unlocker.unlock(*update.installation_path, manifest.install_method);
        }
    }

    const InstallerAdapter& adapter = deps_.install_adapters.find(manifest.install_method);
    const InitializedAdapter whisperer = initialize_adapter(adapter, {.installer_path = installer_path});

    run_installer(options.interactivity, manifest, whisperer);

    log_info(string_format("info.install_complete", manifest.id));
    deps_.events.publish(SuccessEvent{manifest.id});
}

void InstallService::uninstall(const UninstallOptions& options) {
    log_info(string_format("info.uninstall_begin", options.package_id));

    const auto installed = deps_.installed_records.records();
    const auto candidates = deps_.matcher.match_for(installed, options.package_id);

    if (candidates.empty()) {
        log_warning(string_format("warning.uninstall_not_found", options.package_id));
        return;
    }

    if (candidates.size() != 1) {
        log_warning(string_format("warning.uninstall_ambiguous", options.package_id));
        for (const auto& candidate : candidates) {
            log_warning(string_format("warning.uninstall_candidate", candidate.display_name, candidate.display_version));
        }
        return;
    }

    const InstalledRecord& record = candidates.front();

    if (record.installation_path) {
        deps_.unlocker.unlock(*record.installation_path, record.install_method);
    }

    const std::string key = deps_.installed_records.key(record.id);

    const InstallerAdapter& adapter = deps_.uninstall_adapters.find(record.install_method);
    const InitializedAdapter whisperer = initialize_adapter(adapter, {.uninstall_key = key});

    PackageManifest target;
    target.id = record.package_id.empty() ? options.package_id : record.package_id;
    target.name = record.display_name;
    target.version = record.display_version;
    target.install_method = record.install_method;

    run_installer(options.interactivity, target, whisperer);

    log_info(string_format("info.uninstall_complete", record.display_name, record.display_version));
}

void InstallService::run_installer(InteractivityLevel interactivity, const PackageManifest& manifest,
                                   const InitializedAdapter& whisperer) {
    const InteractivityLevel effective = resolve_interactivity(interactivity, manifest.args, whisperer.adapter);
    const BuiltArguments built = build_arguments(effective, manifest.args, whisperer.adapter,
                                                 get_installer_log_file(manifest.id));

    deps_.events.publish(ExecutingEvent{manifest.id});
    const int exit_code = run_process(deps_.processes, whisperer.process_path, built.arguments);
    const RunResult result = classify_outcome(exit_code, whisperer.adapter, built.log_file);

    if (!result.succeeded()) {
        throw InstallerException(result.exit_code, manifest.id, result.reason, result.log_file,
                                 string_format("error.installer_failed", manifest.id, result.exit_code));
    }
}
