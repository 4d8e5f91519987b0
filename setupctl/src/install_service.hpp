#pragma once

#include "collaborators.hpp"
#include "events.hpp"
#include "interactivity.hpp"
#include "manifest.hpp"
#include "outcome.hpp"
#include "process.hpp"
#include "whisperer.hpp"

#include <string>

struct InstallOptions {
    InteractivityLevel interactivity = InteractivityLevel::PASSIVE;
};

struct UninstallOptions {
    std::string package_id;
    InteractivityLevel interactivity = InteractivityLevel::PASSIVE;
};

struct InstallServiceDependencies {
    InstallerSelector& selector;
    TransferService& transfer;
    PriorInstallationLookup& prior_installations;
    Unlocker& unlocker;
    InstalledRecordSource& installed_records;
    RecordMatcher& matcher;
    ProcessController& processes;
    EventSink& events;
    const AdapterRegistry& install_adapters;
    const AdapterRegistry& uninstall_adapters;
};

// Runs one install or uninstall per call. Holds no state between calls.
class InstallService {
public:
    explicit InstallService(InstallServiceDependencies deps) : deps_(deps) {}

    // Throws AdapterNotFoundException, LaunchFailureException, TransferException
    // or InstallerException.
    void install(const PackageManifest& manifest, const InstallOptions& options);

    // Returns without uninstalling anything when no record or more than one
    // record matches the package id.
    void uninstall(const UninstallOptions& options);

private:
    void run_installer(InteractivityLevel interactivity, const PackageManifest& manifest,
                       const InitializedAdapter& whisperer);

    InstallServiceDependencies deps_;
};
