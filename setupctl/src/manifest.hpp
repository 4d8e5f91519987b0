#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Package-level argument overrides, one per interactivity level plus logging.
struct ManifestArgs {
    std::optional<std::string> silent;
    std::optional<std::string> interactive;
    std::optional<std::string> passive;
    std::optional<std::string> log;
};

struct InstallerDescriptor {
    std::string location;
    std::string sha256;
    std::string architecture;
};

struct PackageManifest {
    std::string id;
    std::string name;
    std::string version;
    std::string install_method;
    std::vector<InstallerDescriptor> installers;
    ManifestArgs args;
};

// Reads a tab-separated package manifest.
// Throws SetupctlException on unreadable files or missing mandatory fields.
PackageManifest parse_manifest(const std::filesystem::path& path);
