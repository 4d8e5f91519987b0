#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path STATE_DIR;
extern std::filesystem::path LOG_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path ADAPTERS_CONF;
extern std::filesystem::path INSTALLED_DB;

std::filesystem::path get_tmp_dir();

// Functions
void set_root_path(const std::string& root_path);
void init_filesystem();
void set_architecture(const std::string& arch); // Manually override architecture
std::string get_architecture();

// Package id reduced to [A-Za-z0-9._-], with every other byte mapped to '_'.
// Empty, "." and ".." become "unknown".
std::string log_file_stem(std::string_view package_id);

// Installer log file for one run of the given package, directly under LOG_DIR.
std::filesystem::path get_installer_log_file(const std::string& package_id);
