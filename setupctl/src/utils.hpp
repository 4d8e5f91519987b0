#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Per-process scratch directory, removed on destruction (RAII)
class TmpDirManager {
public:
    TmpDirManager();
    ~TmpDirManager();
    TmpDirManager(const TmpDirManager&) = delete;
    TmpDirManager& operator=(const TmpDirManager&) = delete;

    const std::filesystem::path& path() const { return tmp_dir_path_; }

private:
    std::filesystem::path tmp_dir_path_;
};

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);
void ensure_file_exists(const std::filesystem::path& path);

// String utilities
std::string trim(std::string_view text);
std::string to_lower(std::string_view text);
std::string replace_all(std::string text, std::string_view from, std::string_view to);
// Keeps empty fields, including a trailing one: "a\t" yields {"a", ""}.
std::vector<std::string> split_fields(std::string_view text, char separator);

// Splits an installer argument string into argv tokens.
// Double quotes group a token and are removed; \" inside quotes is a literal quote.
std::vector<std::string> split_command_line(std::string_view command_line);
