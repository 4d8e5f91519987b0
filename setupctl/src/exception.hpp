#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

class SetupctlException : public std::runtime_error {
public:
    explicit SetupctlException(const std::string& message)
        : std::runtime_error(message) {}
};

// No registered adapter claims the requested install method.
class AdapterNotFoundException : public SetupctlException {
public:
    AdapterNotFoundException(std::string install_method, const std::string& message)
        : SetupctlException(message), install_method_(std::move(install_method)) {}

    const std::string& install_method() const { return install_method_; }

private:
    std::string install_method_;
};

// The installer process could not be started at all.
class LaunchFailureException : public SetupctlException {
public:
    LaunchFailureException(std::filesystem::path executable, int error_number, const std::string& message)
        : SetupctlException(message), executable_(std::move(executable)), error_number_(error_number) {}

    const std::filesystem::path& executable() const { return executable_; }
    int error_number() const { return error_number_; }

private:
    std::filesystem::path executable_;
    int error_number_;
};

class TransferException : public SetupctlException {
public:
    using SetupctlException::SetupctlException;
};

// The installer ran and exited with a non-zero code.
class InstallerException : public SetupctlException {
public:
    InstallerException(int exit_code, std::string package_id, std::string reason,
                       std::optional<std::filesystem::path> log_file, const std::string& message)
        : SetupctlException(message), exit_code_(exit_code), package_id_(std::move(package_id)),
          reason_(std::move(reason)), log_file_(std::move(log_file)) {}

    int exit_code() const { return exit_code_; }
    const std::string& package_id() const { return package_id_; }
    const std::string& reason() const { return reason_; }
    const std::optional<std::filesystem::path>& log_file() const { return log_file_; }

private:
    int exit_code_;
    std::string package_id_;
    std::string reason_;
    std::optional<std::filesystem::path> log_file_;
};
