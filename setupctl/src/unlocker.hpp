#pragma once

#include "collaborators.hpp"

// Gives the owner write access to everything under an installation folder so
// the installer can replace its files.
class FolderUnlocker : public Unlocker {
public:
    void unlock(const std::filesystem::path& path, const std::string& install_method) override;
};
