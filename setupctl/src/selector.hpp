#pragma once

#include "collaborators.hpp"

// Prefers an installer built for the host architecture, then an
// architecture-neutral one, then the first candidate.
class ArchitectureInstallerSelector : public InstallerSelector {
public:
    const InstallerDescriptor& best_installer(const std::vector<InstallerDescriptor>& candidates) override;
};
