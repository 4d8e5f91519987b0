#include "selector.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>

const InstallerDescriptor& ArchitectureInstallerSelector::best_installer(const std::vector<InstallerDescriptor>& candidates) {
    if (candidates.empty()) {
        throw SetupctlException(get_string("error.no_installers"));
    }

    const std::string arch = get_architecture();
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [&](const InstallerDescriptor& c) { return c.architecture == arch; });
    if (it != candidates.end()) return *it;

    it = std::find_if(candidates.begin(), candidates.end(),
                      [](const InstallerDescriptor& c) { return c.architecture.empty() || c.architecture == "any"; });
    if (it != candidates.end()) return *it;

    return candidates.front();
}
