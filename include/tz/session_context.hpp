#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace tzupdater {

// State shared by the operations of one logical session: the memoized latest
// release and the directory of the active dataset. Public TzInstaller
// operations hold `mu` for their whole duration.
struct SessionContext {
    std::optional<std::string> latest_release;
    std::optional<std::string> active_dataset_dir;

    std::mutex mu;
};

} // namespace tzupdater
