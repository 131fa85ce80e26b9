#include "tz/scoped_search_path.hpp"

#include "util/logger.hpp"

namespace tzupdater {

ScopedSearchPath::ScopedSearchPath(IEnvironment& env, const std::string& dir) : env_(env) {
    if (dir.empty())
        return;

    previous_ = env_.Get(kSearchPathEnv);
    const std::string value =
        (previous_ && !previous_->empty()) ? dir + ":" + *previous_ : dir;

    auto res = env_.Set(kSearchPathEnv, value);
    if (!res.is_ok()) {
        LogWarn("Cannot add %s to the search path: %s", dir.c_str(), res.message().c_str());
        return;
    }
    active_ = true;
    LogDebug("Search path prepended with %s", dir.c_str());
}

ScopedSearchPath::~ScopedSearchPath() {
    if (!active_)
        return;

    const Result res = previous_ ? env_.Set(kSearchPathEnv, *previous_) : env_.Unset(kSearchPathEnv);
    if (!res.is_ok()) {
        LogError("Cannot restore the search path: %s", res.message().c_str());
    }
}

} // namespace tzupdater
