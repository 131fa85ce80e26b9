#pragma once

#include "tz/progress.hpp"

#include <string>

namespace tzupdater {

// Single-line "\r" progress on stderr, used for archive downloads.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_label_;
    bool finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace tzupdater
