#pragma once
#include <cstdint>
#include <string_view>

namespace tzupdater {

struct ProgressEvent {
    std::string_view label;
    std::uint64_t done = 0;
    std::uint64_t total = 0; // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace tzupdater
