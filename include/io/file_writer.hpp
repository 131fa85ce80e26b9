#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <string_view>

namespace tzupdater {

class FileWriter final : public IWriter {
  public:
    // Creates or truncates `path`.
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

// Writes `content` to `path` through a ".tmp" sibling and rename().
Result WriteTextFileAtomic(const std::string& path, std::string_view content);

} // namespace tzupdater
