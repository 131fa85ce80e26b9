#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace tzupdater {

// Unpacks a tzdata tarball into a directory. Every entry and hardlink target
// is confined to the destination.
class ArchiveExtractor {
  public:
    struct Stats {
        std::uint64_t entries = 0;
        std::uint64_t bytes = 0;
    };

    // `archive_path` is a gzip-compressed tar. `dst_dir` is created if needed.
    Result ExtractTarGz(const std::string& archive_path, const std::string& dst_dir, Stats* stats = nullptr) const;

    // Plain tar stream.
    Result ExtractTarStream(IReader& tar_stream, const std::string& dst_dir, Stats* stats = nullptr) const;

    // Maps an archive member name to a path relative to the destination:
    // leading "./" and "/" dropped, duplicate slashes collapsed. Names with a
    // ".." segment or a backslash fail with ExtractFailed. An empty result
    // (null, "", ".", "./") names the destination itself.
    static Result ConfinePath(const char* raw_path, std::string& out_relative);
};

} // namespace tzupdater
