#pragma once

#include "tz/http_transport.hpp"
#include "tz/progress.hpp"
#include "util/result.hpp"

#include <map>
#include <string>
#include <utility>

namespace tzupdater {

class ArchiveFetcher {
  public:
    ArchiveFetcher(IHttpTransport& transport, std::string download_base_url);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // release -> expected sha256; checked on fresh downloads only.
    void SetExpectedDigests(std::map<std::string, std::string> digests) {
        digests_ = std::move(digests);
    }

    // Ensures {target_dir}/tzdata{release}.tar.gz exists. An existing file is
    // returned as-is. Downloads go to a ".part" sibling that is renamed into
    // place once complete and verified; it is removed on every other exit,
    // exceptions included.
    // Failure kinds: ReleaseNotFound, SourceUnreachable, FetchFailed, IoError.
    Result EnsureArchive(const std::string& release,
                         const std::string& target_dir,
                         std::string& out_path);

    std::string ArchiveUrl(const std::string& release) const;

  private:
    Result Download(const std::string& release, const std::string& url, const std::string& part_path);
    Result VerifyDigest(const std::string& release, const std::string& path) const;

    IHttpTransport& transport_;
    std::string base_url_;
    std::map<std::string, std::string> digests_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace tzupdater
