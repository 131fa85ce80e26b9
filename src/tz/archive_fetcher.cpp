#include "tz/archive_fetcher.hpp"

#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "tz/release.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <utility>

namespace tzupdater {

namespace fs = std::filesystem;

namespace {

constexpr const char kPartialSuffix[] = ".part";

void RemovePartial(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return;
    if (!fs::remove(path, ec) || ec) {
        LogWarn("Unexpected error when removing %s: %s",
                path.c_str(), ec ? ec.message().c_str() : "not removed");
        return;
    }
    LogDebug("Removed incomplete download %s", path.c_str());
}

// Removes the in-progress download unless it was committed, also when the
// transport throws.
class PartialFileGuard {
  public:
    explicit PartialFileGuard(std::string path) : path_(std::move(path)) {}
    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    ~PartialFileGuard() {
        if (!committed_) RemovePartial(path_);
    }

    void Commit() { committed_ = true; }

  private:
    std::string path_;
    bool committed_ = false;
};

ErrorKind ToErrorKind(FetchStatus status) {
    switch (status) {
        case FetchStatus::NotFound:    return ErrorKind::ReleaseNotFound;
        case FetchStatus::Unreachable: return ErrorKind::SourceUnreachable;
        default:                       return ErrorKind::FetchFailed;
    }
}

} // namespace

ArchiveFetcher::ArchiveFetcher(IHttpTransport& transport, std::string download_base_url)
    : transport_(transport), base_url_(std::move(download_base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/')
        base_url_.pop_back();
}

std::string ArchiveFetcher::ArchiveUrl(const std::string& release) const {
    return base_url_ + "/" + ArchiveFileName(release);
}

Result ArchiveFetcher::EnsureArchive(const std::string& release,
                                     const std::string& target_dir,
                                     std::string& out_path) {
    auto valid = ValidateReleaseId(release);
    if (!valid.is_ok())
        return valid;

    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IoError, ec.value(),
                            "create_directories failed: " + target_dir + ": " + ec.message());
    }

    const std::string path = (fs::path(target_dir) / ArchiveFileName(release)).string();
    if (fs::exists(path, ec)) {
        LogDebug("Archive already present: %s", path.c_str());
        out_path = path;
        return Result::Ok();
    }

    // Only a complete, verified download ever appears at `path`.
    const std::string part_path = path + kPartialSuffix;
    PartialFileGuard guard(part_path);

    const std::string url = ArchiveUrl(release);
    auto res = Download(release, url, part_path);
    if (!res.is_ok())
        return res;

    fs::rename(part_path, path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IoError, ec.value(),
                            "rename " + part_path + " failed: " + ec.message());
    }
    guard.Commit();

    out_path = path;
    return Result::Ok();
}

Result ArchiveFetcher::Download(const std::string& release, const std::string& url, const std::string& part_path) {
    LogInfo("Downloading %s", url.c_str());

    FetchOutcome outcome;
    {
        FileWriter writer;
        auto open_res = FileWriter::Open(part_path, writer);
        if (!open_res.is_ok())
            return open_res;

        outcome = transport_.Download(url, writer, progress_sink_);
        if (outcome.is_ok()) {
            auto close_res = writer.Close();
            if (!close_res.is_ok())
                return close_res;
        }
    }

    if (!outcome.is_ok()) {
        const ErrorKind kind = ToErrorKind(outcome.status);
        switch (kind) {
            case ErrorKind::ReleaseNotFound:
                LogWarn("Cannot fetch requested file (404 not found): %s", url.c_str());
                break;
            case ErrorKind::SourceUnreachable:
                LogWarn("IANA website is unreachable! (%s)", outcome.message.c_str());
                break;
            default:
                LogWarn("Cannot download %s: %s", url.c_str(), outcome.message.c_str());
                break;
        }
        return Result::Fail(kind, outcome.http_status,
                            "Download " + release + " at " + url + " failed: " + outcome.message);
    }

    return VerifyDigest(release, part_path);
}

Result ArchiveFetcher::VerifyDigest(const std::string& release, const std::string& path) const {
    std::string actual;
    auto hash_res = Sha256HexFile(path, actual);
    if (!hash_res.is_ok())
        return Result::Fail(ErrorKind::FetchFailed, hash_res.message());

    LogDebug("sha256(%s) = %s", path.c_str(), actual.c_str());

    const auto it = digests_.find(release);
    if (it == digests_.end())
        return Result::Ok();

    if (!DigestEquals(actual, it->second)) {
        return Result::Fail(ErrorKind::FetchFailed,
                            "sha256 mismatch for " + ArchiveFileName(release) +
                                ": expected=" + it->second + " actual=" + actual);
    }
    LogInfo("sha256 verified for %s", ArchiveFileName(release).c_str());
    return Result::Ok();
}

} // namespace tzupdater
