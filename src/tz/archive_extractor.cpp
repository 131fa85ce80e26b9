#include "tz/archive_extractor.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace tzupdater {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ReaderCtx {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ReaderCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive*, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) return -1;

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

// libarchive owns the context from here on and frees it in CloseCb, also
// when the open fails.
int OpenArchiveFromReader(struct archive* ar, IReader& reader) {
    return archive_read_open2(ar, new ReaderCtx(reader), nullptr, ReadCb, nullptr, CloseCb);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

Result Fail(const std::string& msg) {
    return Result::Fail(ErrorKind::ExtractFailed, msg);
}

bool HasParentSegment(std::string_view p) {
    while (true) {
        const auto pos = p.find('/');
        if (p.substr(0, pos) == "..") return true;
        if (pos == std::string_view::npos) return false;
        p.remove_prefix(pos + 1);
    }
}

} // namespace

Result ArchiveExtractor::ConfinePath(const char* raw_path, std::string& out_relative) {
    out_relative = NormalizeTarPath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative == ".") out_relative.clear();
    if (out_relative.empty()) return Result::Ok();

    if (out_relative.find('\\') != std::string::npos || HasParentSegment(out_relative)) {
        return Fail("Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchiveExtractor::ExtractTarGz(const std::string& archive_path,
                                      const std::string& dst_dir,
                                      Stats* stats) const {
    auto file = std::make_unique<FileReader>();
    auto open_res = FileReader::Open(archive_path, *file);
    if (!open_res.is_ok())
        return Fail(open_res.message());

    std::unique_ptr<IReader> gz;
    try {
        gz = std::make_unique<GzipReader>(std::move(file));
    } catch (const std::exception& e) {
        return Fail(std::string("Gzip init failed: ") + e.what());
    }

    return ExtractTarStream(*gz, dst_dir, stats);
}

Result ArchiveExtractor::ExtractTarStream(IReader& tar_stream,
                                          const std::string& dst_dir,
                                          Stats* stats) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Fail("create_directories failed: " + dst_dir + ": " + ec.message());
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Fail("Destination path is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Fail("archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_tar(ar.get());

    if (OpenArchiveFromReader(ar.get(), tar_stream) != ARCHIVE_OK) {
        return Fail("archive_read_open2: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Fail("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    Stats local{};

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return Fail("archive_read_next_header: " + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = ConfinePath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = ConfinePath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return Fail("hardlink target of " + rel + ": " + hl_res.message());
        if (!rel_hl.empty()) {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Fail("archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Fail("archive_read_data_block: " + ArchiveErr(ar.get()));

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Fail("archive_write_data_block: " + ArchiveErr(aw.get()));

            local.bytes += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Fail("archive_write_finish_entry: " + ArchiveErr(aw.get()));
        ++local.entries;
    }

    if (local.entries == 0) {
        return Fail("archive contains no entries");
    }

    if (stats) *stats = local;
    return Result::Ok();
}

} // namespace tzupdater
