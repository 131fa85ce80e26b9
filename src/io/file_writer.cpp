// file_writer.cpp - Plain file writer for downloads and marker files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace tzupdater {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err,
                            "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err, "Write failed (" + std::string(std::strerror(err)) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err, "fsync failed (" + std::string(std::strerror(err)) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid())
        return Result::Ok();
    const int fd = fd_.Release();
    if (::close(fd) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err, "close failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result WriteTextFileAtomic(const std::string& path, std::string_view content) {
    const std::string tmp_path = path + ".tmp";

    FileWriter writer;
    auto open_res = FileWriter::Open(tmp_path, writer);
    if (!open_res.is_ok())
        return open_res;

    auto res = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    if (res.is_ok())
        res = writer.FsyncNow();
    if (res.is_ok())
        res = writer.Close();
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(ErrorKind::IoError, err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }
    return Result::Ok();
}

} // namespace tzupdater
