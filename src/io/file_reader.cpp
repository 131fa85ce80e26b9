#include "io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tzupdater {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err,
                            "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadTextFile(const std::string& path, std::string& out) {
    FileReader reader;
    auto open_res = FileReader::Open(path, reader);
    if (!open_res.is_ok())
        return open_res;

    out.clear();
    std::array<std::uint8_t, 4096> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0)
            break;
        if (n < 0) {
            const int err = errno;
            return Result::Fail(ErrorKind::IoError, err,
                                "Read failed: " + path + " (" + std::strerror(err) + ")");
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace tzupdater
