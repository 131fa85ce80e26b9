#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <vector>

namespace tzupdater {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(bytes.size() * 2, '\0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

// Feeds chunks from `next` until it yields an empty span or reports failure.
template <typename NextChunk>
std::string Digest(NextChunk&& next) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return {};

    while (true) {
        std::span<const std::uint8_t> chunk;
        if (!next(chunk)) return {};
        if (chunk.empty()) break;
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), chunk.size()) != 1) return {};
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &len) != 1 || len != 32)
        return {};
    return HexEncode(std::span<const std::uint8_t>(md.data(), len));
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    bool fed = false;
    return Digest([&](std::span<const std::uint8_t>& chunk) {
        if (!fed) chunk = data;
        fed = true;
        return true;
    });
}

std::string Sha256Hex(IReader& reader) {
    std::vector<std::uint8_t> buf(64 * 1024);
    return Digest([&](std::span<const std::uint8_t>& chunk) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return false;
        chunk = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        return true;
    });
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(ErrorKind::IoError, "sha256 failed: " + path);
    return Result::Ok();
}

bool DigestEquals(const std::string& lhs_hex, const std::string& rhs_hex) {
    return !lhs_hex.empty() && Lower(lhs_hex) == Lower(rhs_hex);
}

} // namespace tzupdater
