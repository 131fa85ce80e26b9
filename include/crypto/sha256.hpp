#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace tzupdater {

// Lowercase hex SHA-256. An empty string means the digest failed.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);

// Streams the file at `path` through the digest.
Result Sha256HexFile(const std::string& path, std::string& out_hex);

// Case-insensitive hex digest comparison.
bool DigestEquals(const std::string& lhs_hex, const std::string& rhs_hex);

} // namespace tzupdater
