#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace waypoint::core::encoding {

// 64-bit FNV-1a over raw bytes.
std::uint64_t fnv1a64(const std::string& bytes);

// fnv1a64 rendered as 16 lowercase hex digits.
std::string checksum_hex(const std::string& bytes);

std::string to_hex(const std::string& bytes);

// Returns nullopt for odd length or non-hex characters.
std::optional<std::string> from_hex(const std::string& hex);

bool is_valid_utf8(const std::string& bytes);

}  // namespace waypoint::core::encoding
