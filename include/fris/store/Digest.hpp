#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace fris {
namespace Digest {

using Sha256 = std::array<unsigned char, 32>;

Sha256 sha256(const std::string& payload);

// Lower-case hex of SHA-256(payload).
std::string sha256Hex(const std::string& payload);

// First 8 digest bytes, big-endian. Used to derive reproducible RNG seeds.
uint64_t sha256Prefix64(const std::string& payload);

} // namespace Digest
} // namespace fris
