#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <string>
#include <string_view>

namespace slotguard {
namespace crypto {

/**
 * @brief Keccak-256 hash (original Keccak padding, as used by Ethereum)
 *
 * slotguard uses Keccak-256 for:
 * - Reserved storage slot derivation
 * - ABI method selectors
 * - Event topics and instance address derivation
 */
class Keccak256 {
public:
    static constexpr size_t HASH_SIZE = 32;
    static constexpr size_t RATE = 136;  // 1088-bit rate for 256-bit output
    using HashBytes = std::array<uint8_t, HASH_SIZE>;

    static HashBytes hash(const uint8_t* data, size_t len);
    static HashBytes hash(const std::vector<uint8_t>& data);
    static HashBytes hash(std::string_view data);

private:
    static void permute(uint64_t state[25]);
};

} // namespace crypto
} // namespace slotguard
