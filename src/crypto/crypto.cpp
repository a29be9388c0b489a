#include "slotguard/crypto.hpp"
#include <cstring>

namespace slotguard {
namespace crypto {

// ============================================================================
// Keccak-f[1600] permutation
// ============================================================================

static const uint64_t keccak_RC[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL,
    0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL,
    0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL,
    0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL,
    0x0000000080000001ULL, 0x8000000080008008ULL
};

static const int keccak_rotc[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

static const int keccak_piln[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

static inline uint64_t rotl64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

static inline uint64_t load64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

static inline void store64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

void Keccak256::permute(uint64_t st[25]) {
    uint64_t bc[5];

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = keccak_piln[i];
            bc[0] = st[j];
            st[j] = rotl64(t, keccak_rotc[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= keccak_RC[round];
    }
}

// ============================================================================
// Keccak-256 sponge
// ============================================================================

Keccak256::HashBytes Keccak256::hash(const uint8_t* data, size_t len) {
    uint64_t st[25] = {0};

    // Absorb full blocks
    while (len >= RATE) {
        for (size_t i = 0; i < RATE / 8; ++i) {
            st[i] ^= load64_le(data + 8 * i);
        }
        permute(st);
        data += RATE;
        len -= RATE;
    }

    // Final block with Keccak padding (0x01 ... 0x80)
    uint8_t block[RATE] = {0};
    if (len > 0) {
        std::memcpy(block, data, len);
    }
    block[len] ^= 0x01;
    block[RATE - 1] ^= 0x80;
    for (size_t i = 0; i < RATE / 8; ++i) {
        st[i] ^= load64_le(block + 8 * i);
    }
    permute(st);

    HashBytes result;
    for (int i = 0; i < 4; ++i) {
        store64_le(result.data() + 8 * i, st[i]);
    }
    return result;
}

Keccak256::HashBytes Keccak256::hash(const std::vector<uint8_t>& data) {
    return hash(data.data(), data.size());
}

Keccak256::HashBytes Keccak256::hash(std::string_view data) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace crypto
} // namespace slotguard
