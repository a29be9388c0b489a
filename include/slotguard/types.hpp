#pragma once

#include <vector>
#include <string>
#include <array>
#include <cstdint>
#include <optional>
#include "slotguard/crypto.hpp"

namespace slotguard {

using Bytes = std::vector<uint8_t>;
using Hash256 = crypto::Keccak256::HashBytes;

/**
 * @brief 256-bit machine word, big-endian
 *
 * Storage keys and storage values are both words. The store attaches no
 * type to a word; the layout that reads it decides what it means.
 */
using Word = std::array<uint8_t, 32>;
using StorageSlot = Word;

namespace word {

Word from_uint64(uint64_t v);
// nullopt when the value does not fit in 64 bits
std::optional<uint64_t> to_uint64(const Word& w);
uint64_t low64(const Word& w);

// Wrapping arithmetic modulo 2^256
Word add(const Word& a, const Word& b);
Word sub(const Word& a, const Word& b);

bool is_zero(const Word& w);
std::string to_hex(const Word& w);
std::optional<Word> from_hex(const std::string& str);

} // namespace word

/**
 * @brief 20-byte instance address
 *
 * Stored in a word as the low 20 bytes, left-padded with zeros.
 */
struct Address {
    std::array<uint8_t, 20> bytes{};

    bool is_zero() const;
    Word to_word() const;
    std::string to_hex() const;

    // Decodes the low 20 bytes; the upper 12 bytes are ignored
    static Address from_word(const Word& w);
    static std::optional<Address> from_hex(const std::string& str);
    static Address from_uint64(uint64_t v);

    bool operator==(const Address& other) const = default;
};

/**
 * @brief Event emitted during execution
 */
struct Log {
    Address address;
    std::vector<Hash256> topics;
    Bytes data;
};

/**
 * @brief Failure reason tags
 */
enum class Error {
    None,
    Unauthorized,
    InvalidImplementation,
    AlreadyInitialized,
    InitializerDisabled,
    InvalidReinitializationEpoch,
    NotInitializing,
    StorageCollision,
    AdminFallbackDenied,
    UnknownMethod,
    InvalidArguments,
    NoCode,
    Reverted
};

const char* error_name(Error error);

/**
 * @brief Result of a call, deployment or upgrade
 *
 * A failed result means every write made by the operation was rolled back.
 */
struct ExecutionResult {
    bool success{false};
    Error error{Error::None};
    std::string message;
    Bytes return_data;

    // Contract creation result
    std::optional<Address> created_address;

    // Logs emitted during execution (only kept on success)
    std::vector<Log> logs;

    static ExecutionResult ok(Bytes return_data = {});
    static ExecutionResult fail(Error error, std::string message);
};

} // namespace slotguard
