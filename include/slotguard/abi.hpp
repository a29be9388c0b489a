#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "slotguard/types.hpp"

namespace slotguard {
namespace abi {

using Selector = std::array<uint8_t, 4>;

/**
 * @brief First 4 bytes of keccak256(signature), e.g. "setValue(uint256)"
 */
Selector selector(const std::string& signature);

// nullopt when calldata is shorter than a selector
std::optional<Selector> selector_of(const Bytes& calldata);

/**
 * @brief Solidity ABI encoder for static words and dynamic `bytes`
 *
 * Static arguments occupy one 32-byte head word. A `bytes` argument's head
 * word holds the offset of its tail (length word + right-padded data),
 * measured from the start of the argument area.
 */
class Encoder {
public:
    Encoder() = default;
    explicit Encoder(const std::string& signature);

    Encoder& word(const Word& value);
    Encoder& uint(uint64_t value);
    Encoder& address(const Address& value);
    Encoder& boolean(bool value);
    Encoder& bytes(const Bytes& value);

    Bytes build() const;

private:
    std::optional<Selector> selector_;
    std::vector<std::variant<Word, Bytes>> args_;
};

/**
 * @brief Reads arguments out of calldata (after the selector)
 */
class Decoder {
public:
    explicit Decoder(const Bytes& calldata, size_t args_offset = 4);

    size_t word_count() const;
    std::optional<Word> word(size_t index) const;
    std::optional<uint64_t> uint64(size_t index) const;
    // Rejects words with non-zero upper 12 bytes
    std::optional<Address> address(size_t index) const;
    std::optional<bool> boolean(size_t index) const;
    std::optional<Bytes> bytes(size_t index) const;

private:
    std::optional<Word> word_at(size_t byte_offset) const;

    const Bytes& data_;
    size_t base_;
};

// Single-word return data
Bytes encode_word(const Word& value);
std::optional<Word> decode_word(const Bytes& return_data);

} // namespace abi
} // namespace slotguard
