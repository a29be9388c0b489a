#include "slotguard/abi.hpp"
#include <algorithm>

namespace slotguard {
namespace abi {

static constexpr size_t WORD_SIZE = 32;

static size_t padded_size(size_t len) {
    return (len + WORD_SIZE - 1) / WORD_SIZE * WORD_SIZE;
}

Selector selector(const std::string& signature) {
    auto hash = crypto::Keccak256::hash(signature);
    Selector sel;
    std::copy(hash.begin(), hash.begin() + 4, sel.begin());
    return sel;
}

std::optional<Selector> selector_of(const Bytes& calldata) {
    if (calldata.size() < 4) return std::nullopt;
    Selector sel;
    std::copy(calldata.begin(), calldata.begin() + 4, sel.begin());
    return sel;
}

// ============================================================================
// Encoder
// ============================================================================

Encoder::Encoder(const std::string& signature) : selector_(selector(signature)) {}

Encoder& Encoder::word(const Word& value) {
    args_.emplace_back(value);
    return *this;
}

Encoder& Encoder::uint(uint64_t value) {
    return word(word::from_uint64(value));
}

Encoder& Encoder::address(const Address& value) {
    return word(value.to_word());
}

Encoder& Encoder::boolean(bool value) {
    return uint(value ? 1 : 0);
}

Encoder& Encoder::bytes(const Bytes& value) {
    args_.emplace_back(value);
    return *this;
}

Bytes Encoder::build() const {
    Bytes out;
    if (selector_) {
        out.insert(out.end(), selector_->begin(), selector_->end());
    }

    Bytes tail;
    const size_t head_size = args_.size() * WORD_SIZE;

    for (const auto& arg : args_) {
        if (const auto* w = std::get_if<Word>(&arg)) {
            out.insert(out.end(), w->begin(), w->end());
            continue;
        }

        const auto& data = std::get<Bytes>(arg);
        auto offset = word::from_uint64(head_size + tail.size());
        out.insert(out.end(), offset.begin(), offset.end());

        auto length = word::from_uint64(data.size());
        tail.insert(tail.end(), length.begin(), length.end());
        tail.insert(tail.end(), data.begin(), data.end());
        tail.resize(tail.size() + (padded_size(data.size()) - data.size()), 0);
    }

    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

// ============================================================================
// Decoder
// ============================================================================

Decoder::Decoder(const Bytes& calldata, size_t args_offset)
    : data_(calldata), base_(std::min(args_offset, calldata.size())) {}

size_t Decoder::word_count() const {
    return (data_.size() - base_) / WORD_SIZE;
}

std::optional<Word> Decoder::word_at(size_t byte_offset) const {
    if (byte_offset > data_.size() || data_.size() - byte_offset < WORD_SIZE) {
        return std::nullopt;
    }
    Word w;
    std::copy(data_.begin() + byte_offset, data_.begin() + byte_offset + WORD_SIZE, w.begin());
    return w;
}

std::optional<Word> Decoder::word(size_t index) const {
    return word_at(base_ + index * WORD_SIZE);
}

std::optional<uint64_t> Decoder::uint64(size_t index) const {
    auto w = word(index);
    if (!w) return std::nullopt;
    return word::to_uint64(*w);
}

std::optional<Address> Decoder::address(size_t index) const {
    auto w = word(index);
    if (!w) return std::nullopt;
    if (!std::all_of(w->begin(), w->begin() + 12, [](uint8_t b) { return b == 0; })) {
        return std::nullopt;
    }
    return Address::from_word(*w);
}

std::optional<bool> Decoder::boolean(size_t index) const {
    auto v = uint64(index);
    if (!v || *v > 1) return std::nullopt;
    return *v == 1;
}

std::optional<Bytes> Decoder::bytes(size_t index) const {
    auto offset = uint64(index);
    if (!offset || *offset > data_.size()) return std::nullopt;

    size_t tail_start = base_ + static_cast<size_t>(*offset);
    auto length_word = word_at(tail_start);
    if (!length_word) return std::nullopt;

    auto length = word::to_uint64(*length_word);
    size_t data_start = tail_start + WORD_SIZE;
    if (!length || *length > data_.size() - data_start) return std::nullopt;

    return Bytes(data_.begin() + data_start,
                 data_.begin() + data_start + static_cast<size_t>(*length));
}

// ============================================================================
// Return data
// ============================================================================

Bytes encode_word(const Word& value) {
    return Bytes(value.begin(), value.end());
}

std::optional<Word> decode_word(const Bytes& return_data) {
    if (return_data.size() != WORD_SIZE) return std::nullopt;
    Word w;
    std::copy(return_data.begin(), return_data.end(), w.begin());
    return w;
}

} // namespace abi
} // namespace slotguard
