#include "slotguard/types.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace slotguard {

// ============================================================================
// Word helpers
// ============================================================================

namespace word {

Word from_uint64(uint64_t v) {
    Word w{};
    for (int i = 0; i < 8; ++i) {
        w[31 - i] = static_cast<uint8_t>((v >> (i * 8)) & 0xFF);
    }
    return w;
}

std::optional<uint64_t> to_uint64(const Word& w) {
    for (size_t i = 0; i < 24; ++i) {
        if (w[i] != 0) return std::nullopt;
    }
    return low64(w);
}

uint64_t low64(const Word& w) {
    uint64_t v = 0;
    for (size_t i = 24; i < 32; ++i) {
        v = (v << 8) | w[i];
    }
    return v;
}

Word add(const Word& a, const Word& b) {
    Word r{};
    unsigned carry = 0;
    for (int i = 31; i >= 0; --i) {
        unsigned sum = static_cast<unsigned>(a[i]) + b[i] + carry;
        r[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
    }
    return r;
}

Word sub(const Word& a, const Word& b) {
    Word r{};
    int borrow = 0;
    for (int i = 31; i >= 0; --i) {
        int diff = static_cast<int>(a[i]) - b[i] - borrow;
        borrow = diff < 0 ? 1 : 0;
        r[i] = static_cast<uint8_t>(diff + (borrow ? 256 : 0));
    }
    return r;
}

bool is_zero(const Word& w) {
    return std::all_of(w.begin(), w.end(), [](uint8_t b) { return b == 0; });
}

std::string to_hex(const Word& w) {
    std::stringstream ss;
    ss << "0x" << std::hex << std::setfill('0');
    for (auto b : w) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Right-aligns `hex` into `out`; fails on bad digits or overflow
static bool decode_hex_into(std::string hex, uint8_t* out, size_t out_len) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex = hex.substr(2);
    }
    if (hex.empty() || hex.length() > out_len * 2) return false;
    if (hex.length() % 2 != 0) hex.insert(hex.begin(), '0');

    std::fill(out, out + out_len, 0);
    size_t offset = out_len - hex.length() / 2;
    for (size_t i = 0; i < hex.length() / 2; ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[offset + i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

std::optional<Word> from_hex(const std::string& str) {
    Word w{};
    if (!decode_hex_into(str, w.data(), w.size())) return std::nullopt;
    return w;
}

} // namespace word

// ============================================================================
// Address Implementation
// ============================================================================

bool Address::is_zero() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

Word Address::to_word() const {
    Word w{};
    std::copy(bytes.begin(), bytes.end(), w.begin() + 12);
    return w;
}

std::string Address::to_hex() const {
    std::stringstream ss;
    ss << "0x" << std::hex << std::setfill('0');
    for (auto b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

Address Address::from_word(const Word& w) {
    Address addr;
    std::copy(w.begin() + 12, w.end(), addr.bytes.begin());
    return addr;
}

std::optional<Address> Address::from_hex(const std::string& str) {
    Address addr;
    if (!word::decode_hex_into(str, addr.bytes.data(), addr.bytes.size())) {
        return std::nullopt;
    }
    return addr;
}

Address Address::from_uint64(uint64_t v) {
    return from_word(word::from_uint64(v));
}

// ============================================================================
// Errors and results
// ============================================================================

const char* error_name(Error error) {
    switch (error) {
        case Error::None: return "None";
        case Error::Unauthorized: return "Unauthorized";
        case Error::InvalidImplementation: return "InvalidImplementation";
        case Error::AlreadyInitialized: return "AlreadyInitialized";
        case Error::InitializerDisabled: return "InitializerDisabled";
        case Error::InvalidReinitializationEpoch: return "InvalidReinitializationEpoch";
        case Error::NotInitializing: return "NotInitializing";
        case Error::StorageCollision: return "StorageCollision";
        case Error::AdminFallbackDenied: return "AdminFallbackDenied";
        case Error::UnknownMethod: return "UnknownMethod";
        case Error::InvalidArguments: return "InvalidArguments";
        case Error::NoCode: return "NoCode";
        case Error::Reverted: return "Reverted";
    }
    return "Unknown";
}

ExecutionResult ExecutionResult::ok(Bytes return_data) {
    ExecutionResult result;
    result.success = true;
    result.return_data = std::move(return_data);
    return result;
}

ExecutionResult ExecutionResult::fail(Error error, std::string message) {
    ExecutionResult result;
    result.success = false;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // namespace slotguard
