#pragma once

// =============================================================================
// Hongg Kit - Fingerprints
// =============================================================================
//
// Stable 64-bit FNV-1a hashing used to decide whether a cached build (of the
// engine or of a target) still matches the inputs that produced it. Values
// are persisted on disk, so the algorithm must never change silently.
//

#include <cstdint>
#include <string>
#include <string_view>

namespace hongg {

class Fingerprint {
  public:
    static constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr uint64_t kPrime = 0x100000001b3ULL;

    Fingerprint& addBytes(const void* data, size_t size) {
        const auto* p = static_cast<const uint8_t*>(data);
        for (size_t i = 0; i < size; ++i) {
            h_ ^= p[i];
            h_ *= kPrime;
        }
        return *this;
    }

    // Strings are length-prefixed so ("ab","c") and ("a","bc") differ
    Fingerprint& add(std::string_view s) {
        add(static_cast<uint64_t>(s.size()));
        return addBytes(s.data(), s.size());
    }

    Fingerprint& add(uint64_t value) {
        uint8_t bytes[8];
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(value >> (8 * i));
        }
        return addBytes(bytes, sizeof(bytes));
    }

    [[nodiscard]] uint64_t value() const { return h_; }

    // 16 lowercase hex digits
    [[nodiscard]] std::string hex() const { return toHex(h_); }

    static std::string toHex(uint64_t value);

  private:
    uint64_t h_ = kOffsetBasis;
};

inline std::string Fingerprint::toHex(uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = kDigits[value & 0xF];
        value >>= 4;
    }
    return out;
}

}  // namespace hongg
