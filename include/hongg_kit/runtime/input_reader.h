#pragma once

// =============================================================================
// Hongg Kit - Structured Input
// =============================================================================
//
// InputReader consumes a fuzz input front to back. Every consume either
// succeeds with a value or returns std::nullopt when the input is exhausted;
// nothing ever blocks or reads past the end.
//
// Arbitrary<T> builds a T from a reader. Specializations exist for integers,
// bool, floating point, std::string, std::vector, std::optional and
// std::pair. User types add their own specialization:
//
//   template <>
//   struct hongg::runtime::Arbitrary<Point> {
//       static std::optional<Point> read(InputReader& in) { ... }
//   };
//

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hongg {
namespace runtime {

// =============================================================================
// InputReader
// =============================================================================

class InputReader {
  public:
    explicit InputReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool empty() const { return remaining() == 0; }
    [[nodiscard]] size_t position() const { return pos_; }

    std::optional<std::span<const uint8_t>> consumeBytes(size_t count) {
        if (count > remaining()) {
            return std::nullopt;
        }
        auto bytes = data_.subspan(pos_, count);
        pos_ += count;
        return bytes;
    }

    std::span<const uint8_t> consumeRemaining() {
        auto bytes = data_.subspan(pos_);
        pos_ = data_.size();
        return bytes;
    }

    // Little-endian, independent of the host byte order
    template <typename T>
    std::optional<T> consumeIntegral() {
        static_assert(std::is_integral_v<T>, "consumeIntegral needs an integer type");
        auto bytes = consumeBytes(sizeof(T));
        if (!bytes) {
            return std::nullopt;
        }
        using U = std::make_unsigned_t<T>;
        U value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<U>(static_cast<U>((*bytes)[i]) << (8 * i));
        }
        return static_cast<T>(value);
    }

    std::optional<bool> consumeBool() {
        auto byte = consumeIntegral<uint8_t>();
        if (!byte) {
            return std::nullopt;
        }
        return (*byte & 1) != 0;
    }

    // Length in [0, max], additionally capped by the bytes left
    std::optional<size_t> consumeLength(size_t max) {
        auto raw = consumeIntegral<uint32_t>();
        if (!raw) {
            return std::nullopt;
        }
        size_t bound = std::min(max, remaining());
        return static_cast<size_t>(*raw) % (bound + 1);
    }

  private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// =============================================================================
// Arbitrary<T>
// =============================================================================

template <typename T, typename Enable = void>
struct Arbitrary;

template <typename T>
struct Arbitrary<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static std::optional<T> read(InputReader& in) { return in.consumeIntegral<T>(); }
};

template <>
struct Arbitrary<bool> {
    static std::optional<bool> read(InputReader& in) { return in.consumeBool(); }
};

template <typename T>
struct Arbitrary<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static std::optional<T> read(InputReader& in) {
        auto bytes = in.consumeBytes(sizeof(T));
        if (!bytes) {
            return std::nullopt;
        }
        T value;
        std::memcpy(&value, bytes->data(), sizeof(T));
        return value;
    }
};

template <>
struct Arbitrary<std::string> {
    static std::optional<std::string> read(InputReader& in) {
        auto length = in.consumeLength(std::numeric_limits<uint32_t>::max());
        if (!length) {
            return std::nullopt;
        }
        auto bytes = in.consumeBytes(*length);
        if (!bytes) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    }
};

template <typename T>
struct Arbitrary<std::vector<T>> {
    static std::optional<std::vector<T>> read(InputReader& in) {
        // The count is bounded by the bytes left, not by what the elements
        // will consume, so only a small prefix of it is reserved up front
        constexpr size_t kMaxReserve = 1024;
        auto count = in.consumeLength(std::numeric_limits<uint32_t>::max());
        if (!count) {
            return std::nullopt;
        }
        std::vector<T> values;
        values.reserve(std::min(*count, kMaxReserve));
        for (size_t i = 0; i < *count; ++i) {
            auto element = Arbitrary<T>::read(in);
            if (!element) {
                return std::nullopt;
            }
            values.push_back(std::move(*element));
        }
        return values;
    }
};

template <typename T>
struct Arbitrary<std::optional<T>> {
    static std::optional<std::optional<T>> read(InputReader& in) {
        auto present = in.consumeBool();
        if (!present) {
            return std::nullopt;
        }
        if (!*present) {
            return std::optional<std::optional<T>>(std::in_place);
        }
        auto value = Arbitrary<T>::read(in);
        if (!value) {
            return std::nullopt;
        }
        return std::optional<std::optional<T>>(std::in_place, std::move(*value));
    }
};

template <typename A, typename B>
struct Arbitrary<std::pair<A, B>> {
    static std::optional<std::pair<A, B>> read(InputReader& in) {
        auto first = Arbitrary<A>::read(in);
        if (!first) {
            return std::nullopt;
        }
        auto second = Arbitrary<B>::read(in);
        if (!second) {
            return std::nullopt;
        }
        return std::pair<A, B>{std::move(*first), std::move(*second)};
    }
};

// Convenience: build a T from a whole input
template <typename T>
std::optional<T> arbitraryFrom(std::span<const uint8_t> data) {
    InputReader reader(data);
    return Arbitrary<T>::read(reader);
}

}  // namespace runtime
}  // namespace hongg
