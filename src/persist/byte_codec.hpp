#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace persist {

// Little-endian fixed-width stores/loads over std::byte buffers. Callers are
// responsible for bounds; every journal field goes through these.
template <typename T>
inline void store_le(T value, std::byte* out) noexcept {
    static_assert(std::is_integral_v<T>, "store_le requires an integral type");
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        out[i] = static_cast<std::byte>(v & 0xFFu);
        v = static_cast<U>(v >> 8);
    }
}

template <typename T>
inline T load_le(const std::byte* in) noexcept {
    static_assert(std::is_integral_v<T>, "load_le requires an integral type");
    using U = std::make_unsigned_t<T>;
    U v = 0;
    for (std::size_t i = sizeof(U); i-- > 0;) {
        v = static_cast<U>(v << 8);
        v = static_cast<U>(v | static_cast<U>(std::to_integer<std::uint8_t>(in[i])));
    }
    return static_cast<T>(v);
}

static_assert(std::endian::native == std::endian::little || std::endian::native == std::endian::big,
              "mixed-endian platforms are not supported");

} // namespace persist
