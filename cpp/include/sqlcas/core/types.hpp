#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace sqlcas::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);
    static_assert(std::is_trivially_copyable_v<Hash256>);

    // Hex digest length and the short freshness token carried in URLs.
    inline constexpr std::size_t kDigestHexLen = 64;
    inline constexpr std::size_t kHashPrefixLen = 7;

    // Streaming block size used when fingerprinting files.
    inline constexpr std::size_t kHashBlockSize = 1024 * 1024;
    inline constexpr std::size_t kMaxHashBlockSize = kHashBlockSize * 64;

    // Rows returned by a table view.
    inline constexpr u32 kTableViewRowLimit = 20;

    enum class ValueType : u8 {
        Null = 0,
        Integer = 1,
        Real = 2,
        Text = 3,
        Blob = 4,
    };

} // namespace sqlcas::core
