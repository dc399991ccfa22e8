#pragma once

#include <type_traits>

#include "sqlcas/core/types.hpp"

namespace sqlcas::storage {
    using u8 = sqlcas::core::u8;
    using u64 = sqlcas::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace sqlcas::storage
