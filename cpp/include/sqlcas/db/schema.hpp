#pragma once

#include <map>
#include <string>

#include "sqlcas/core/types.hpp"

namespace sqlcas::db {
    using i64 = sqlcas::core::i64;
    using u32 = sqlcas::core::u32;

    // One row of PRAGMA table_info. `pk` is the 1-based position of the
    // column in the primary key, 0 when the column is not part of it.
    struct ColumnInfo {
        u32 cid{0};
        std::string name;
        std::string type;
        bool notnull{false};
        u32 pk{0};
    };

    // Table name -> row count.
    using TableCounts = std::map<std::string, i64>;

} // namespace sqlcas::db
