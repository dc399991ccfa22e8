#pragma once

#include <map>
#include <string>
#include <vector>

#include "sqlcas/core/types.hpp"

namespace sqlcas::core {
    // One discovered database file.
    struct DatabaseRecord {
        std::string name;       // file stem, unique within a registry snapshot
        std::string digest;     // lowercase hex BLAKE3 of the whole file
        std::string file_path;  // relative to the registry root
        std::map<std::string, i64> tables;
    };

    struct CanonicalAddress {
        std::string name;
        std::string hash_prefix;
        friend bool operator==(const CanonicalAddress&, const CanonicalAddress&) = default;
    };

    // Primary-key values of one row, in primary-key ordinal order.
    using CompoundKey = std::vector<std::string>;

    // Text and blob payloads both live in `bytes`.
    struct Value {
        ValueType type{ValueType::Null};
        i64 i64v{0};
        double f64v{0.0};
        std::string bytes;
    };

    struct RowSet {
        std::vector<std::string> columns;
        std::vector<std::vector<Value>> rows;
    };

    [[nodiscard]] inline std::string hash_prefix_of(const DatabaseRecord& rec) {
        return rec.digest.substr(0, kHashPrefixLen);
    }
} // namespace sqlcas::core
