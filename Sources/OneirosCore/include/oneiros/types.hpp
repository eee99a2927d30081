#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace oneiros {

using json = nlohmann::json;

/// Object-like bag of field values crossing the object/wire boundary.
using value_bag = nlohmann::json;

// ============================================================================
// record_id - "table:id"
// ============================================================================

struct record_id {
    std::string table;
    std::string id;

    record_id() = default;
    record_id(std::string t, std::string i) : table(std::move(t)), id(std::move(i)) {}

    std::string to_string() const {
        return table + ":" + id;
    }

    bool empty() const { return table.empty() || id.empty(); }

    /// Split on the first ':'. A string without a separator yields an empty record_id.
    static record_id parse(const std::string& s) {
        auto pos = s.find(':');
        if (pos == std::string::npos || pos == 0 || pos + 1 == s.size()) {
            return {};
        }
        return record_id(s.substr(0, pos), s.substr(pos + 1));
    }

    bool operator==(const record_id& other) const {
        return table == other.table && id == other.id;
    }
    bool operator!=(const record_id& other) const { return !(*this == other); }
};

} // namespace oneiros
