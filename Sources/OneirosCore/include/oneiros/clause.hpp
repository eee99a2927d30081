#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oneiros {

// ============================================================================
// Statement clauses
// ============================================================================
//
// Each clause renders independently to a fragment with a leading space, or
// to "" when nothing was added, so a builder can render every slot
// unconditionally. Adding the same fragment twice has no further effect.

class clause {
public:
    virtual ~clause() = default;

    [[nodiscard]] virtual bool empty() const = 0;
    virtual std::string render() const = 0;
};

enum class bool_op { and_op, or_op };

/// WHERE. The first condition carries no operator; later ones default to AND
/// unless the caller wrote a leading "AND " or "OR " (any case). Every
/// condition is kept; adding the previous condition again is a no-op.
class where_clause : public clause {
public:
    where_clause() = default;
    explicit where_clause(const std::string& condition) { add(condition); }

    where_clause& add(const std::string& condition);
    where_clause& and_(const std::string& condition) { return add(bool_op::and_op, condition); }
    where_clause& or_(const std::string& condition) { return add(bool_op::or_op, condition); }

    [[nodiscard]] bool empty() const override { return conditions_.empty(); }
    std::string render() const override;

    /// Conditions joined with their operators, without the WHERE keyword.
    std::string expression() const;

private:
    where_clause& add(bool_op op, const std::string& condition);

    std::vector<std::pair<bool_op, std::string>> conditions_;
};

/// Comma-joined field list behind a fixed keyword.
class field_list_clause : public clause {
public:
    field_list_clause& add(const std::string& field);
    field_list_clause& add(const std::vector<std::string>& fields);

    [[nodiscard]] bool empty() const override { return fields_.empty(); }
    std::string render() const override;

    const std::vector<std::string>& fields() const { return fields_; }

protected:
    explicit field_list_clause(const char* keyword) : keyword_(keyword) {}

private:
    const char* keyword_;
    std::vector<std::string> fields_;
};

class group_by_clause : public field_list_clause {
public:
    group_by_clause() : field_list_clause("GROUP BY") {}
};

class fetch_clause : public field_list_clause {
public:
    fetch_clause() : field_list_clause("FETCH") {}
};

class omit_clause : public field_list_clause {
public:
    omit_clause() : field_list_clause("OMIT") {}
};

class split_clause : public field_list_clause {
public:
    split_clause() : field_list_clause("SPLIT") {}
};

enum class sort_direction { ascending, descending };

/// ORDER BY a single field. Direction defaults to ascending and may be changed later.
class order_by_clause : public clause {
public:
    order_by_clause() = default;
    explicit order_by_clause(std::string field, sort_direction direction = sort_direction::ascending)
        : field_(std::move(field)), direction_(direction) {}

    order_by_clause& set_direction(sort_direction direction) {
        direction_ = direction;
        return *this;
    }
    sort_direction direction() const { return direction_; }
    const std::string& field() const { return field_; }

    [[nodiscard]] bool empty() const override { return field_.empty(); }
    std::string render() const override;

    /// "field ASC" - used when several orderings are joined.
    std::string term() const;

private:
    std::string field_;
    sort_direction direction_ = sort_direction::ascending;
};

/// LIMIT n [START m]. Rendering a START without a LIMIT throws configuration_error.
class limit_clause : public clause {
public:
    limit_clause() = default;
    explicit limit_clause(uint64_t limit) : limit_(limit) {}
    limit_clause(uint64_t limit, uint64_t start) : limit_(limit), start_(start) {}

    limit_clause& limit(uint64_t n) { limit_ = n; return *this; }
    limit_clause& start(uint64_t m) { start_ = m; return *this; }

    [[nodiscard]] bool empty() const override { return !limit_ && !start_; }
    std::string render() const override;

private:
    std::optional<uint64_t> limit_;
    std::optional<uint64_t> start_;
};

/// TIMEOUT rendered as "Ns" or "NsMms".
class timeout_clause : public clause {
public:
    timeout_clause() = default;
    explicit timeout_clause(std::chrono::milliseconds duration) { set(duration); }

    /// Throws configuration_error for a negative duration.
    timeout_clause& set(std::chrono::milliseconds duration);

    [[nodiscard]] bool empty() const override { return !duration_.has_value(); }
    std::string render() const override;

    static std::string format_duration(std::chrono::milliseconds duration);

private:
    std::optional<std::chrono::milliseconds> duration_;
};

class explain_clause : public clause {
public:
    enum class mode { none, plain, full };

    explain_clause() = default;
    explicit explain_clause(mode m) : mode_(m) {}

    explain_clause& set(mode m) { mode_ = m; return *this; }

    [[nodiscard]] bool empty() const override { return mode_ == mode::none; }
    std::string render() const override;

private:
    mode mode_ = mode::none;
};

class parallel_clause : public clause {
public:
    parallel_clause& enable(bool on = true) { enabled_ = on; return *this; }

    [[nodiscard]] bool empty() const override { return !enabled_; }
    std::string render() const override { return enabled_ ? " PARALLEL" : ""; }

private:
    bool enabled_ = false;
};

} // namespace oneiros
