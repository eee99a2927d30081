#include "oneiros/clause.hpp"
#include "oneiros/errors.hpp"

#include <algorithm>
#include <cctype>

namespace oneiros {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Case-insensitive "AND " / "OR " prefix.
bool starts_with_keyword(const std::string& s, const char* keyword) {
    std::size_t n = std::char_traits<char>::length(keyword);
    if (s.size() <= n) return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::toupper(static_cast<unsigned char>(s[i])) != keyword[i]) return false;
    }
    return std::isspace(static_cast<unsigned char>(s[n])) != 0;
}

const char* op_keyword(bool_op op) {
    return op == bool_op::and_op ? "AND" : "OR";
}

} // namespace

// ============================================================================
// where_clause
// ============================================================================

where_clause& where_clause::add(const std::string& condition) {
    std::string text = trim(condition);
    if (starts_with_keyword(text, "AND")) {
        return add(bool_op::and_op, text.substr(3));
    }
    if (starts_with_keyword(text, "OR")) {
        return add(bool_op::or_op, text.substr(2));
    }
    return add(bool_op::and_op, text);
}

where_clause& where_clause::add(bool_op op, const std::string& condition) {
    std::string text = trim(condition);
    if (text.empty()) return *this;

    // Conditions are positional; only a repeat of the last add is collapsed.
    auto entry = std::make_pair(op, text);
    if (conditions_.empty() || conditions_.back() != entry) {
        conditions_.push_back(std::move(entry));
    }
    return *this;
}

std::string where_clause::expression() const {
    std::string out;
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) {
            out += ' ';
            out += op_keyword(conditions_[i].first);
            out += ' ';
        }
        out += conditions_[i].second;
    }
    return out;
}

std::string where_clause::render() const {
    if (conditions_.empty()) return "";
    return " WHERE " + expression();
}

// ============================================================================
// field_list_clause
// ============================================================================

field_list_clause& field_list_clause::add(const std::string& field) {
    std::string name = trim(field);
    if (!name.empty() && std::find(fields_.begin(), fields_.end(), name) == fields_.end()) {
        fields_.push_back(std::move(name));
    }
    return *this;
}

field_list_clause& field_list_clause::add(const std::vector<std::string>& fields) {
    for (const auto& f : fields) add(f);
    return *this;
}

std::string field_list_clause::render() const {
    if (fields_.empty()) return "";
    std::string out = " ";
    out += keyword_;
    out += ' ';
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) out += ", ";
        out += fields_[i];
    }
    return out;
}

// ============================================================================
// order_by_clause
// ============================================================================

std::string order_by_clause::term() const {
    return field_ + (direction_ == sort_direction::ascending ? " ASC" : " DESC");
}

std::string order_by_clause::render() const {
    if (field_.empty()) return "";
    return " ORDER BY " + term();
}

// ============================================================================
// limit_clause
// ============================================================================

std::string limit_clause::render() const {
    if (start_ && !limit_) {
        throw configuration_error("START needs a LIMIT");
    }
    std::string out;
    if (limit_) out += " LIMIT " + std::to_string(*limit_);
    if (start_) out += " START " + std::to_string(*start_);
    return out;
}

// ============================================================================
// timeout_clause
// ============================================================================

timeout_clause& timeout_clause::set(std::chrono::milliseconds duration) {
    if (duration.count() < 0) {
        throw configuration_error("timeout must not be negative");
    }
    duration_ = duration;
    return *this;
}

std::string timeout_clause::format_duration(std::chrono::milliseconds duration) {
    auto seconds = duration.count() / 1000;
    auto millis = duration.count() % 1000;
    std::string out = std::to_string(seconds) + "s";
    if (millis != 0) {
        out += std::to_string(millis) + "ms";
    }
    return out;
}

std::string timeout_clause::render() const {
    if (!duration_) return "";
    return " TIMEOUT " + format_duration(*duration_);
}

// ============================================================================
// explain_clause
// ============================================================================

std::string explain_clause::render() const {
    switch (mode_) {
        case mode::none: return "";
        case mode::plain: return " EXPLAIN";
        case mode::full: return " EXPLAIN FULL";
    }
    return "";
}

} // namespace oneiros
