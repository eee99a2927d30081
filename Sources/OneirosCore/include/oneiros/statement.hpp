#pragma once

#include "clause.hpp"
#include "encryption.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oneiros {

/// What a write statement hands back. A single field, so the modes are exclusive.
enum class return_mode {
    none,
    before,
    after,
    diff
};

const char* to_string(return_mode mode);

// ============================================================================
// statement_target - table, record or graph triple
// ============================================================================

class statement_target {
public:
    enum class kind { table, record, relation };

    statement_target() = default;

    static statement_target table(std::string name);
    static statement_target record(const std::string& table, const std::string& id);
    static statement_target record(const record_id& id);
    /// Accepts "table:id" or a bare table name.
    static statement_target parse(const std::string& text);
    static statement_target relation(const std::string& from, const std::string& edge, const std::string& to);

    kind type() const { return kind_; }
    bool empty() const { return text_.empty(); }
    const std::string& render() const { return text_; }

private:
    statement_target(kind k, std::string text) : kind_(k), text_(std::move(text)) {}

    kind kind_ = kind::table;
    std::string text_;
};

// ============================================================================
// select_statement
// ============================================================================
//
// SELECT projection FROM target, then WHERE, GROUP BY, ORDER BY, LIMIT/START,
// FETCH, OMIT, SPLIT, TIMEOUT, PARALLEL, EXPLAIN - in that order no matter
// which setter ran first.

class select_statement {
public:
    select_statement() = default;
    explicit select_statement(const std::vector<std::string>& projection);

    select_statement& field(const std::string& f);
    select_statement& from(const statement_target& target);
    select_statement& from(const std::string& target) { return from(statement_target::parse(target)); }
    select_statement& only() { only_ = true; return *this; }

    select_statement& where(const std::string& condition) { where_.add(condition); return *this; }
    select_statement& and_(const std::string& condition) { where_.and_(condition); return *this; }
    select_statement& or_(const std::string& condition) { where_.or_(condition); return *this; }

    select_statement& group_by(const std::string& f) { group_by_.add(f); return *this; }
    select_statement& order_by(const std::string& f, sort_direction direction = sort_direction::ascending);
    select_statement& limit(uint64_t n) { limit_.limit(n); return *this; }
    select_statement& start(uint64_t m) { limit_.start(m); return *this; }
    select_statement& fetch(const std::string& f) { fetch_.add(f); return *this; }
    select_statement& omit(const std::string& f) { omit_.add(f); return *this; }
    select_statement& split(const std::string& f) { split_.add(f); return *this; }
    select_statement& timeout(std::chrono::milliseconds d) { timeout_.set(d); return *this; }
    select_statement& parallel() { parallel_.enable(); return *this; }
    select_statement& explain(bool full = false);

    /// Throws missing_target when no target was given.
    std::string build() const;

private:
    std::vector<std::string> projection_;
    statement_target target_;
    bool only_ = false;
    where_clause where_;
    group_by_clause group_by_;
    std::vector<order_by_clause> order_by_;
    limit_clause limit_;
    fetch_clause fetch_;
    omit_clause omit_;
    split_clause split_;
    timeout_clause timeout_;
    parallel_clause parallel_;
    explain_clause explain_;
};

// ============================================================================
// mutation_statement - CREATE / UPDATE / UPSERT / DELETE
// ============================================================================

enum class statement_kind { create, update, upsert, remove };

class mutation_statement {
public:
    static mutation_statement create(const statement_target& target) { return {statement_kind::create, target}; }
    static mutation_statement update(const statement_target& target) { return {statement_kind::update, target}; }
    static mutation_statement upsert(const statement_target& target) { return {statement_kind::upsert, target}; }
    static mutation_statement remove(const statement_target& target) { return {statement_kind::remove, target}; }

    mutation_statement& only() { only_ = true; return *this; }

    /// SET field = literal. Strings are single-quoted, null renders as NONE.
    mutation_statement& set(const std::string& field, const json& value);
    mutation_statement& content(const value_bag& data);
    mutation_statement& merge(const value_bag& data);

    mutation_statement& where(const std::string& condition) { where_.add(condition); return *this; }
    mutation_statement& and_(const std::string& condition) { where_.and_(condition); return *this; }
    mutation_statement& or_(const std::string& condition) { where_.or_(condition); return *this; }

    mutation_statement& returning(return_mode mode) { return_ = mode; return *this; }
    mutation_statement& timeout(std::chrono::milliseconds d) { timeout_.set(d); return *this; }

    statement_kind kind() const { return kind_; }

    /// Throws missing_target without a target and configuration_error when
    /// clauses are combined in a way the statement kind does not accept.
    std::string build() const;

    /// Literal for a SET right-hand side.
    static std::string format_literal(const json& value);

private:
    mutation_statement(statement_kind kind, statement_target target)
        : kind_(kind), target_(std::move(target)) {}

    statement_kind kind_;
    statement_target target_;
    bool only_ = false;
    std::vector<std::pair<std::string, json>> assignments_;
    std::optional<value_bag> content_;
    std::optional<value_bag> merge_;
    where_clause where_;
    std::optional<return_mode> return_;
    timeout_clause timeout_;
};

// ============================================================================
// live_select_statement - LIVE SELECT [DIFF | projection] FROM table
// ============================================================================

class live_select_statement {
public:
    live_select_statement() = default;

    live_select_statement& field(const std::string& f);
    live_select_statement& diff() { diff_ = true; return *this; }
    live_select_statement& from(const std::string& table) { table_ = table; return *this; }
    live_select_statement& where(const std::string& condition) { where_.add(condition); return *this; }
    live_select_statement& fetch(const std::string& f) { fetch_.add(f); return *this; }

    std::string build() const;

private:
    std::vector<std::string> projection_;
    bool diff_ = false;
    std::string table_;
    where_clause where_;
    fetch_clause fetch_;
};

// ============================================================================
// relate_statement - RELATE from->edge->to
// ============================================================================
//
// Return mode defaults to AFTER and is always rendered.
//
// with_entity() runs the entity through the encryption pipeline, copies its
// fields into the edge content and then puts the entity back the way it
// was. One-way hashed fields cannot be put back and stay hashed on the
// caller's object.

class relate_statement {
public:
    relate_statement() = default;
    explicit relate_statement(std::shared_ptr<const encryption_pipeline> pipeline)
        : pipeline_(std::move(pipeline)) {}

    relate_statement& from(const std::string& record) { from_ = record; return *this; }
    relate_statement& from(const record_id& record) { from_ = record.to_string(); return *this; }
    /// Uses the entity's "id" field. Throws configuration_error without one.
    relate_statement& from_entity(const value_bag& entity);

    relate_statement& to(const std::string& record) { to_ = record; return *this; }
    relate_statement& to(const record_id& record) { to_ = record.to_string(); return *this; }
    relate_statement& to_entity(const value_bag& entity);

    relate_statement& via(const std::string& edge) { edge_ = edge; return *this; }

    relate_statement& with_data(const value_bag& data);
    relate_statement& with(const std::string& key, const json& value);
    relate_statement& with_entity(value_bag& entity, const field_descriptors& descriptors, bool encrypt = true);
    relate_statement& without_encryption() { encrypt_ = false; return *this; }

    relate_statement& return_before() { return_ = return_mode::before; return *this; }
    relate_statement& return_after() { return_ = return_mode::after; return *this; }
    relate_statement& return_diff() { return_ = return_mode::diff; return *this; }
    relate_statement& return_none() { return_ = return_mode::none; return *this; }

    relate_statement& only() { only_ = true; return *this; }
    relate_statement& timeout(std::chrono::milliseconds d) { timeout_.set(d); return *this; }

    return_mode returning() const { return return_; }
    const value_bag& data() const { return data_; }

    /// Throws missing_target if from, to or via was never set.
    std::string build() const;

private:
    std::shared_ptr<const encryption_pipeline> pipeline_;
    std::string from_;
    std::string to_;
    std::string edge_;
    value_bag data_ = json::object();
    bool encrypt_ = true;
    bool only_ = false;
    return_mode return_ = return_mode::after;
    timeout_clause timeout_;
};

} // namespace oneiros
