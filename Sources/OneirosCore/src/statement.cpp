#include "oneiros/statement.hpp"
#include "oneiros/errors.hpp"

#include <algorithm>

namespace oneiros {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

void add_unique(std::vector<std::string>& fields, const std::string& f) {
    if (!f.empty() && std::find(fields.begin(), fields.end(), f) == fields.end()) {
        fields.push_back(f);
    }
}

std::string render_return(return_mode mode) {
    return std::string(" RETURN ") + to_string(mode);
}

std::string entity_id(const value_bag& entity) {
    if (!entity.is_object()) {
        throw configuration_error("entity must be an object");
    }
    auto it = entity.find("id");
    if (it == entity.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw configuration_error("entity has no record id");
    }
    return it->get<std::string>();
}

// Copies the value at a dotted path from `src` into `dst`, creating objects on the way.
void copy_path(value_bag& dst, const value_bag& src, const std::string& path) {
    const json* from = &src;
    json* to = &dst;
    std::size_t begin = 0;
    while (true) {
        std::size_t dot = path.find('.', begin);
        std::string key = path.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (!from->is_object() || !to->is_object()) return;
        auto it = from->find(key);
        if (it == from->end()) return;
        if (dot == std::string::npos) {
            (*to)[key] = *it;
            return;
        }
        from = &*it;
        to = &(*to)[key];
        begin = dot + 1;
    }
}

} // namespace

const char* to_string(return_mode mode) {
    switch (mode) {
        case return_mode::none: return "NONE";
        case return_mode::before: return "BEFORE";
        case return_mode::after: return "AFTER";
        case return_mode::diff: return "DIFF";
    }
    return "AFTER";
}

// ============================================================================
// statement_target
// ============================================================================

statement_target statement_target::table(std::string name) {
    return statement_target(kind::table, std::move(name));
}

statement_target statement_target::record(const std::string& table, const std::string& id) {
    if (table.empty() || id.empty()) return {};
    return statement_target(kind::record, table + ":" + id);
}

statement_target statement_target::record(const record_id& id) {
    return record(id.table, id.id);
}

statement_target statement_target::parse(const std::string& text) {
    auto id = record_id::parse(text);
    if (!id.empty()) return record(id);
    return table(text);
}

statement_target statement_target::relation(const std::string& from, const std::string& edge,
                                            const std::string& to) {
    if (from.empty() || edge.empty() || to.empty()) return {};
    return statement_target(kind::relation, from + "->" + edge + "->" + to);
}

// ============================================================================
// select_statement
// ============================================================================

select_statement::select_statement(const std::vector<std::string>& projection) {
    for (const auto& f : projection) add_unique(projection_, f);
}

select_statement& select_statement::field(const std::string& f) {
    add_unique(projection_, f);
    return *this;
}

select_statement& select_statement::from(const statement_target& target) {
    target_ = target;
    return *this;
}

select_statement& select_statement::order_by(const std::string& f, sort_direction direction) {
    for (auto& existing : order_by_) {
        if (existing.field() == f) {
            existing.set_direction(direction);
            return *this;
        }
    }
    order_by_.emplace_back(f, direction);
    return *this;
}

select_statement& select_statement::explain(bool full) {
    explain_.set(full ? explain_clause::mode::full : explain_clause::mode::plain);
    return *this;
}

std::string select_statement::build() const {
    if (target_.empty()) {
        throw missing_target("SELECT needs a target");
    }

    std::string sql = "SELECT ";
    sql += projection_.empty() ? "*" : join(projection_, ", ");
    sql += " FROM ";
    if (only_) sql += "ONLY ";
    sql += target_.render();

    sql += where_.render();
    sql += group_by_.render();
    if (order_by_.size() == 1) {
        sql += order_by_.front().render();
    } else if (!order_by_.empty()) {
        std::vector<std::string> terms;
        for (const auto& o : order_by_) terms.push_back(o.term());
        sql += " ORDER BY " + join(terms, ", ");
    }
    sql += limit_.render();
    sql += fetch_.render();
    sql += omit_.render();
    sql += split_.render();
    sql += timeout_.render();
    sql += parallel_.render();
    sql += explain_.render();
    return sql;
}

// ============================================================================
// mutation_statement
// ============================================================================

mutation_statement& mutation_statement::set(const std::string& field, const json& value) {
    for (auto& [name, existing] : assignments_) {
        if (name == field) {
            existing = value;
            return *this;
        }
    }
    assignments_.emplace_back(field, value);
    return *this;
}

mutation_statement& mutation_statement::content(const value_bag& data) {
    content_ = data;
    return *this;
}

mutation_statement& mutation_statement::merge(const value_bag& data) {
    merge_ = data;
    return *this;
}

std::string mutation_statement::format_literal(const json& value) {
    if (value.is_null()) return "NONE";
    if (value.is_string()) {
        std::string out = "'";
        for (char c : value.get_ref<const std::string&>()) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        out += '\'';
        return out;
    }
    return value.dump();
}

std::string mutation_statement::build() const {
    const char* keyword = "CREATE";
    switch (kind_) {
        case statement_kind::create: keyword = "CREATE"; break;
        case statement_kind::update: keyword = "UPDATE"; break;
        case statement_kind::upsert: keyword = "UPSERT"; break;
        case statement_kind::remove: keyword = "DELETE"; break;
    }

    if (target_.empty()) {
        throw missing_target(std::string(keyword) + " needs a target");
    }
    if (target_.type() == statement_target::kind::relation) {
        throw configuration_error(std::string(keyword) + " does not take a graph target");
    }

    int bodies = (assignments_.empty() ? 0 : 1) + (content_ ? 1 : 0) + (merge_ ? 1 : 0);
    if (bodies > 1) {
        throw configuration_error("SET, CONTENT and MERGE are mutually exclusive");
    }
    if (kind_ == statement_kind::remove && bodies > 0) {
        throw configuration_error("DELETE does not take data");
    }
    if (kind_ == statement_kind::create && merge_) {
        throw configuration_error("CREATE does not support MERGE");
    }
    if (kind_ == statement_kind::create && !where_.empty()) {
        throw configuration_error("CREATE does not support WHERE");
    }

    std::string sql = keyword;
    sql += ' ';
    if (only_) sql += "ONLY ";
    sql += target_.render();

    if (!assignments_.empty()) {
        std::vector<std::string> parts;
        for (const auto& [name, value] : assignments_) {
            parts.push_back(name + " = " + format_literal(value));
        }
        sql += " SET " + join(parts, ", ");
    } else if (content_) {
        sql += " CONTENT " + content_->dump();
    } else if (merge_) {
        sql += " MERGE " + merge_->dump();
    }

    sql += where_.render();
    if (return_) sql += render_return(*return_);
    sql += timeout_.render();
    return sql;
}

// ============================================================================
// live_select_statement
// ============================================================================

live_select_statement& live_select_statement::field(const std::string& f) {
    add_unique(projection_, f);
    return *this;
}

std::string live_select_statement::build() const {
    if (table_.empty()) {
        throw missing_target("LIVE SELECT needs a table");
    }
    std::string sql = "LIVE SELECT ";
    if (diff_) {
        sql += "DIFF";
    } else {
        sql += projection_.empty() ? "*" : join(projection_, ", ");
    }
    sql += " FROM " + table_;
    sql += where_.render();
    sql += fetch_.render();
    return sql;
}

// ============================================================================
// relate_statement
// ============================================================================

relate_statement& relate_statement::from_entity(const value_bag& entity) {
    from_ = entity_id(entity);
    return *this;
}

relate_statement& relate_statement::to_entity(const value_bag& entity) {
    to_ = entity_id(entity);
    return *this;
}

relate_statement& relate_statement::with_data(const value_bag& data) {
    if (!data.is_object()) {
        throw configuration_error("relation data must be an object");
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        data_[it.key()] = it.value();
    }
    return *this;
}

relate_statement& relate_statement::with(const std::string& key, const json& value) {
    data_[key] = value;
    return *this;
}

relate_statement& relate_statement::with_entity(value_bag& entity, const field_descriptors& descriptors,
                                                bool encrypt) {
    if (!entity.is_object()) {
        throw configuration_error("entity must be an object");
    }

    bool transform = encrypt && encrypt_ && pipeline_ && pipeline_->enabled();
    value_bag original = entity;
    try {
        if (transform) {
            pipeline_->encrypt_fields(entity, descriptors);
        }
        for (auto it = entity.begin(); it != entity.end(); ++it) {
            if (it.key() == "id") continue;
            data_[it.key()] = it.value();
        }
    } catch (...) {
        entity = std::move(original);
        throw;
    }

    if (transform) {
        // Hashes cannot be reversed; keep them on the caller's object.
        value_bag transformed = std::move(entity);
        entity = std::move(original);
        for (const auto& d : descriptors) {
            if (d.algorithm == field_algorithm::one_way_hash) {
                copy_path(entity, transformed, d.field_name);
            }
        }
    }
    return *this;
}

std::string relate_statement::build() const {
    if (from_.empty()) {
        throw missing_target("RELATE needs a source record (from)");
    }
    if (to_.empty()) {
        throw missing_target("RELATE needs a destination record (to)");
    }
    if (edge_.empty()) {
        throw missing_target("RELATE needs an edge table (via)");
    }

    std::string sql = "RELATE ";
    if (only_) sql += "ONLY ";
    sql += from_ + "->" + edge_ + "->" + to_;
    if (!data_.empty()) {
        sql += " CONTENT " + data_.dump();
    }
    sql += render_return(return_);
    sql += timeout_.render();
    return sql;
}

} // namespace oneiros
