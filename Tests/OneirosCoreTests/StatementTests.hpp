#pragma once

#include <OneirosCore.hpp>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace statement_tests {

using namespace std::chrono_literals;
using oneiros::json;

// ============================================================================
// Clauses
// ============================================================================

void test_where_clause() {
    std::cout << "  test_where_clause..." << std::flush;

    oneiros::where_clause where;
    assert(where.empty());
    assert(where.render().empty());

    where.add("age > 18");
    where.add("AND country = 'DE'");
    assert(where.render() == " WHERE age > 18 AND country = 'DE'");

    // Repeating the last condition changes nothing
    where.add("AND country = 'DE'");
    assert(where.render() == " WHERE age > 18 AND country = 'DE'");

    where.add("or vip = true");
    assert(where.render() == " WHERE age > 18 AND country = 'DE' OR vip = true");

    // An earlier condition added again later is a new term of the expression
    oneiros::where_clause positional;
    positional.add("a = 1").or_("b = 2").and_("c = 3").or_("d = 4").and_("c = 3");
    assert(positional.render() == " WHERE a = 1 OR b = 2 AND c = 3 OR d = 4 AND c = 3");
    assert(oneiros::mutation_statement::remove(oneiros::statement_target::table("person")).where("a = 1").where("OR b = 2")
               .where("c = 3").where("OR d = 4").where("c = 3").build() ==
           "DELETE person WHERE a = 1 OR b = 2 AND c = 3 OR d = 4 AND c = 3");

    oneiros::where_clause implicit;
    implicit.add("a = 1").add("b = 2").or_("c = 3");
    assert(implicit.render() == " WHERE a = 1 AND b = 2 OR c = 3");

    // A leading operator on the first condition is dropped
    oneiros::where_clause leading;
    leading.add("OR x = 1");
    assert(leading.render() == " WHERE x = 1");

    // Words that merely start with AND/OR are not operators
    oneiros::where_clause words;
    words.add("ORDERS > 1").add("ANDROID = true");
    assert(words.render() == " WHERE ORDERS > 1 AND ANDROID = true");

    // Blank input contributes nothing
    oneiros::where_clause blank;
    blank.add("   ");
    assert(blank.empty());

    std::cout << " OK" << std::endl;
}

void test_field_list_clauses() {
    std::cout << "  test_field_list_clauses..." << std::flush;

    oneiros::group_by_clause group;
    assert(group.render().empty());
    group.add("country").add("city").add("country");
    assert(group.render() == " GROUP BY country, city");

    oneiros::fetch_clause fetch;
    fetch.add(std::vector<std::string>{"friends", "friends.pets"});
    assert(fetch.render() == " FETCH friends, friends.pets");

    oneiros::omit_clause omit;
    omit.add("password");
    assert(omit.render() == " OMIT password");

    oneiros::split_clause split;
    assert(split.empty());
    split.add("emails");
    assert(split.render() == " SPLIT emails");

    std::cout << " OK" << std::endl;
}

void test_order_limit_clauses() {
    std::cout << "  test_order_limit_clauses..." << std::flush;

    oneiros::order_by_clause order("age");
    assert(order.direction() == oneiros::sort_direction::ascending);
    assert(order.render() == " ORDER BY age ASC");
    order.set_direction(oneiros::sort_direction::descending);
    assert(order.render() == " ORDER BY age DESC");
    assert(oneiros::order_by_clause().render().empty());

    oneiros::limit_clause limit(10);
    assert(limit.render() == " LIMIT 10");
    limit.start(20);
    assert(limit.render() == " LIMIT 10 START 20");
    assert(oneiros::limit_clause().render().empty());

    // START alone has no meaning without a LIMIT
    oneiros::limit_clause offset_only;
    offset_only.start(5);
    assert(!offset_only.empty());
    bool rejected = false;
    try {
        offset_only.render();
    } catch (const oneiros::configuration_error&) {
        rejected = true;
    }
    assert(rejected);

    bool select_rejected = false;
    try {
        oneiros::select_statement().from("person").start(5).build();
    } catch (const oneiros::configuration_error&) {
        select_rejected = true;
    }
    assert(select_rejected);

    std::cout << " OK" << std::endl;
}

void test_timeout_explain_clauses() {
    std::cout << "  test_timeout_explain_clauses..." << std::flush;

    assert(oneiros::timeout_clause(2000ms).render() == " TIMEOUT 2s");
    assert(oneiros::timeout_clause(1500ms).render() == " TIMEOUT 1s500ms");
    assert(oneiros::timeout_clause(250ms).render() == " TIMEOUT 0s250ms");
    assert(oneiros::timeout_clause(0ms).render() == " TIMEOUT 0s");
    assert(oneiros::timeout_clause().render().empty());

    bool threw = false;
    try {
        oneiros::timeout_clause(-5ms);
    } catch (const oneiros::configuration_error&) {
        threw = true;
    }
    assert(threw);

    assert(oneiros::explain_clause().render().empty());
    assert(oneiros::explain_clause(oneiros::explain_clause::mode::plain).render() == " EXPLAIN");
    assert(oneiros::explain_clause(oneiros::explain_clause::mode::full).render() == " EXPLAIN FULL");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// SELECT
// ============================================================================

void test_select_fixed_order() {
    std::cout << "  test_select_fixed_order..." << std::flush;

    // Setters called in reverse grammar order
    oneiros::select_statement select(std::vector<std::string>{"name", "age"});
    select.explain(true)
          .timeout(2s)
          .split("tags")
          .omit("password")
          .fetch("friends")
          .start(5)
          .limit(10)
          .order_by("age", oneiros::sort_direction::descending)
          .group_by("country")
          .where("age > 18")
          .from("person");

    assert(select.build() ==
           "SELECT name, age FROM person WHERE age > 18 GROUP BY country ORDER BY age DESC"
           " LIMIT 10 START 5 FETCH friends OMIT password SPLIT tags TIMEOUT 2s EXPLAIN FULL");

    std::cout << " OK" << std::endl;
}

void test_select_variants() {
    std::cout << "  test_select_variants..." << std::flush;

    oneiros::select_statement simple;
    simple.from(oneiros::statement_target::record("person", "tobie")).only();
    assert(simple.build() == "SELECT * FROM ONLY person:tobie");

    oneiros::select_statement ordered;
    ordered.from("person")
           .order_by("age", oneiros::sort_direction::descending)
           .order_by("name")
           .parallel()
           .explain();
    assert(ordered.build() == "SELECT * FROM person ORDER BY age DESC, name ASC PARALLEL EXPLAIN");

    oneiros::select_statement filtered;
    filtered.from("person").where("age > 18").and_("country = 'DE'").or_("vip = true");
    assert(filtered.build() == "SELECT * FROM person WHERE age > 18 AND country = 'DE' OR vip = true");

    bool threw = false;
    try {
        oneiros::select_statement().where("x = 1").build();
    } catch (const oneiros::missing_target&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// CREATE / UPDATE / UPSERT / DELETE / LIVE SELECT
// ============================================================================

void test_mutation_statements() {
    std::cout << "  test_mutation_statements..." << std::flush;

    using oneiros::mutation_statement;
    using oneiros::statement_target;

    auto create = mutation_statement::create(statement_target::table("person"))
        .set("name", "O'Brien")
        .set("age", 42)
        .set("active", true)
        .set("nick", nullptr);
    assert(create.build() == "CREATE person SET name = 'O\\'Brien', age = 42, active = true, nick = NONE");

    auto update = mutation_statement::update(statement_target::table("person"))
        .merge(json{{"age", 30}})
        .where("age < 30")
        .returning(oneiros::return_mode::diff)
        .timeout(1500ms);
    assert(update.build() == "UPDATE person MERGE {\"age\":30} WHERE age < 30 RETURN DIFF TIMEOUT 1s500ms");

    auto upsert = mutation_statement::upsert(statement_target::parse("person:1"))
        .content(json{{"a", 1}});
    assert(upsert.build() == "UPSERT person:1 CONTENT {\"a\":1}");

    auto remove = mutation_statement::remove(statement_target::record("person", "1"))
        .only()
        .returning(oneiros::return_mode::before);
    assert(remove.build() == "DELETE ONLY person:1 RETURN BEFORE");

    std::cout << " OK" << std::endl;
}

void test_mutation_validation() {
    std::cout << "  test_mutation_validation..." << std::flush;

    using oneiros::mutation_statement;
    using oneiros::statement_target;

    auto expect_configuration_error = [](const mutation_statement& statement) {
        bool threw = false;
        try {
            statement.build();
        } catch (const oneiros::configuration_error&) {
            threw = true;
        }
        assert(threw);
    };

    expect_configuration_error(mutation_statement::remove(statement_target::table("t")).content(json{{"a", 1}}));
    expect_configuration_error(mutation_statement::create(statement_target::table("t")).where("a = 1"));
    expect_configuration_error(mutation_statement::create(statement_target::table("t")).merge(json::object()));
    expect_configuration_error(mutation_statement::update(statement_target::table("t"))
                                   .set("a", 1).content(json{{"a", 2}}));
    expect_configuration_error(mutation_statement::create(statement_target::relation("a:1", "e", "b:1")));

    bool missing = false;
    try {
        mutation_statement::create(statement_target()).build();
    } catch (const oneiros::missing_target&) {
        missing = true;
    }
    assert(missing);

    std::cout << " OK" << std::endl;
}

void test_live_select_statement() {
    std::cout << "  test_live_select_statement..." << std::flush;

    assert(oneiros::live_select_statement().diff().from("person").where("age > 18").build() ==
           "LIVE SELECT DIFF FROM person WHERE age > 18");
    assert(oneiros::live_select_statement().field("name").from("person").fetch("friends").build() ==
           "LIVE SELECT name FROM person FETCH friends");

    bool threw = false;
    try {
        oneiros::live_select_statement().build();
    } catch (const oneiros::missing_target&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// RELATE
// ============================================================================

void test_relate_statement() {
    std::cout << "  test_relate_statement..." << std::flush;

    auto sql = oneiros::relate_statement()
        .from("user:alice")
        .to("product:laptop")
        .via("purchased")
        .with_data(json{{"price", 999.99}})
        .build();
    assert(sql == "RELATE user:alice->purchased->product:laptop CONTENT {\"price\":999.99} RETURN AFTER");

    // Return modes replace each other
    auto modes = oneiros::relate_statement()
        .from(oneiros::record_id("user", "bob"))
        .to(oneiros::record_id("user", "carol"))
        .via("knows")
        .return_before()
        .return_diff();
    assert(modes.returning() == oneiros::return_mode::diff);
    assert(modes.build() == "RELATE user:bob->knows->user:carol RETURN DIFF");

    auto timed = oneiros::relate_statement()
        .from_entity(json{{"id", "user:alice"}, {"name", "Alice"}})
        .to_entity(json{{"id", "post:1"}})
        .via("wrote")
        .with("at", "2024-01-01")
        .only()
        .timeout(2s);
    assert(timed.build() ==
           "RELATE ONLY user:alice->wrote->post:1 CONTENT {\"at\":\"2024-01-01\"} RETURN AFTER TIMEOUT 2s");

    std::cout << " OK" << std::endl;
}

void test_relate_missing_parts() {
    std::cout << "  test_relate_missing_parts..." << std::flush;

    auto expect_missing = [](const oneiros::relate_statement& statement) {
        bool threw = false;
        try {
            statement.build();
        } catch (const oneiros::missing_target&) {
            threw = true;
        }
        assert(threw);
    };

    expect_missing(oneiros::relate_statement().from("user:alice").via("purchased"));
    expect_missing(oneiros::relate_statement().to("product:laptop").via("purchased"));
    expect_missing(oneiros::relate_statement().from("user:alice").to("product:laptop"));

    // missing_target is a configuration failure of the builder
    bool as_configuration_error = false;
    try {
        oneiros::relate_statement().build();
    } catch (const oneiros::configuration_error&) {
        as_configuration_error = true;
    }
    assert(as_configuration_error);

    bool no_id = false;
    try {
        oneiros::relate_statement().from_entity(json{{"name", "nobody"}});
    } catch (const oneiros::configuration_error&) {
        no_id = true;
    }
    assert(no_id);

    std::cout << " OK" << std::endl;
}

void test_relate_with_entity() {
    std::cout << "  test_relate_with_entity..." << std::flush;

    oneiros::security_config security;
    security.enabled = true;
    security.key = "relate-test-key";
    auto pipeline = std::make_shared<oneiros::encryption_pipeline>(security);

    oneiros::field_descriptors descriptors = {
        oneiros::field_descriptor::reversible("card"),
        oneiros::field_descriptor::hashed("password", oneiros::hash_kind::sha256),
        oneiros::field_descriptor::plain("note"),
    };

    json entity = {{"id", "purchase:1"}, {"card", "4111"}, {"password", "secret"}, {"note", "hi"}};

    oneiros::relate_statement relate(pipeline);
    relate.from("user:alice").to("product:laptop").via("purchased").with_entity(entity, descriptors);

    // Reversible and plain fields are restored, the hash stays
    assert(entity["card"] == "4111");
    assert(entity["note"] == "hi");
    assert(entity["password"] != "secret");
    assert(entity["password"].get<std::string>().rfind("$sha256$", 0) == 0);

    const auto& data = relate.data();
    assert(!data.contains("id"));
    assert(data["card"] != "4111");
    assert(pipeline->crypto().decrypt(data["card"].get<std::string>()) == "4111");
    assert(data["note"] == "hi");
    assert(data["password"] == entity["password"]);

    auto sql = relate.build();
    assert(sql.rfind("RELATE user:alice->purchased->product:laptop CONTENT {", 0) == 0);
    assert(sql.find("4111") == std::string::npos);

    // Without encryption the entity's values go in as they are
    json plain_entity = {{"id", "purchase:2"}, {"card", "5500"}};
    oneiros::relate_statement unencrypted(pipeline);
    unencrypted.from("a:1").to("b:1").via("e").without_encryption().with_entity(plain_entity, descriptors);
    assert(unencrypted.data()["card"] == "5500");
    assert(plain_entity["card"] == "5500");

    oneiros::relate_statement skipped(pipeline);
    skipped.from("a:1").to("b:1").via("e").with_entity(plain_entity, descriptors, false);
    assert(skipped.data()["card"] == "5500");

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing statement clauses and builders..." << std::endl;
    test_where_clause();
    test_field_list_clauses();
    test_order_limit_clauses();
    test_timeout_explain_clauses();
    test_select_fixed_order();
    test_select_variants();
    test_mutation_statements();
    test_mutation_validation();
    test_live_select_statement();
    test_relate_statement();
    test_relate_missing_parts();
    test_relate_with_entity();
}

} // namespace statement_tests
