#include <catch2/catch_test_macros.hpp>
#include "ast/query.hpp"
#include "fixtures/book_store_model.hpp"
#include "fixtures/error_helpers.hpp"

#include <stdexcept>

using namespace sqlpager;
using sqlpager::testing::thrown_code;

TEST_CASE("JoinRegistry: same parent, association and join type yields one reference", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");

    const auto& a = q->join(q->root(), "store");
    const auto& b = q->join(q->root(), "store");

    CHECK(&a == &b);
    CHECK(q->registry().size() == 2);
}

TEST_CASE("JoinRegistry: different join type yields a distinct reference", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");

    const auto& inner = q->join(q->root(), "store", JoinType::INNER);
    const auto& outer = q->join(q->root(), "store", JoinType::LEFT_OUTER);

    CHECK(&inner != &outer);
    CHECK(q->registry().size() == 3);
    CHECK(inner.path() == "Book.store");
    CHECK(outer.path() == "Book.store?");
}

TEST_CASE("JoinRegistry: dedup is per parent", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");

    const auto& inner_store = q->join(q->root(), "store", JoinType::INNER);
    const auto& outer_store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    const auto& c1 = q->join(inner_store, "country");
    const auto& c2 = q->join(outer_store, "country");
    const auto& c1_again = q->join(inner_store, "country");

    CHECK(&c1 != &c2);
    CHECK(&c1 == &c1_again);
    CHECK(c1.parent() == &inner_store);
    CHECK(c2.depth() == 2);
    CHECK(c2.is_descendant_of(outer_store));
    CHECK_FALSE(c2.is_descendant_of(inner_store));
    CHECK(c2.path() == "Book.store?.country");
}

TEST_CASE("JoinRegistry: references are kept in registration order", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store");
    const auto& edition = q->join(q->root(), "edition");
    const auto& country = q->join(store, "country");

    const auto& refs = q->registry().references();
    REQUIRE(refs.size() == 4);
    CHECK(refs[0]->is_root());
    CHECK(refs[1].get() == &store);
    CHECK(refs[2].get() == &edition);
    CHECK(refs[3].get() == &country);

    const auto children = q->registry().children_of(q->root());
    REQUIRE(children.size() == 2);
    CHECK(children[0] == &store);
    CHECK(children[1] == &edition);
}

TEST_CASE("JoinRegistry: unknown association is rejected", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");

    CHECK(thrown_code([&] { (void)q->join(q->root(), "publisher"); }) ==
          QueryErrorCode::UNKNOWN_ASSOCIATION);
    CHECK(q->registry().size() == 1);
}

TEST_CASE("JoinRegistry: parent of another query is rejected", "[join_registry]") {
    auto meta = testing::make_book_store_metadata();
    auto q1 = Query::create(meta, "Book");
    auto q2 = Query::create(meta, "Book");

    CHECK(thrown_code([&] { (void)q1->join(q2->root(), "store"); }) == QueryErrorCode::INVALID_JOIN);
}

TEST_CASE("JoinRegistry: association owner must match the parent entity", "[join_registry]") {
    auto meta = testing::make_book_store_metadata();
    JoinRegistry registry(*meta->find_entity("Book"), "books");

    const auto* country = meta->find_association("BookStore", "country");
    REQUIRE(country != nullptr);

    CHECK(thrown_code([&] {
        (void)registry.join(registry.root(), *country, *meta->find_entity("Country"), JoinType::INNER);
    }) == QueryErrorCode::INVALID_JOIN);
}

TEST_CASE("JoinRegistry: frozen registry rejects new joins", "[join_registry]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store");
    q->freeze();

    CHECK(q->frozen());
    CHECK(thrown_code([&] { (void)q->join(q->root(), "edition"); }) == QueryErrorCode::QUERY_FROZEN);
    CHECK(thrown_code([&] { (void)q->join(q->root(), "store"); }) == QueryErrorCode::QUERY_FROZEN);
    CHECK(thrown_code([&] { q->where(expr::is_null(expr::col(store, "NAME"))); }) ==
          QueryErrorCode::QUERY_FROZEN);
}

TEST_CASE("Query: unknown root entity is rejected", "[query]") {
    CHECK(thrown_code([] {
        (void)Query::create(testing::make_book_store_metadata(), "Publisher");
    }) == QueryErrorCode::UNKNOWN_ENTITY);
}

TEST_CASE("Query: columns of another query are rejected", "[query]") {
    auto meta = testing::make_book_store_metadata();
    auto q1 = Query::create(meta, "Book");
    auto q2 = Query::create(meta, "Book");

    CHECK(thrown_code([&] { q1->where(expr::eq(expr::col(q2->root(), "NAME"), std::string("x"))); }) ==
          QueryErrorCode::FOREIGN_TABLE_REFERENCE);
    CHECK(q1->predicates().empty());
}

TEST_CASE("Query: sub-query may reference enclosing tables, not the reverse", "[query]") {
    auto meta = testing::make_book_store_metadata();
    auto q = Query::create(meta, "Book");
    auto sub = q->subquery("Chapter");

    CHECK(sub->name() == "Book/Chapter");
    CHECK(sub->can_see(q->root()));
    CHECK_FALSE(q->can_see(sub->root()));

    sub->where(expr::eq(expr::col(sub->root(), "BOOK_ID"), expr::id(q->root())));
    CHECK(sub->predicates().size() == 1);

    CHECK(thrown_code([&] { q->order_by(expr::col(sub->root(), "TITLE")); }) ==
          QueryErrorCode::FOREIGN_TABLE_REFERENCE);
}

TEST_CASE("Query: limit validation", "[query]") {
    auto meta = testing::make_book_store_metadata();
    auto q = Query::create(meta, "Book");

    CHECK(thrown_code([&] { q->limit(-1); }) == QueryErrorCode::INVALID_PAGING);
    CHECK(thrown_code([&] { q->limit(10, -5); }) == QueryErrorCode::INVALID_PAGING);

    q->limit(10, 20);
    REQUIRE(q->paging().has_value());
    CHECK(q->paging()->limit == 10);
    CHECK(q->paging()->offset == 20);

    auto sub = q->subquery("Chapter");
    CHECK(thrown_code([&] { sub->limit(1); }) == QueryErrorCode::INVALID_PAGING);
}

TEST_CASE("Query: null clause expressions are rejected", "[query]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");

    CHECK_THROWS_AS(q->select(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(q->where(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(q->group_by(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(q->having(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(q->order_by(nullptr, OrderMode::DESC), std::invalid_argument);

    CHECK(q->selections().empty());
    CHECK(q->predicates().empty());
    CHECK(q->group_by_items().empty());
    CHECK(q->having_predicates().empty());
    CHECK(q->orderings().empty());
}
