#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "analyzer/clause_usage_analyzer.hpp"
#include "ast/query.hpp"
#include "optimizer/join_eliminator.hpp"
#include "rewriter/query_reselector.hpp"
#include "fixtures/book_store_model.hpp"

using namespace sqlpager;

namespace {

PruneResult prune_count_query(const Query& q, JoinEliminator eliminator = JoinEliminator{}) {
    const auto count = QueryReselector::count_query(q);
    return eliminator.prune(*count, ClauseUsageAnalyzer::analyze(q));
}

EliminationVerdict verdict_of(const PruneResult& result, const TableReference& table) {
    for (const auto& d : result.decisions) {
        if (d.table == &table) return d.verdict;
    }
    FAIL("no decision for " << table.path());
    return EliminationVerdict::ROOT;
}

} // anonymous namespace

TEST_CASE("JoinEliminator: unused left join is eliminated", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    q->order_by(expr::col(store, "NAME"));

    const auto result = prune_count_query(*q);

    CHECK(verdict_of(result, q->root()) == EliminationVerdict::ROOT);
    CHECK(verdict_of(result, store) == EliminationVerdict::ELIMINATED);
    CHECK_FALSE(result.is_retained(store));
    CHECK(result.is_retained(q->root()));
    CHECK(result.eliminated_count() == 1);
}

TEST_CASE("JoinEliminator: inner join over nullable foreign key is retained", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::INNER);
    q->order_by(expr::col(store, "NAME"));

    const auto result = prune_count_query(*q);

    CHECK(verdict_of(result, store) == EliminationVerdict::INNER_JOIN_NOT_GUARANTEED);
    CHECK(result.is_retained(store));
}

TEST_CASE("JoinEliminator: inner join over non-null foreign key is eliminated", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& edition = q->join(q->root(), "edition", JoinType::INNER);
    q->select(expr::col(edition, "YEAR"));

    const auto result = prune_count_query(*q);
    CHECK(verdict_of(result, edition) == EliminationVerdict::ELIMINATED);
}

TEST_CASE("JoinEliminator: inner join over a computed association is retained", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& detail = q->join(q->root(), "detail", JoinType::INNER);

    const auto result = prune_count_query(*q);
    CHECK(verdict_of(result, detail) == EliminationVerdict::INNER_JOIN_NOT_GUARANTEED);

    auto q2 = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& outer_detail = q2->join(q2->root(), "detail", JoinType::LEFT_OUTER);
    CHECK(verdict_of(prune_count_query(*q2), outer_detail) == EliminationVerdict::ELIMINATED);
}

TEST_CASE("JoinEliminator: collection join is never eliminated", "[eliminator]") {
    const auto join_type = GENERATE(JoinType::INNER, JoinType::LEFT_OUTER);

    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& chapters = q->join(q->root(), "chapters", join_type);

    const auto result = prune_count_query(*q);
    CHECK(verdict_of(result, chapters) == EliminationVerdict::COLLECTION_ASSOCIATION);
    CHECK(result.is_retained(chapters));
}

TEST_CASE("JoinEliminator: join used by where is retained", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    q->where(expr::eq(expr::col(store, "NAME"), std::string("MANNING")));

    const auto result = prune_count_query(*q);
    CHECK(verdict_of(result, store) == EliminationVerdict::FILTER_USAGE);
}

TEST_CASE("JoinEliminator: join used only by having is retained", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    const auto& edition = q->join(q->root(), "edition", JoinType::LEFT_OUTER);
    q->having(expr::is_not_null(expr::col(store, "NAME")));

    const auto result = prune_count_query(*q);
    CHECK(verdict_of(result, store) == EliminationVerdict::FILTER_USAGE);
    CHECK(result.is_retained(store));
    CHECK(verdict_of(result, edition) == EliminationVerdict::ELIMINATED);
}

TEST_CASE("JoinEliminator: join used by the derived select is retained", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    q->order_by(expr::col(store, "NAME"));

    const auto derived = QueryReselector::reselect(*q, {expr::count_distinct(expr::id(store))});
    const auto result = JoinEliminator{}.prune(*derived, ClauseUsageAnalyzer::analyze(*q));

    CHECK(verdict_of(result, store) == EliminationVerdict::COUNT_SELECT_USAGE);
}

TEST_CASE("JoinEliminator: retained descendant keeps its ancestors", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    const auto& country = q->join(store, "country", JoinType::LEFT_OUTER);
    q->where(expr::eq(expr::col(country, "CODE"), std::string("NL")));

    const auto result = prune_count_query(*q);

    // Deep filter usage marks the whole path
    CHECK(verdict_of(result, country) == EliminationVerdict::FILTER_USAGE);
    CHECK(verdict_of(result, store) == EliminationVerdict::FILTER_USAGE);
}

TEST_CASE("JoinEliminator: eliminable join under a retained descendant", "[eliminator]") {
    auto meta = testing::make_book_store_metadata();
    auto q = Query::create(meta, "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    // BookStore.books is a collection: never eliminable, so store must stay
    const auto& books = q->join(store, "books", JoinType::LEFT_OUTER);

    const auto result = prune_count_query(*q);

    CHECK(verdict_of(result, books) == EliminationVerdict::COLLECTION_ASSOCIATION);
    CHECK(verdict_of(result, store) == EliminationVerdict::DESCENDANT_RETAINED);
    CHECK(result.is_retained(store));
}

TEST_CASE("JoinEliminator: eliminable join under a retained ancestor", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::INNER);
    const auto& country = q->join(store, "country", JoinType::LEFT_OUTER);
    q->order_by(expr::col(country, "NAME"));

    const auto result = prune_count_query(*q);

    CHECK(verdict_of(result, store) == EliminationVerdict::INNER_JOIN_NOT_GUARANTEED);
    CHECK(verdict_of(result, country) == EliminationVerdict::ANCESTOR_RETAINED);
    CHECK(result.is_retained(country));
}

TEST_CASE("JoinEliminator: whole unused chain is eliminated", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    const auto& country = q->join(store, "country", JoinType::INNER);
    q->select(expr::col(country, "NAME"));
    q->order_by(expr::col(store, "NAME"));

    const auto result = prune_count_query(*q);

    CHECK(verdict_of(result, store) == EliminationVerdict::ELIMINATED);
    CHECK(verdict_of(result, country) == EliminationVerdict::ELIMINATED);
    CHECK(result.retained.size() == 1);
}

TEST_CASE("JoinEliminator: disabled optimizer retains everything", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);

    const JoinEliminator disabled(JoinEliminator::Config{false});
    CHECK_FALSE(disabled.is_enabled());

    const auto result = prune_count_query(*q, disabled);
    CHECK(verdict_of(result, store) == EliminationVerdict::OPTIMIZATION_DISABLED);
    CHECK(result.eliminated_count() == 0);
}

TEST_CASE("JoinEliminator: non-derived query retains everything", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);

    const auto result = JoinEliminator{}.prune(*q, ClauseUsageAnalyzer::analyze(*q));
    CHECK(verdict_of(result, store) == EliminationVerdict::OPTIMIZATION_DISABLED);
    CHECK(result.is_retained(store));
}

TEST_CASE("JoinEliminator: decisions follow registry order", "[eliminator]") {
    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", JoinType::LEFT_OUTER);
    const auto& edition = q->join(q->root(), "edition");
    const auto& country = q->join(store, "country");

    const auto result = prune_count_query(*q);
    REQUIRE(result.decisions.size() == 4);
    CHECK(result.decisions[0].table == &q->root());
    CHECK(result.decisions[1].table == &store);
    CHECK(result.decisions[2].table == &edition);
    CHECK(result.decisions[3].table == &country);
}

// ============================================================================
// Properties over every combination of join types and usages
// ============================================================================

namespace {

enum class Usage { NONE, SELECT, WHERE, HAVING, ORDER_BY };

void use(Query& q, const TableReference& table, Usage usage) {
    switch (usage) {
        case Usage::NONE: break;
        case Usage::SELECT: q.select(expr::col(table, "NAME")); break;
        case Usage::WHERE: q.where(expr::is_not_null(expr::col(table, "NAME"))); break;
        case Usage::HAVING: q.having(expr::is_not_null(expr::col(table, "NAME"))); break;
        case Usage::ORDER_BY: q.order_by(expr::col(table, "NAME")); break;
    }
}

// Count query selects only the root id, so filter usage is the only usage that matters
bool locally_eliminable(const TableReference& r, const ClauseUsage& usage) {
    const AssociationDescriptor& a = *r.association();
    if (a.is_collection || usage.is_used_by_filter(r)) return false;
    return r.join_type() == JoinType::LEFT_OUTER || (a.is_based_on_foreign_key && !a.is_nullable);
}

} // anonymous namespace

TEST_CASE("JoinEliminator: soundness, collection preservation and path consistency", "[eliminator][property]") {
    const auto store_join = GENERATE(JoinType::INNER, JoinType::LEFT_OUTER);
    const auto country_join = GENERATE(JoinType::INNER, JoinType::LEFT_OUTER);
    const auto edition_join = GENERATE(JoinType::INNER, JoinType::LEFT_OUTER);
    const auto books_join = GENERATE(JoinType::INNER, JoinType::LEFT_OUTER);
    const auto store_usage = GENERATE(Usage::NONE, Usage::SELECT, Usage::WHERE, Usage::HAVING, Usage::ORDER_BY);
    const auto country_usage = GENERATE(Usage::NONE, Usage::SELECT, Usage::WHERE, Usage::HAVING, Usage::ORDER_BY);
    const auto with_books = GENERATE(false, true);

    auto q = Query::create(testing::make_book_store_metadata(), "Book");
    const auto& store = q->join(q->root(), "store", store_join);
    const auto& country = q->join(store, "country", country_join);
    const auto& edition = q->join(q->root(), "edition", edition_join);
    if (with_books) {
        (void)q->join(store, "books", books_join);
    }
    use(*q, store, store_usage);
    use(*q, country, country_usage);
    use(*q, edition, Usage::ORDER_BY);

    const auto usage = ClauseUsageAnalyzer::analyze(*q);
    const auto result = prune_count_query(*q);

    REQUIRE(result.decisions.size() == q->registry().size());

    for (const auto& ref : q->registry().references()) {
        const TableReference& r = *ref;
        if (r.is_root()) {
            CHECK(result.is_retained(r));
            continue;
        }

        // Soundness
        if (usage.is_used_by_filter(r)) {
            CHECK(result.is_retained(r));
        }

        // Collection preservation
        if (r.association()->is_collection) {
            CHECK(result.is_retained(r));
        }

        // Path consistency
        if (!result.is_retained(r)) {
            for (const auto& other : q->registry().references()) {
                if (other->is_descendant_of(r)) {
                    CHECK_FALSE(result.is_retained(*other));
                }
            }
        } else {
            for (const TableReference* p = r.parent(); p != nullptr; p = p->parent()) {
                CHECK(result.is_retained(*p));
            }
        }

        // Retained set and decisions agree
        CHECK(result.is_retained(r) == (verdict_of(result, r) != EliminationVerdict::ELIMINATED));

        // Eliminated exactly when the path and the subtree are all eliminable
        bool expect_eliminated = true;
        for (const TableReference* p = &r; !p->is_root(); p = p->parent()) {
            expect_eliminated = expect_eliminated && locally_eliminable(*p, usage);
        }
        for (const auto& other : q->registry().references()) {
            if (other->is_descendant_of(r)) {
                expect_eliminated = expect_eliminated && locally_eliminable(*other, usage);
            }
        }
        CHECK(result.is_retained(r) == !expect_eliminated);
    }
}
