#include <catch2/catch_test_macros.hpp>
#include "meta/metadata_registry.hpp"
#include "fixtures/book_store_model.hpp"
#include "fixtures/error_helpers.hpp"

using namespace sqlpager;
using sqlpager::testing::make_association;
using sqlpager::testing::thrown_code;

TEST_CASE("MetadataRegistry: lookup by entity and property", "[metadata]") {
    auto meta = testing::make_book_store_metadata();

    const auto* book = meta->find_entity("Book");
    REQUIRE(book != nullptr);
    CHECK(book->table == "BOOK");
    CHECK(meta->find_entity("Publisher") == nullptr);

    const auto* store = meta->find_association("Book", "store");
    REQUIRE(store != nullptr);
    CHECK(store->target == "BookStore");
    CHECK(store->is_reference());
    CHECK(meta->find_association("Book", "publisher") == nullptr);
    CHECK(meta->find_association("BookStore", "store") == nullptr);
}

TEST_CASE("MetadataRegistry: entities are validated eagerly", "[metadata]") {
    MetadataRegistry meta;
    meta.add_entity({"Book", "BOOK", "ID"});

    CHECK(thrown_code([&] { meta.add_entity({"", "T", "ID"}); }) == QueryErrorCode::INVALID_METADATA);
    CHECK(thrown_code([&] { meta.add_entity({"Store", "", "ID"}); }) == QueryErrorCode::INVALID_METADATA);
    CHECK(thrown_code([&] { meta.add_entity({"Store", "STORE", ""}); }) == QueryErrorCode::INVALID_METADATA);
    CHECK(thrown_code([&] { meta.add_entity({"Book", "BOOK2", "ID"}); }) == QueryErrorCode::INVALID_METADATA);
    CHECK(meta.entity_count() == 1);
}

TEST_CASE("MetadataRegistry: associations are validated eagerly", "[metadata]") {
    MetadataRegistry meta;
    meta.add_entity({"Book", "BOOK", "ID"});
    meta.add_entity({"BookStore", "BOOK_STORE", "ID"});

    const auto valid = make_association("Book", "store", "BookStore", "STORE_ID", "ID", false, true, true);
    meta.add_association(valid);
    CHECK(meta.association_count() == 1);

    CHECK(thrown_code([&] { meta.add_association(valid); }) == QueryErrorCode::INVALID_METADATA);

    auto unknown_owner = valid;
    unknown_owner.owner = "Author";
    CHECK(thrown_code([&] { meta.add_association(unknown_owner); }) == QueryErrorCode::INVALID_METADATA);

    auto unknown_target = valid;
    unknown_target.property = "publisher";
    unknown_target.target = "Publisher";
    CHECK(thrown_code([&] { meta.add_association(unknown_target); }) == QueryErrorCode::INVALID_METADATA);

    auto no_columns = valid;
    no_columns.property = "shop";
    no_columns.join_columns.clear();
    CHECK(thrown_code([&] { meta.add_association(no_columns); }) == QueryErrorCode::INVALID_METADATA);

    auto empty_column = valid;
    empty_column.property = "outlet";
    empty_column.join_columns = {JoinColumn{"STORE_ID", ""}};
    CHECK(thrown_code([&] { meta.add_association(empty_column); }) == QueryErrorCode::INVALID_METADATA);

    CHECK(meta.association_count() == 1);
}
