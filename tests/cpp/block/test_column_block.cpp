/**
 * @file test_column_block.cpp
 * @brief Unit tests for ColumnBlock and ColumnBlockBuilder.
 */

#include <catch2/catch_test_macros.hpp>
#include <tsexec/block/column_block.h>

#include "helpers/block_fixtures.h"

using namespace tsexec;
using namespace tsexec::testing;

TEST_CASE("ColumnBlock - step iterator walks every column", "[block][column]") {
    auto block = make_column_block(BlockMeta{test_bounds(3), {}},
                                   {series("a", {{"n", "a"}}), series("b", {{"n", "b"}})},
                                   {{1.0, 10.0}, {2.0, 20.0}, {3.0, 30.0}});

    auto iter = block->step_iter();
    REQUIRE(iter->step_count() == 3);
    REQUIRE(iter->series_metas().size() == 2);
    CHECK(iter->series_metas()[1].name == "b");
    CHECK(iter->meta().bounds == test_bounds(3));

    std::vector<std::vector<double>> seen;
    std::vector<engine_time_t> times;
    while (iter->next()) {
        const auto &step = iter->current();
        seen.push_back(step.values());
        times.push_back(step.time());
    }

    CHECK(seen == std::vector<std::vector<double>>{{1.0, 10.0}, {2.0, 20.0}, {3.0, 30.0}});
    REQUIRE(times.size() == 3);
    CHECK(times[0] == test_bounds(3).start);
    CHECK(times[2] == test_bounds(3).time_for_index(2));

    // exhausted
    CHECK_FALSE(iter->next());
    CHECK_THROWS_AS(iter->current(), std::out_of_range);
}

TEST_CASE("ColumnBlock - current before next raises", "[block][column]") {
    auto block = block_of({series("a", {{"n", "a"}})}, 2);
    auto iter = block->step_iter();
    CHECK_THROWS_AS(iter->current(), std::out_of_range);
}

TEST_CASE("ColumnBlock - iterators are independent", "[block][column]") {
    auto block = block_of({series("a", {{"n", "a"}})}, 2);
    auto first = block->step_iter();
    auto second = block->step_iter();

    REQUIRE(first->next());
    REQUIRE(first->next());
    REQUIRE(second->next());
    CHECK(first->current().values() == std::vector<double>{1.0});
    CHECK(second->current().values() == std::vector<double>{0.0});
}

TEST_CASE("ColumnBlock - empty block", "[block][column]") {
    auto block = make_column_block(BlockMeta{test_bounds(0), {}}, {}, {});
    auto iter = block->step_iter();
    CHECK(iter->step_count() == 0);
    CHECK(iter->series_metas().empty());
    CHECK_FALSE(iter->next());
}

TEST_CASE("ColumnBlock - series without values keep their columns", "[block][column]") {
    auto block = make_column_block(BlockMeta{test_bounds(4), {}}, {}, {{}, {}, {}, {}});
    auto iter = block->step_iter();
    CHECK(iter->step_count() == 4);
    size_t steps = 0;
    while (iter->next()) {
        CHECK(iter->current().values().empty());
        ++steps;
    }
    CHECK(steps == 4);
}

TEST_CASE("ColumnBlock - rows must match the series count", "[block][column]") {
    CHECK_THROWS_AS(make_column_block(BlockMeta{test_bounds(2), {}}, {series("a", {{"n", "a"}})}, {{1.0}, {1.0, 2.0}}),
                    std::invalid_argument);
}

TEST_CASE("ColumnBlockBuilder - append into allocated columns", "[block][builder]") {
    ColumnBlockBuilder builder{BlockMeta{test_bounds(2), Tags{{"k", "v"}}}, {series("a", {{"n", "a"}})}};
    builder.add_cols(1);
    builder.add_cols(1);
    builder.append_value(0, 5.0);
    builder.append_value(1, 6.0);

    auto block = builder.build();
    const auto &column_block = as_column_block(block);
    CHECK(column_block.step_count() == 2);
    CHECK(column_block.meta().tags == Tags{{"k", "v"}});
    CHECK(column_block.columns() == std::vector<std::vector<double>>{{5.0}, {6.0}});
}

TEST_CASE("ColumnBlockBuilder - append outside the columns raises", "[block][builder]") {
    ColumnBlockBuilder builder{BlockMeta{test_bounds(1), {}}, {series("a", {{"n", "a"}})}};
    CHECK_THROWS_AS(builder.append_value(0, 1.0), std::out_of_range);
    builder.add_cols(1);
    CHECK_NOTHROW(builder.append_value(0, 1.0));
    CHECK_THROWS_AS(builder.append_value(1, 1.0), std::out_of_range);
}

TEST_CASE("ColumnBlockBuilder - build leaves the builder empty", "[block][builder]") {
    ColumnBlockBuilder builder{BlockMeta{test_bounds(1), {}}, {series("a", {{"n", "a"}})}};
    builder.add_cols(1);
    builder.append_value(0, 1.0);
    auto first = builder.build();

    auto second = builder.build();
    CHECK(as_column_block(first).step_count() == 1);
    CHECK(as_column_block(second).step_count() == 0);
    CHECK(as_column_block(second).series_metas().empty());
}
