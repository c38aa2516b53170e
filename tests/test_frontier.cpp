#include <doctest/doctest.h>

#include "BestFirstFrontier.h"

TEST_CASE("BestFirstFrontier: smallest key first")
{
    BestFirstFrontier frontier;
    frontier.push({0, 0}, 5.0);
    frontier.push({0, 1}, 1.0);
    frontier.push({0, 2}, 3.0);
    CHECK(frontier.liveSize() == 3);

    auto first = frontier.pop();
    REQUIRE(first);
    CHECK(first->cell == GridCell{0, 1});
    CHECK(first->key == doctest::Approx(1.0));

    CHECK(frontier.pop()->cell == GridCell{0, 2});
    CHECK(frontier.pop()->cell == GridCell{0, 0});
    CHECK(frontier.empty());
    CHECK_FALSE(frontier.pop());
}

TEST_CASE("BestFirstFrontier: equal keys pop in insertion order")
{
    BestFirstFrontier frontier;
    frontier.push({2, 0}, 4.0);
    frontier.push({1, 0}, 4.0);
    frontier.push({0, 0}, 4.0);

    CHECK(frontier.pop()->cell == GridCell{2, 0});
    CHECK(frontier.pop()->cell == GridCell{1, 0});
    CHECK(frontier.pop()->cell == GridCell{0, 0});
}

TEST_CASE("BestFirstFrontier: invalidated entries are skipped lazily")
{
    BestFirstFrontier frontier;
    size_t old = frontier.push({1, 1}, 2.0);
    frontier.push({0, 0}, 3.0);

    // re-insertion with a better key supersedes the old entry
    frontier.invalidate(old);
    size_t fresh = frontier.push({1, 1}, 1.0);
    CHECK(frontier.liveSize() == 2);
    CHECK(frontier.arenaSize() == 3);
    CHECK(frontier.entry(old).stale);
    CHECK_FALSE(frontier.entry(fresh).stale);

    auto a = frontier.pop();
    REQUIRE(a);
    CHECK(a->cell == GridCell{1, 1});
    CHECK(a->handle == fresh);

    auto b = frontier.pop();
    REQUIRE(b);
    CHECK(b->cell == GridCell{0, 0});

    // the stale copy was dropped on the way to (0,0)
    CHECK_FALSE(frontier.pop());
    CHECK(frontier.staleSkipped() == 1);
    CHECK(frontier.empty());
}

TEST_CASE("BestFirstFrontier: invalidate is idempotent and ignores popped handles")
{
    BestFirstFrontier frontier;
    size_t h = frontier.push({0, 0}, 1.0);
    frontier.push({0, 1}, 2.0);

    frontier.invalidate(h);
    frontier.invalidate(h);
    CHECK(frontier.liveSize() == 1);

    auto popped = frontier.pop();
    REQUIRE(popped);
    frontier.invalidate(popped->handle);
    CHECK(frontier.liveSize() == 0);

    // unknown handle
    frontier.invalidate(99);
    CHECK(frontier.liveSize() == 0);
}
