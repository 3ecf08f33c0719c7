#include <doctest/doctest.h>

#include "maze/core/Errors.hpp"
#include "maze/generation/IterativeBacktracker.hpp"
#include "maze/generation/RecursiveBacktracker.hpp"
#include "test_support/maze_fixtures.h"

#include <deque>
#include <memory>
#include <vector>

using namespace maze;

namespace {

Position far_corner(int w, int h) { return { w - 2, h - 2 }; }

bool ring_is_closed(const Grid& g)
{
    for (int x = 0; x < g.width(); ++x)
        if (g.passable(x, 0) || g.passable(x, g.height() - 1)) return false;
    for (int y = 0; y < g.height(); ++y)
        if (g.passable(0, y) || g.passable(g.width() - 1, y)) return false;
    return true;
}

size_t reachable_from(const Grid& g, Position start)
{
    std::vector<u8> seen(g.size(), 0);
    std::deque<Position> q{ start };
    seen[to_id(start.x, start.y, g.width())] = 1;
    size_t n = 0;
    while (!q.empty())
    {
        const Position p = q.front();
        q.pop_front();
        ++n;
        for (int dir = 0; dir < 4; ++dir)
        {
            const int nx = p.x + kDirX[dir], ny = p.y + kDirY[dir];
            if (!g.passable(nx, ny)) continue;
            const NodeId id = to_id(nx, ny, g.width());
            if (seen[id]) continue;
            seen[id] = 1;
            q.push_back({ nx, ny });
        }
    }
    return n;
}

std::unique_ptr<gen::IMazeGenerator> make(gen::GeneratorKind kind, rng::Seed seed)
{
    return gen::make_generator(kind, seed);
}

} // namespace

TEST_CASE("Generators/FiveByFiveIsATree") {
    for (auto kind : { gen::GeneratorKind::Iterative, gen::GeneratorKind::Recursive })
    {
        for (rng::Seed seed = 1; seed <= 40; ++seed)
        {
            CAPTURE(seed);
            auto g = make(kind, seed)->generate(5, 5, { 1, 1 }, { 3, 3 });
            CHECK(test::count_passable(g) == 7u);
            CHECK(test::count_edges(g) == 6u);
            CHECK(reachable_from(g, { 1, 1 }) == 7u);
        }
    }
}

TEST_CASE("Generators/TerminalsAndRingAreInvariant") {
    const int sizes[][2] = { { 5, 5 }, { 7, 11 }, { 21, 21 }, { 31, 9 }, { 41, 31 } };
    for (auto kind : { gen::GeneratorKind::Iterative, gen::GeneratorKind::Recursive })
    {
        for (const auto& s : sizes)
        {
            const int w = s[0], h = s[1];
            CAPTURE(w);
            CAPTURE(h);
            auto g = make(kind, 12345)->generate(w, h, { 1, 1 }, far_corner(w, h));
            CHECK(g.at(1, 1) == CellKind::Start);
            CHECK(g.at(far_corner(w, h)) == CellKind::End);
            CHECK(g.count(CellKind::Start) == 1u);
            CHECK(g.count(CellKind::End) == 1u);
            CHECK(ring_is_closed(g));
        }
    }
}

TEST_CASE("Generators/ConnectedWithAtMostOneExtraEdge") {
    for (auto kind : { gen::GeneratorKind::Iterative, gen::GeneratorKind::Recursive })
    {
        for (rng::Seed seed = 1; seed <= 30; ++seed)
        {
            CAPTURE(seed);
            auto g = make(kind, seed)->generate(21, 15, { 1, 1 }, { 19, 13 });
            const size_t cells = test::count_passable(g);
            const size_t edges = test::count_edges(g);

            CHECK(reachable_from(g, { 1, 1 }) == cells);
            // Spanning tree, plus possibly the forced exit opening.
            CHECK(edges + 1 >= cells);
            CHECK(edges <= cells);
        }
    }
}

TEST_CASE("Generators/EveryLatticeCellIsCarved") {
    auto g = gen::IterativeBacktracker(rng::Seed{ 3 }).generate(15, 11, { 1, 1 }, { 13, 9 });
    for (int y = 1; y < 11; y += 2)
        for (int x = 1; x < 15; x += 2)
            CHECK(g.passable(x, y));
}

TEST_CASE("Generators/SameSeedSameMaze") {
    gen::IterativeBacktracker a(rng::Seed{ 77 }), b(rng::Seed{ 77 });
    CHECK(a.generate(21, 21, { 1, 1 }, { 19, 19 }) == b.generate(21, 21, { 1, 1 }, { 19, 19 }));

    gen::RecursiveBacktracker c(rng::Seed{ 77 }), d(rng::Seed{ 77 });
    CHECK(c.generate(21, 21, { 1, 1 }, { 19, 19 }) == d.generate(21, 21, { 1, 1 }, { 19, 19 }));
}

TEST_CASE("Generators/StreamContinuesAndReseedRewinds") {
    gen::IterativeBacktracker g(rng::Seed{ 9 });
    const Grid first = g.generate(31, 31, { 1, 1 }, { 29, 29 });
    const Grid second = g.generate(31, 31, { 1, 1 }, { 29, 29 });
    CHECK(first != second);

    g.reseed(9);
    CHECK(g.generate(31, 31, { 1, 1 }, { 29, 29 }) == first);
}

TEST_CASE("Generators/ThreeByThreeEndWins") {
    for (auto kind : { gen::GeneratorKind::Iterative, gen::GeneratorKind::Recursive })
    {
        auto g = make(kind, 1)->generate(3, 3, { 1, 1 }, { 1, 1 });
        CHECK(g.at(1, 1) == CellKind::End);
        CHECK(test::count_passable(g) == 1u);
        CHECK(ring_is_closed(g));
    }
}

TEST_CASE("Generators/EvenSizesKeepTheBorder") {
    auto g = gen::IterativeBacktracker(rng::Seed{ 4 }).generate(8, 6, { 1, 1 }, { 5, 3 });
    CHECK(ring_is_closed(g));
    CHECK(g.at(5, 3) == CellKind::End);
}

TEST_CASE("Generators/RejectBadInputs") {
    gen::IterativeBacktracker g(rng::Seed{ 1 });
    CHECK_THROWS_AS(g.generate(2, 5, { 1, 1 }, { 1, 3 }), MazeGenerationError);
    CHECK_THROWS_AS(g.generate(5, 5, { 1, 1 }, { 5, 5 }), MazeGenerationError);
    CHECK_THROWS_AS(g.generate(5, 5, { -1, 1 }, { 3, 3 }), MazeGenerationError);
}

TEST_CASE("Generators/RecursiveDepthCapFails") {
    gen::RecursiveBacktracker g(rng::Seed{ 1 }, 3);
    CHECK(g.max_depth() == 3);
    CHECK_THROWS_AS(g.generate(21, 21, { 1, 1 }, { 19, 19 }), MazeGenerationError);

    // Same generator succeeds while the carve depth stays under the cap.
    gen::RecursiveBacktracker roomy(rng::Seed{ 1 }, 3);
    CHECK_NOTHROW(roomy.generate(5, 5, { 1, 1 }, { 3, 3 }));
}

TEST_CASE("Generators/FactoryAndNames") {
    CHECK(gen::make_generator(gen::GeneratorKind::Iterative, rng::Seed{ 1 })->name() == "iterative");
    CHECK(gen::make_generator(gen::GeneratorKind::Recursive)->name() == "recursive");

    CHECK(gen::parse_generator_kind("recursive") == gen::GeneratorKind::Recursive);
    CHECK_FALSE(gen::parse_generator_kind("prim").has_value());
    CHECK(gen::generator_kind_name(gen::GeneratorKind::Iterative) == "iterative");
}

TEST_CASE("Generators/Seed42ElevenByElevenIsReproducible") {
    for (auto kind : { gen::GeneratorKind::Iterative, gen::GeneratorKind::Recursive })
    {
        const Grid a = make(kind, 42)->generate(11, 11, { 1, 1 }, { 9, 9 });
        const Grid b = make(kind, 42)->generate(11, 11, { 1, 1 }, { 9, 9 });
        CHECK(a == b);
        CHECK(a.cells() == b.cells());
    }
}
