#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "kernel/Grid.h"
#include "kernel/RandomSource.h"
#include "TestGrids.h"

#include <set>
#include <utility>

TEST(GridTest, RandomInitializationCoversLattice) {
    SimConfig cfg = quietConfig(6, 16, 5);
    RandomSource rng(42);
    Grid grid(cfg, rng);

    ASSERT_EQ(grid.agents().size(), 36u);
    for (std::uint32_t x = 0; x < 6; ++x) {
        for (std::uint32_t y = 0; y < 6; ++y) {
            const Agent& a = grid.agentAt(x, y);
            EXPECT_EQ(a.x(), x);
            EXPECT_EQ(a.y(), y);
            EXPECT_EQ(a.pool().size(), 5u);
            EXPECT_EQ(&grid.agents()[x * 6 + y], &a);
        }
    }
}

TEST(GridTest, MooreNeighborhoodHasEightDistinctCells) {
    for (std::uint32_t n : {3u, 4u, 7u}) {
        SimConfig cfg = quietConfig(n, 4, 1);
        RandomSource rng(n);
        Grid grid(cfg, rng);
        for (std::uint32_t x = 0; x < n; ++x) {
            for (std::uint32_t y = 0; y < n; ++y) {
                auto nbrs = grid.mooreNeighbors(x, y);
                ASSERT_EQ(nbrs.size(), 8u);
                std::set<std::pair<std::uint32_t, std::uint32_t>> seen;
                for (const Agent* a : nbrs) {
                    seen.insert({a->x(), a->y()});
                    EXPECT_FALSE(a->x() == x && a->y() == y);
                    // Chebyshev distance 1 on the torus
                    std::uint32_t dx = (a->x() + n - x) % n;
                    std::uint32_t dy = (a->y() + n - y) % n;
                    EXPECT_TRUE(dx == 0 || dx == 1 || dx == n - 1);
                    EXPECT_TRUE(dy == 0 || dy == 1 || dy == n - 1);
                }
                EXPECT_EQ(seen.size(), 8u);
            }
        }
    }
}

TEST(GridTest, CornerNeighborsWrapAround) {
    SimConfig cfg = quietConfig(5, 4, 1);
    RandomSource rng(1);
    Grid grid(cfg, rng);

    std::set<std::pair<std::uint32_t, std::uint32_t>> seen;
    for (const Agent* a : grid.mooreNeighbors(0, 0)) {
        seen.insert({a->x(), a->y()});
    }
    std::set<std::pair<std::uint32_t, std::uint32_t>> expected = {
        {4, 4}, {4, 0}, {4, 1}, {0, 4}, {0, 1}, {1, 4}, {1, 0}, {1, 1}};
    EXPECT_EQ(seen, expected);

    auto idx = grid.mooreNeighborIndices(0, 0);
    EXPECT_EQ(idx[0], grid.indexOf(4, 4));
}

TEST(GridTest, AgentAtOutOfRange) {
    SimConfig cfg = quietConfig(3, 4, 1);
    RandomSource rng(1);
    Grid grid(cfg, rng);
    EXPECT_THROW(grid.agentAt(3, 0), std::out_of_range);
    EXPECT_THROW(grid.agentAt(0, 3), std::out_of_range);
    EXPECT_THROW(grid.mooreNeighbors(5, 5), std::out_of_range);
}

TEST(GridTest, ReplaceAllRequiresExactCount) {
    SimConfig cfg = quietConfig(3, 4, 2);
    RandomSource rng(9);
    Grid grid(cfg, rng);

    std::vector<Agent> shortList(grid.agents().begin(), grid.agents().end() - 1);
    EXPECT_THROW(grid.replaceAll(shortList), CountMismatchError);

    std::vector<Agent> longList = grid.agents();
    longList.push_back(grid.agents()[0]);
    EXPECT_THROW(grid.replaceAll(longList), CountMismatchError);

    std::vector<Agent> swapped = grid.agents();
    std::swap(swapped[0], swapped[1]);
    EXPECT_THROW(grid.replaceAll(swapped), CountMismatchError);

    // Failed calls leave the grid untouched
    EXPECT_EQ(grid.agents().size(), 9u);

    std::vector<Agent> fresh;
    for (const auto& a : grid.agents()) {
        fresh.push_back(Agent(a.x(), a.y(), {Meme::create(Pattern(4, 0), cfg)}, cfg));
    }
    grid.replaceAll(std::move(fresh));
    for (const auto& a : grid.agents()) {
        ASSERT_EQ(a.pool().size(), 1u);
        EXPECT_EQ(a.pool()[0].pattern(), Pattern(4, 0));
    }
}

TEST(GridTest, AdoptingAgentsChecksLayout) {
    SimConfig cfg = quietConfig(3, 4, 1);
    std::vector<Pattern> patterns(9, Pattern(4, 0));
    EXPECT_NO_THROW(gridOfPatterns(cfg, patterns));

    std::vector<Agent> eight;
    for (std::uint32_t i = 0; i < 8; ++i) {
        eight.emplace_back(i / 3, i % 3, std::vector<Meme>{Meme::create(Pattern(4, 0), cfg)}, cfg);
    }
    EXPECT_THROW(Grid(3, std::move(eight)), CountMismatchError);
}

TEST(GridTest, InjectedPatternLandsInOneCell) {
    SimConfig cfg = quietConfig(5, 16, 5);
    cfg.policy = SelectionPolicy::Fidelity;
    RandomSource rng(31);
    Grid grid(cfg, rng);

    // Zero-complexity meme: never the eviction choice among random memes
    const Pattern flat(16, 0);
    grid.injectPattern(flat, cfg, rng);

    int holders = 0;
    for (const auto& a : grid.agents()) {
        EXPECT_EQ(a.pool().size(), 5u);
        for (const auto& m : a.pool()) {
            if (m.pattern() == flat && m.age() == 0) ++holders;
        }
    }
    EXPECT_GE(holders, 1);

    EXPECT_THROW(grid.injectPattern(Pattern(15, 0), cfg, rng), InvalidPatternError);
}

TEST(GridTest, InjectionDrawsXThenY) {
    SimConfig cfg = quietConfig(7, 4, 3);
    RandomSource rng(5);
    Grid grid(cfg, rng);

    // Replay the two draws on a copy of the stream
    RandomSource probe = rng;
    const auto x = static_cast<std::uint32_t>(probe.choice(7));
    const auto y = static_cast<std::uint32_t>(probe.choice(7));

    // Full pool; 1111 has the top score (no references, zero complexity) so it stays
    grid.injectPattern(Pattern{1, 1, 1, 1}, cfg, rng);
    const auto& pool = grid.agentAt(x, y).pool();
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool.back().pattern(), (Pattern{1, 1, 1, 1}));
}

TEST(GridTest, StatisticsOfUniformGrid) {
    SimConfig cfg = quietConfig(3, 4, 1);
    std::vector<Pattern> patterns(9, parsePattern("0011"));
    Grid grid = gridOfPatterns(cfg, patterns);

    auto s = grid.aggregateStatistics(cfg);
    EXPECT_DOUBLE_EQ(s.avgDominantComplexity, 0.5);
    EXPECT_DOUBLE_EQ(s.stdDominantComplexity, 0.0);
    EXPECT_DOUBLE_EQ(s.avgDominantEntropy, 1.0);
    EXPECT_EQ(s.uniquePatterns, 1u);
    EXPECT_EQ(s.totalPatterns, 9u);
    EXPECT_DOUBLE_EQ(s.patternDiversity, 1.0 / 9.0);
    EXPECT_DOUBLE_EQ(s.avgPoolSize, 1.0);
}

TEST(GridTest, StatisticsOfMixedGrid) {
    SimConfig cfg = quietConfig(3, 4, 1);
    cfg.policy = SelectionPolicy::Fidelity;
    std::vector<Pattern> patterns(9, parsePattern("0000"));
    patterns[0] = parsePattern("0011");
    patterns[4] = parsePattern("0101");
    patterns[8] = parsePattern("0111");
    Grid grid = gridOfPatterns(cfg, patterns);

    auto s = grid.aggregateStatistics(cfg);
    EXPECT_EQ(s.uniquePatterns, 4u);
    EXPECT_EQ(s.totalPatterns, 9u);
    EXPECT_DOUBLE_EQ(s.minDominantComplexity, 0.0);
    EXPECT_DOUBLE_EQ(s.maxDominantComplexity, 0.5);
    EXPECT_GT(s.stdDominantComplexity, 0.0);
    EXPECT_NEAR(s.avgPoolComplexity, s.avgDominantComplexity, 1e-12);  // K == 1
}

TEST(GridTest, StatisticsMapFollowsPolicy) {
    GridStatistics s;
    auto fidelity = s.toMap(SelectionPolicy::Fidelity);
    auto utility = s.toMap(SelectionPolicy::Utility);

    EXPECT_EQ(fidelity.count("avg_dominant_complexity"), 1u);
    EXPECT_EQ(fidelity.count("pattern_diversity"), 1u);
    EXPECT_EQ(fidelity.count("avg_dominant_score"), 0u);
    EXPECT_EQ(utility.count("avg_dominant_score"), 1u);
    EXPECT_EQ(utility.count("avg_dominant_utility"), 1u);
    EXPECT_GT(utility.size(), fidelity.size());
}
