#include <gtest/gtest.h>
#include "kernel/Agent.h"
#include "kernel/Errors.h"
#include "kernel/RandomSource.h"

#include <algorithm>

namespace {

SimConfig agentConfig(SelectionPolicy policy, std::uint32_t k) {
    SimConfig cfg;
    cfg.memeLength = 4;
    cfg.poolCapacity = k;
    cfg.policy = policy;
    cfg.referencePatterns.clear();
    cfg.muInternal = 0.0;
    cfg.muExternal = 0.0;
    cfg.scaleFactor = 0.0;
    return cfg;
}

Meme mk(const char* bits, const SimConfig& cfg) {
    return Meme::create(parsePattern(bits), cfg);
}

std::vector<std::string> patternsOf(const Agent& agent) {
    std::vector<std::string> out;
    for (const auto& m : agent.pool()) {
        out.push_back(patternToString(m.pattern()));
    }
    return out;
}

}

TEST(AgentTest, EmptyPoolRejected) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    EXPECT_THROW(Agent(0, 0, {}, cfg), EmptyPoolError);

    cfg.poolCapacity = 0;
    EXPECT_THROW(Agent(0, 0, {mk("0000", cfg)}, cfg), EmptyPoolError);
}

TEST(AgentTest, InitialPoolTruncatedToCapacity) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 2);
    Agent a(1, 2, {mk("0000", cfg), mk("0001", cfg), mk("0011", cfg)}, cfg);
    EXPECT_EQ(a.x(), 1u);
    EXPECT_EQ(a.y(), 2u);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"0000", "0001"}));
}

TEST(AgentTest, FidelityDominantIsLeastComplex) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 5);
    Agent a(0, 0, {mk("0011", cfg), mk("0001", cfg), mk("0101", cfg)}, cfg);
    EXPECT_EQ(patternToString(a.getDominant(cfg).pattern()), "0001");
}

TEST(AgentTest, DominantTieGoesToEarliest) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 5);
    Agent a(0, 0, {mk("0011", cfg), mk("1111", cfg), mk("0000", cfg)}, cfg);
    EXPECT_EQ(a.dominantIndex(cfg), 1u);

    cfg.fidelityMetric = FidelityMetric::Entropy;
    EXPECT_EQ(a.dominantIndex(cfg), 1u);
}

TEST(AgentTest, UtilityDominantIsHighestScore) {
    SimConfig cfg = agentConfig(SelectionPolicy::Utility, 5);
    cfg.referencePatterns = {parsePattern("0110")};
    cfg.alpha = 1.0;
    cfg.beta = 0.5;
    // 0110: U=1, C=0.5 -> 0.75. 0000: U=0.5, C=0 -> 0.5. 0111: U=0.75, C~0.41 -> ~0.54
    Agent a(0, 0, {mk("0000", cfg), mk("0111", cfg), mk("0110", cfg)}, cfg);
    EXPECT_EQ(patternToString(a.getDominant(cfg).pattern()), "0110");
}

TEST(AgentTest, FidelityEvictsMostComplex) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 2);
    Agent a(0, 0, {mk("0000", cfg), mk("0011", cfg)}, cfg);
    a.insert(mk("0001", cfg), cfg);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"0000", "0001"}));
}

TEST(AgentTest, EvictionTieRemovesEarliest) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 2);
    Agent a(0, 0, {mk("0011", cfg), mk("0101", cfg)}, cfg);
    a.insert(mk("0000", cfg), cfg);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"0101", "0000"}));

    // Ties keep resolving toward the oldest member
    a.insert(mk("1001", cfg), cfg);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"0000", "1001"}));
    a.insert(mk("0110", cfg), cfg);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"0000", "0110"}));
}

TEST(AgentTest, UtilityEvictsLowestScore) {
    SimConfig cfg = agentConfig(SelectionPolicy::Utility, 2);
    cfg.referencePatterns = {parsePattern("1111")};
    cfg.alpha = 1.0;
    cfg.beta = 0.0;
    Agent a(0, 0, {mk("1110", cfg), mk("0000", cfg)}, cfg);
    a.insert(mk("1100", cfg), cfg);
    EXPECT_EQ(patternsOf(a), (std::vector<std::string>{"1110", "1100"}));
}

TEST(AgentTest, PoolSizeStaysBoundedAndEvictsLeastFit) {
    for (auto policy : {SelectionPolicy::Fidelity, SelectionPolicy::Utility}) {
        SimConfig cfg = agentConfig(policy, 3);
        cfg.memeLength = 8;
        cfg.referencePatterns = {parsePattern("11110000"), parsePattern("10101010")};
        RandomSource rng(77);
        Agent a(0, 0, {Meme::random(cfg, rng)}, cfg);

        for (int i = 0; i < 300; ++i) {
            std::vector<Meme> expected = a.pool();
            Meme incoming = Meme::random(cfg, rng);
            expected.push_back(incoming);
            if (expected.size() > cfg.poolCapacity) {
                auto worst = std::min_element(expected.begin(), expected.end(),
                    [&](const Meme& l, const Meme& r) { return memeFitness(l, cfg) < memeFitness(r, cfg); });
                expected.erase(worst);
            }

            a.insert(incoming, cfg);
            ASSERT_GE(a.pool().size(), 1u);
            ASSERT_LE(a.pool().size(), cfg.poolCapacity);
            ASSERT_EQ(a.pool().size(), expected.size());
            for (std::size_t j = 0; j < expected.size(); ++j) {
                EXPECT_EQ(a.pool()[j].pattern(), expected[j].pattern());
            }
        }
    }
}

TEST(AgentTest, RehearsalAppendsCopy) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    Meme original = Meme::create(parsePattern("0110"), cfg, 4);
    Agent a(0, 0, {original}, cfg);
    RandomSource rng(1);
    a.rehearsal(cfg, rng);

    ASSERT_EQ(a.pool().size(), 2u);
    EXPECT_EQ(a.pool()[1].pattern(), original.pattern());
    EXPECT_EQ(a.pool()[1].age(), 0u);
    EXPECT_EQ(a.pool()[0].age(), 4u);
}

TEST(AgentTest, ReceiveMemeUsesExternalRate) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    cfg.muExternal = 1.0;
    Agent a(0, 0, {mk("0000", cfg)}, cfg);
    RandomSource rng(2);
    a.receiveMeme(mk("0011", cfg), cfg, rng);
    ASSERT_EQ(a.pool().size(), 2u);
    EXPECT_EQ(patternToString(a.pool()[1].pattern()), "1100");
}

TEST(AgentTest, AgeAll) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    Agent a(0, 0, {mk("0000", cfg), mk("0001", cfg)}, cfg);
    a.ageAll();
    a.ageAll();
    for (const auto& m : a.pool()) {
        EXPECT_EQ(m.age(), 2u);
    }
}

TEST(AgentTest, SnapshotCopyIsIndependent) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    Agent a(2, 1, {mk("0000", cfg), mk("0011", cfg)}, cfg);
    a.ageAll();

    Agent b = a.snapshotCopy();
    EXPECT_EQ(b.x(), 2u);
    EXPECT_EQ(b.y(), 1u);
    ASSERT_EQ(b.pool().size(), a.pool().size());
    for (std::size_t i = 0; i < a.pool().size(); ++i) {
        EXPECT_EQ(b.pool()[i].pattern(), a.pool()[i].pattern());
        EXPECT_EQ(b.pool()[i].age(), a.pool()[i].age());
        EXPECT_NE(&b.pool()[i], &a.pool()[i]);
    }

    b.insert(mk("0111", cfg), cfg);
    b.ageAll();
    EXPECT_EQ(a.pool().size(), 2u);
    EXPECT_EQ(a.pool()[0].age(), 1u);
}

TEST(AgentTest, PoolStats) {
    SimConfig cfg = agentConfig(SelectionPolicy::Fidelity, 3);
    Agent a(0, 0, {mk("0000", cfg), mk("0011", cfg)}, cfg);
    auto s = a.poolStats(cfg);
    EXPECT_EQ(s.poolSize, 2u);
    EXPECT_DOUBLE_EQ(s.minComplexity, 0.0);
    EXPECT_DOUBLE_EQ(s.maxComplexity, 0.5);  // H=1, log2(4)=2
    EXPECT_DOUBLE_EQ(s.avgComplexity, 0.25);
    EXPECT_DOUBLE_EQ(s.dominantComplexity, 0.0);
}
