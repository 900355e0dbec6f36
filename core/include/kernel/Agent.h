#pragma once

#include <cstdint>
#include <vector>
#include "kernel/Meme.h"
#include "kernel/SimConfig.h"

class RandomSource;

// Summary of one agent's pool (debug logging, driver "cell" command)
struct PoolStats {
    std::size_t poolSize = 0;
    double avgComplexity = 0.0;
    double minComplexity = 0.0;
    double maxComplexity = 0.0;
    double avgUtility = 0.0;
    double minUtility = 0.0;
    double maxUtility = 0.0;
    double avgScore = 0.0;
    double avgAge = 0.0;
    double dominantComplexity = 0.0;
    double dominantUtility = 0.0;
    double dominantScore = 0.0;
};

// Higher is fitter. Fidelity: -complexity (or -entropy). Utility: combined score.
double memeFitness(const Meme& meme, const SimConfig& cfg);

// ---------- Agent ----------
// One lattice cell. Owns an insertion-ordered pool of 1..K memes.
class Agent {
public:
    // Keeps the first K memes; throws EmptyPoolError if initialMemes is empty
    Agent(std::uint32_t x, std::uint32_t y, std::vector<Meme> initialMemes, const SimConfig& cfg);

    std::uint32_t x() const { return x_; }
    std::uint32_t y() const { return y_; }
    const std::vector<Meme>& pool() const { return pool_; }

    // Fittest meme under cfg.policy; earliest-inserted wins ties
    const Meme& getDominant(const SimConfig& cfg) const;
    std::size_t dominantIndex(const SimConfig& cfg) const;

    // Internal memory drift: pick a pool member uniformly, copy it at muInternal
    void rehearsal(const SimConfig& cfg, RandomSource& rng);

    // Noisy transmission of a neighbor's dominant meme at muExternal
    void receiveMeme(const Meme& source, const SimConfig& cfg, RandomSource& rng);

    // Append; on overflow evict the least fit member (earliest-inserted on ties)
    void insert(Meme meme, const SimConfig& cfg);

    void ageAll();

    // Same position, independent deep copy of the pool
    Agent snapshotCopy() const;

    PoolStats poolStats(const SimConfig& cfg) const;

private:
    std::uint32_t x_ = 0;
    std::uint32_t y_ = 0;
    std::vector<Meme> pool_;
};
