#ifndef GRID_H
#define GRID_H

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "kernel/Agent.h"
#include "kernel/SimConfig.h"

class RandomSource;

// Summary statistics over every cell and every pool
struct GridStatistics {
    // Dominant meme per cell
    double avgDominantComplexity = 0.0;
    double stdDominantComplexity = 0.0;
    double minDominantComplexity = 0.0;
    double maxDominantComplexity = 0.0;
    double avgDominantEntropy = 0.0;
    double stdDominantEntropy = 0.0;
    double minDominantEntropy = 0.0;
    double maxDominantEntropy = 0.0;
    double avgDominantUtility = 0.0;
    double stdDominantUtility = 0.0;
    double minDominantUtility = 0.0;
    double maxDominantUtility = 0.0;
    double avgDominantScore = 0.0;
    double stdDominantScore = 0.0;
    double minDominantScore = 0.0;
    double maxDominantScore = 0.0;

    // Every meme in every pool
    double avgPoolComplexity = 0.0;
    double avgPoolEntropy = 0.0;
    double avgPoolUtility = 0.0;
    double avgPoolSize = 0.0;
    double avgMemeAge = 0.0;

    // Diversity
    std::uint64_t uniquePatterns = 0;
    std::uint64_t totalPatterns = 0;
    double patternDiversity = 0.0;      // unique / total

    // name -> value; utility and score entries only under the utility policy
    std::map<std::string, double> toMap(SelectionPolicy policy) const;
};

// ---------- Grid ----------
// N x N torus of agents, stored row-major: index = x * N + y.
class Grid {
public:
    // Random initial pools (K random memes per cell)
    Grid(const SimConfig& cfg, RandomSource& rng);

    // Adopt prebuilt agents; throws CountMismatchError unless they tile the lattice exactly
    Grid(std::uint32_t size, std::vector<Agent> agents);

    std::uint32_t size() const { return size_; }
    std::size_t cellCount() const { return cells_.size(); }

    void initializeRandom(const SimConfig& cfg, RandomSource& rng);

    // Insert pattern into a uniformly chosen cell (x drawn first, then y)
    void injectPattern(const Pattern& pattern, const SimConfig& cfg, RandomSource& rng);
    void injectPatterns(const std::vector<Pattern>& patterns, const SimConfig& cfg, RandomSource& rng);

    // Moore-8 neighbors with wraparound; dx outer, dy inner, center skipped
    std::vector<const Agent*> mooreNeighbors(std::uint32_t x, std::uint32_t y) const;
    std::array<std::size_t, 8> mooreNeighborIndices(std::uint32_t x, std::uint32_t y) const;

    // Throws std::out_of_range outside [0, N)
    const Agent& agentAt(std::uint32_t x, std::uint32_t y) const;

    const std::vector<Agent>& agents() const { return cells_; }
    std::vector<Agent>& agentsMut() { return cells_; }

    std::size_t indexOf(std::uint32_t x, std::uint32_t y) const {
        return static_cast<std::size_t>(x) * size_ + y;
    }

    // Publishes a whole generation at once
    void replaceAll(std::vector<Agent> newAgents);

    GridStatistics aggregateStatistics(const SimConfig& cfg) const;

private:
    void checkLayout(const std::vector<Agent>& agents) const;

    std::uint32_t size_ = 0;
    std::vector<Agent> cells_;
};

#endif
