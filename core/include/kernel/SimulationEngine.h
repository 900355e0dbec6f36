#ifndef SIMULATION_ENGINE_H
#define SIMULATION_ENGINE_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "kernel/Grid.h"
#include "kernel/RandomSource.h"
#include "kernel/SimConfig.h"

// Sub-stream phase tags for RngMode::PerCell
namespace EnginePhase {
    constexpr std::uint32_t kInternal = 1;
    constexpr std::uint32_t kExternal = 2;
}

// ---------- Simulation Engine ----------
// Synchronous two-phase cellular automaton over the meme grid.
//
// step():
//   1. internal phase, in place: rehearsal() then ageAll() per agent
//   2. external phase, double buffered: every new agent copies the dominant meme of a
//      random Moore neighbor taken from the pre-phase grid, then replaceAll() publishes
//   3. ++generation
//   4. statistics recomputed
//
// Serial draw schedule per agent and phase: one choice() then L uniform() draws,
// agents in row-major order (x outer, y inner).
class SimulationEngine {
public:
    // Validates cfg, seeds the random source, fills the grid and injects patterns
    explicit SimulationEngine(const SimConfig& cfg);

    // Runs on a caller-built grid (no injection). Grid size, pool sizes and meme lengths
    // must match cfg; memes are re-scored against cfg.referencePatterns.
    SimulationEngine(const SimConfig& cfg, Grid grid);

    // Lifecycle
    void reset(const SimConfig& cfg);
    void step();
    void stepN(int n);

    // Access
    const Grid& grid() const { return grid_; }
    const SimConfig& config() const { return cfg_; }
    std::uint64_t generation() const { return generation_; }
    const GridStatistics& statistics() const { return stats_; }
    std::map<std::string, double> statisticsMap() const { return stats_.toMap(cfg_.policy); }

    // Dominant pattern per cell, row-major
    std::vector<Pattern> dominantPatterns() const;
    const Pattern& dominantPattern(std::uint32_t x, std::uint32_t y) const;

    // Insert a pattern at a random cell between steps; uses the run's random source
    void injectPattern(const Pattern& pattern);

private:
    void runInternalPhase();
    void runExternalPhase();
    void injectConfiguredPatterns();
    void adoptPools();
    void logGeneration() const;

    SimConfig cfg_;
    RandomSource rng_;
    Grid grid_;
    std::uint64_t generation_ = 0;
    GridStatistics stats_;
};

#endif // SIMULATION_ENGINE_H
