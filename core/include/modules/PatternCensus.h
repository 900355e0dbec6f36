#ifndef PATTERN_CENSUS_H
#define PATTERN_CENSUS_H

#include <cstdint>
#include <vector>
#include "kernel/SimConfig.h"

class Grid;

// One distinct dominant pattern and the cells expressing it
struct PatternGroup {
    Pattern pattern;
    std::uint32_t count = 0;            // cells whose dominant meme has this pattern
    double share = 0.0;                 // count / cells
    double complexity = 0.0;
    double utility = 0.0;
    std::vector<std::uint32_t> cells;   // row-major cell indices
};

struct PatternCensus {
    std::vector<PatternGroup> groups;   // count desc, then pattern ascending; at most topN
    std::uint32_t distinctPatterns = 0; // over all cells, before truncation
    double dominantShare = 0.0;         // share of the most common pattern
};

// Groups cells by dominant pattern. topN == 0 keeps every group.
PatternCensus takeCensus(const Grid& grid, const SimConfig& cfg, std::size_t topN = 0);

#endif
