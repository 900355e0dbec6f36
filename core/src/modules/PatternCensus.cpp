#include "modules/PatternCensus.h"
#include "kernel/Grid.h"
#include "kernel/Meme.h"

#include <algorithm>
#include <map>

PatternCensus takeCensus(const Grid& grid, const SimConfig& cfg, std::size_t topN) {
    PatternCensus census;
    const auto& agents = grid.agents();
    if (agents.empty()) return census;

    std::map<Pattern, PatternGroup> byPattern;
    for (std::size_t i = 0; i < agents.size(); ++i) {
        const Meme& dom = agents[i].getDominant(cfg);
        auto& group = byPattern[dom.pattern()];
        if (group.count == 0) {
            group.pattern = dom.pattern();
            group.complexity = dom.complexity();
            group.utility = dom.utility();
        }
        group.count++;
        group.cells.push_back(static_cast<std::uint32_t>(i));
    }

    const double cells = static_cast<double>(agents.size());
    census.groups.reserve(byPattern.size());
    for (auto& [pattern, group] : byPattern) {
        group.share = group.count / cells;
        census.groups.push_back(std::move(group));
    }

    // map order already sorts patterns ascending; stable sort keeps it among equal counts
    std::stable_sort(census.groups.begin(), census.groups.end(),
                     [](const PatternGroup& a, const PatternGroup& b) { return a.count > b.count; });

    census.distinctPatterns = static_cast<std::uint32_t>(census.groups.size());
    census.dominantShare = census.groups.front().share;

    if (topN > 0 && census.groups.size() > topN) {
        census.groups.resize(topN);
    }
    return census;
}
