#include "kernel/Grid.h"
#include "kernel/Errors.h"
#include "kernel/RandomSource.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace {

// mean / population std / min / max of a non-empty sample
struct Moments {
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

Moments computeMoments(const std::vector<double>& values) {
    Moments m;
    if (values.empty()) return m;

    const double n = static_cast<double>(values.size());
    m.min = values[0];
    m.max = values[0];
    for (double v : values) {
        m.mean += v;
        m.min = std::min(m.min, v);
        m.max = std::max(m.max, v);
    }
    m.mean /= n;

    double sq = 0.0;
    for (double v : values) {
        const double diff = v - m.mean;
        sq += diff * diff;
    }
    m.stddev = std::sqrt(sq / n);
    return m;
}

}

Grid::Grid(const SimConfig& cfg, RandomSource& rng) : size_(cfg.gridSize) {
    initializeRandom(cfg, rng);
}

Grid::Grid(std::uint32_t size, std::vector<Agent> agents) : size_(size) {
    if (size < 3) {
        throw std::invalid_argument("grid size must be >= 3 (got " + std::to_string(size) + ")");
    }
    checkLayout(agents);
    cells_ = std::move(agents);
}

void Grid::initializeRandom(const SimConfig& cfg, RandomSource& rng) {
    size_ = cfg.gridSize;
    std::vector<Agent> fresh;
    fresh.reserve(cfg.cellCount());

    for (std::uint32_t x = 0; x < size_; ++x) {
        for (std::uint32_t y = 0; y < size_; ++y) {
            std::vector<Meme> memes;
            memes.reserve(cfg.poolCapacity);
            for (std::uint32_t k = 0; k < cfg.poolCapacity; ++k) {
                memes.push_back(Meme::random(cfg, rng));
            }
            fresh.emplace_back(x, y, std::move(memes), cfg);
        }
    }
    cells_ = std::move(fresh);
}

void Grid::injectPattern(const Pattern& pattern, const SimConfig& cfg, RandomSource& rng) {
    Meme seed = Meme::create(pattern, cfg);
    const auto x = static_cast<std::uint32_t>(rng.choice(size_));
    const auto y = static_cast<std::uint32_t>(rng.choice(size_));
    cells_[indexOf(x, y)].insert(std::move(seed), cfg);
}

void Grid::injectPatterns(const std::vector<Pattern>& patterns, const SimConfig& cfg, RandomSource& rng) {
    for (const auto& pattern : patterns) {
        injectPattern(pattern, cfg, rng);
    }
}

std::array<std::size_t, 8> Grid::mooreNeighborIndices(std::uint32_t x, std::uint32_t y) const {
    std::array<std::size_t, 8> out{};
    std::size_t n = 0;
    const std::int64_t N = size_;
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            if (dx == 0 && dy == 0) continue;
            // +N keeps the operand non-negative before the modulo
            const auto nx = static_cast<std::uint32_t>((static_cast<std::int64_t>(x) + dx + N) % N);
            const auto ny = static_cast<std::uint32_t>((static_cast<std::int64_t>(y) + dy + N) % N);
            out[n++] = indexOf(nx, ny);
        }
    }
    return out;
}

std::vector<const Agent*> Grid::mooreNeighbors(std::uint32_t x, std::uint32_t y) const {
    if (x >= size_ || y >= size_) {
        throw std::out_of_range("mooreNeighbors: (" + std::to_string(x) + "," + std::to_string(y) +
                                ") outside " + std::to_string(size_) + "x" + std::to_string(size_) + " grid");
    }
    std::vector<const Agent*> neighbors;
    neighbors.reserve(8);
    for (auto idx : mooreNeighborIndices(x, y)) {
        neighbors.push_back(&cells_[idx]);
    }
    return neighbors;
}

const Agent& Grid::agentAt(std::uint32_t x, std::uint32_t y) const {
    if (x >= size_ || y >= size_) {
        throw std::out_of_range("agentAt: (" + std::to_string(x) + "," + std::to_string(y) +
                                ") outside " + std::to_string(size_) + "x" + std::to_string(size_) + " grid");
    }
    return cells_[indexOf(x, y)];
}

void Grid::checkLayout(const std::vector<Agent>& agents) const {
    const std::size_t expected = static_cast<std::size_t>(size_) * size_;
    if (agents.size() != expected) {
        throw CountMismatchError("expected " + std::to_string(expected) + " agents, got " +
                                 std::to_string(agents.size()));
    }
    for (std::size_t i = 0; i < agents.size(); ++i) {
        const auto& a = agents[i];
        if (a.x() >= size_ || a.y() >= size_ || indexOf(a.x(), a.y()) != i) {
            throw CountMismatchError("agent (" + std::to_string(a.x()) + "," + std::to_string(a.y()) +
                                     ") is not in canonical slot " + std::to_string(i));
        }
    }
}

void Grid::replaceAll(std::vector<Agent> newAgents) {
    checkLayout(newAgents);
    cells_ = std::move(newAgents);
}

GridStatistics Grid::aggregateStatistics(const SimConfig& cfg) const {
    GridStatistics stats;

    const std::size_t n = cells_.size();
    std::vector<double> domComplexity, domEntropy, domUtility, domScore;
    domComplexity.reserve(n);
    domEntropy.reserve(n);
    domUtility.reserve(n);
    domScore.reserve(n);

    std::unordered_set<std::string> unique;
    double complexitySum = 0.0;
    double entropySum = 0.0;
    double utilitySum = 0.0;
    double ageSum = 0.0;

    for (const auto& agent : cells_) {
        const Meme& dom = agent.getDominant(cfg);
        domComplexity.push_back(dom.complexity());
        domEntropy.push_back(dom.entropy());
        domUtility.push_back(dom.utility());
        domScore.push_back(dom.combinedScore(cfg.alpha, cfg.beta));

        for (const auto& meme : agent.pool()) {
            complexitySum += meme.complexity();
            entropySum += meme.entropy();
            utilitySum += meme.utility();
            ageSum += meme.age();
            unique.insert(patternToString(meme.pattern()));
            stats.totalPatterns++;
        }
    }

    auto c = computeMoments(domComplexity);
    stats.avgDominantComplexity = c.mean;
    stats.stdDominantComplexity = c.stddev;
    stats.minDominantComplexity = c.min;
    stats.maxDominantComplexity = c.max;

    auto e = computeMoments(domEntropy);
    stats.avgDominantEntropy = e.mean;
    stats.stdDominantEntropy = e.stddev;
    stats.minDominantEntropy = e.min;
    stats.maxDominantEntropy = e.max;

    auto u = computeMoments(domUtility);
    stats.avgDominantUtility = u.mean;
    stats.stdDominantUtility = u.stddev;
    stats.minDominantUtility = u.min;
    stats.maxDominantUtility = u.max;

    auto s = computeMoments(domScore);
    stats.avgDominantScore = s.mean;
    stats.stdDominantScore = s.stddev;
    stats.minDominantScore = s.min;
    stats.maxDominantScore = s.max;

    if (stats.totalPatterns > 0) {
        const double total = static_cast<double>(stats.totalPatterns);
        stats.avgPoolComplexity = complexitySum / total;
        stats.avgPoolEntropy = entropySum / total;
        stats.avgPoolUtility = utilitySum / total;
        stats.avgMemeAge = ageSum / total;
        stats.uniquePatterns = unique.size();
        stats.patternDiversity = static_cast<double>(stats.uniquePatterns) / total;
    }
    if (n > 0) {
        stats.avgPoolSize = static_cast<double>(stats.totalPatterns) / static_cast<double>(n);
    }

    validation::checkUnitInterval(stats.patternDiversity, "patternDiversity");
    return stats;
}

std::map<std::string, double> GridStatistics::toMap(SelectionPolicy policy) const {
    std::map<std::string, double> out{
        {"avg_dominant_complexity", avgDominantComplexity},
        {"std_dominant_complexity", stdDominantComplexity},
        {"min_dominant_complexity", minDominantComplexity},
        {"max_dominant_complexity", maxDominantComplexity},
        {"avg_dominant_entropy", avgDominantEntropy},
        {"std_dominant_entropy", stdDominantEntropy},
        {"min_dominant_entropy", minDominantEntropy},
        {"max_dominant_entropy", maxDominantEntropy},
        {"avg_pool_complexity", avgPoolComplexity},
        {"avg_pool_entropy", avgPoolEntropy},
        {"avg_pool_utility", avgPoolUtility},
        {"avg_pool_size", avgPoolSize},
        {"avg_meme_age", avgMemeAge},
        {"unique_patterns", static_cast<double>(uniquePatterns)},
        {"total_patterns", static_cast<double>(totalPatterns)},
        {"pattern_diversity", patternDiversity},
    };
    if (policy == SelectionPolicy::Utility) {
        out["avg_dominant_utility"] = avgDominantUtility;
        out["std_dominant_utility"] = stdDominantUtility;
        out["min_dominant_utility"] = minDominantUtility;
        out["max_dominant_utility"] = maxDominantUtility;
        out["avg_dominant_score"] = avgDominantScore;
        out["std_dominant_score"] = stdDominantScore;
        out["min_dominant_score"] = minDominantScore;
        out["max_dominant_score"] = maxDominantScore;
    }
    return out;
}
