#include "kernel/SimulationEngine.h"
#include "kernel/Errors.h"
#include "utils/Validation.h"

#include <spdlog/spdlog.h>
#include <omp.h>

#include <stdexcept>

namespace {

const SimConfig& validated(const SimConfig& cfg) {
    cfg.validate();
    return cfg;
}

}

SimulationEngine::SimulationEngine(const SimConfig& cfg)
    : cfg_(validated(cfg)), rng_(cfg.seed), grid_(cfg_, rng_) {
    injectConfiguredPatterns();
    stats_ = grid_.aggregateStatistics(cfg_);
    spdlog::info("Grid {}x{} initialized (L={}, K={}, policy={}, rng={})",
                 cfg_.gridSize, cfg_.gridSize, cfg_.memeLength, cfg_.poolCapacity,
                 toString(cfg_.policy), toString(cfg_.rngMode));
    if (cfg_.rngMode == RngMode::PerCell) {
        spdlog::info("Per-cell streams: phases run on up to {} OpenMP threads", omp_get_max_threads());
    }
}

SimulationEngine::SimulationEngine(const SimConfig& cfg, Grid grid)
    : cfg_(validated(cfg)), rng_(cfg.seed), grid_(std::move(grid)) {
    if (grid_.size() != cfg_.gridSize) {
        throw CountMismatchError("grid is " + std::to_string(grid_.size()) + "x" +
                                 std::to_string(grid_.size()) + " but config expects " +
                                 std::to_string(cfg_.gridSize));
    }
    adoptPools();
    stats_ = grid_.aggregateStatistics(cfg_);
}

void SimulationEngine::reset(const SimConfig& cfg) {
    cfg_ = validated(cfg);
    generation_ = 0;
    rng_.seed(cfg_.seed);
    grid_.initializeRandom(cfg_, rng_);
    injectConfiguredPatterns();
    stats_ = grid_.aggregateStatistics(cfg_);
    spdlog::info("Reset: {}x{} grid, seed {}", cfg_.gridSize, cfg_.gridSize, cfg_.seed);
}

void SimulationEngine::injectConfiguredPatterns() {
    if (cfg_.injectReferencePatterns && !cfg_.referencePatterns.empty()) {
        spdlog::info("Injecting {} reference patterns", cfg_.referencePatterns.size());
        grid_.injectPatterns(cfg_.referencePatterns, cfg_, rng_);
    }
    if (!cfg_.seedPatterns.empty()) {
        spdlog::info("Injecting {} seed patterns", cfg_.seedPatterns.size());
        grid_.injectPatterns(cfg_.seedPatterns, cfg_, rng_);
    }
}

void SimulationEngine::adoptPools() {
    std::vector<Agent> rebuilt;
    rebuilt.reserve(grid_.agents().size());
    for (const auto& agent : grid_.agents()) {
        const auto& pool = agent.pool();
        if (pool.empty() || pool.size() > cfg_.poolCapacity) {
            throw std::invalid_argument("agent (" + std::to_string(agent.x()) + "," +
                                        std::to_string(agent.y()) + ") holds " +
                                        std::to_string(pool.size()) + " memes, capacity is " +
                                        std::to_string(cfg_.poolCapacity));
        }
        // Meme::create rejects length mismatches and recomputes utility for cfg_
        std::vector<Meme> memes;
        memes.reserve(pool.size());
        for (const auto& meme : pool) {
            memes.push_back(Meme::create(meme.pattern(), cfg_, meme.age()));
        }
        rebuilt.emplace_back(agent.x(), agent.y(), std::move(memes), cfg_);
    }
    grid_.replaceAll(std::move(rebuilt));
}

void SimulationEngine::injectPattern(const Pattern& pattern) {
    grid_.injectPattern(pattern, cfg_, rng_);
    stats_ = grid_.aggregateStatistics(cfg_);
}

void SimulationEngine::runInternalPhase() {
    auto& agents = grid_.agentsMut();
    const std::size_t n = agents.size();

    if (cfg_.rngMode == RngMode::PerCell) {
        // Agents touch only their own pool here. The loop body must not throw:
        // an exception leaving an OpenMP region terminates the process.
        #pragma omp parallel for schedule(static)
        for (std::size_t i = 0; i < n; ++i) {
            RandomSource cellRng = RandomSource::forCell(cfg_.seed, generation_, EnginePhase::kInternal, i);
            agents[i].rehearsal(cfg_, cellRng);
            agents[i].ageAll();
        }
    } else {
        for (std::size_t i = 0; i < n; ++i) {
            agents[i].rehearsal(cfg_, rng_);
            agents[i].ageAll();
        }
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        for (const auto& agent : agents) {
            const auto ps = agent.poolStats(cfg_);
            if (cfg_.policy == SelectionPolicy::Utility) {
                spdlog::debug("Agent({},{}): dom_C={:.4f}, dom_U={:.4f}, dom_S={:.4f}, pool_avg_U={:.4f}",
                              agent.x(), agent.y(), ps.dominantComplexity, ps.dominantUtility,
                              ps.dominantScore, ps.avgUtility);
            } else {
                spdlog::debug("Agent({},{}): dominant_C={:.4f}, pool_avg_C={:.4f}, pool_size={}",
                              agent.x(), agent.y(), ps.dominantComplexity, ps.avgComplexity, ps.poolSize);
            }
        }
    }
}

void SimulationEngine::runExternalPhase() {
    // Read side: the grid as it stands after the internal phase. Never written below.
    const std::vector<Agent>& current = grid_.agents();
    const std::size_t n = current.size();

    // Write side
    std::vector<Agent> next;
    next.reserve(n);
    for (const auto& agent : current) {
        next.push_back(agent.snapshotCopy());
    }

    std::vector<std::size_t> sources(n, 0);
    auto transmit = [&](std::size_t i, RandomSource& rng) {
        Agent& target = next[i];
        const auto nbrs = grid_.mooreNeighborIndices(target.x(), target.y());
        const std::size_t src = nbrs[rng.choice(nbrs.size())];
        validation::checkIndex(src, n, "external phase neighbor");
        sources[i] = src;
        target.receiveMeme(current[src].getDominant(cfg_), cfg_, rng);
    };

    if (cfg_.rngMode == RngMode::PerCell) {
        // Disjoint output slots; reads go to `current` only. Must not throw (see above).
        #pragma omp parallel for schedule(static)
        for (std::size_t i = 0; i < n; ++i) {
            RandomSource cellRng = RandomSource::forCell(cfg_.seed, generation_, EnginePhase::kExternal, i);
            transmit(i, cellRng);
        }
    } else {
        for (std::size_t i = 0; i < n; ++i) {
            transmit(i, rng_);
        }
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        for (std::size_t i = 0; i < n; ++i) {
            const Agent& from = current[sources[i]];
            const Meme& copied = from.getDominant(cfg_);
            spdlog::debug("Agent({},{}) <- Agent({},{}): copied meme C={:.4f}, U={:.4f}",
                          next[i].x(), next[i].y(), from.x(), from.y(),
                          copied.complexity(), copied.utility());
        }
    }

    // `current` is invalid after this point
    grid_.replaceAll(std::move(next));
}

void SimulationEngine::step() {
    spdlog::debug("=== Generation {} ===", generation_);
    runInternalPhase();
    runExternalPhase();
    ++generation_;
    stats_ = grid_.aggregateStatistics(cfg_);
    logGeneration();
}

void SimulationEngine::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

void SimulationEngine::logGeneration() const {
    if (cfg_.policy == SelectionPolicy::Utility) {
        spdlog::info("Gen {}: avg_C={:.4f}, avg_U={:.4f}, avg_S={:.4f}, diversity={:.3f}, unique={}",
                     generation_, stats_.avgDominantComplexity, stats_.avgDominantUtility,
                     stats_.avgDominantScore, stats_.patternDiversity, stats_.uniquePatterns);
    } else {
        spdlog::info("Gen {}: avg_C={:.4f}, min_C={:.4f}, max_C={:.4f}, unique_patterns={}, total_patterns={}",
                     generation_, stats_.avgDominantComplexity, stats_.minDominantComplexity,
                     stats_.maxDominantComplexity, stats_.uniquePatterns, stats_.totalPatterns);
    }
}

std::vector<Pattern> SimulationEngine::dominantPatterns() const {
    std::vector<Pattern> out;
    out.reserve(grid_.cellCount());
    for (const auto& agent : grid_.agents()) {
        out.push_back(agent.getDominant(cfg_).pattern());
    }
    return out;
}

const Pattern& SimulationEngine::dominantPattern(std::uint32_t x, std::uint32_t y) const {
    return grid_.agentAt(x, y).getDominant(cfg_).pattern();
}
