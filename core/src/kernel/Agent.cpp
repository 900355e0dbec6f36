#include "kernel/Agent.h"
#include "kernel/Errors.h"
#include "kernel/RandomSource.h"

#include <algorithm>
#include <cstddef>

double memeFitness(const Meme& meme, const SimConfig& cfg) {
    if (cfg.policy == SelectionPolicy::Utility) {
        return meme.combinedScore(cfg.alpha, cfg.beta);
    }
    return cfg.fidelityMetric == FidelityMetric::Entropy ? -meme.entropy() : -meme.complexity();
}

Agent::Agent(std::uint32_t x, std::uint32_t y, std::vector<Meme> initialMemes, const SimConfig& cfg)
    : x_(x), y_(y), pool_(std::move(initialMemes)) {
    if (cfg.poolCapacity == 0) {
        throw EmptyPoolError("pool capacity is 0");
    }
    if (pool_.empty()) {
        throw EmptyPoolError("agent (" + std::to_string(x) + "," + std::to_string(y) +
                             ") created with an empty pool");
    }
    if (pool_.size() > cfg.poolCapacity) {
        pool_.erase(pool_.begin() + cfg.poolCapacity, pool_.end());
    }
}

std::size_t Agent::dominantIndex(const SimConfig& cfg) const {
    std::size_t best = 0;
    double bestFitness = memeFitness(pool_[0], cfg);
    for (std::size_t i = 1; i < pool_.size(); ++i) {
        double f = memeFitness(pool_[i], cfg);
        // strict: earlier member keeps a tie
        if (f > bestFitness) {
            bestFitness = f;
            best = i;
        }
    }
    return best;
}

const Meme& Agent::getDominant(const SimConfig& cfg) const {
    return pool_[dominantIndex(cfg)];
}

void Agent::rehearsal(const SimConfig& cfg, RandomSource& rng) {
    const Meme& source = pool_[rng.choice(pool_.size())];
    Meme rehearsed = source.mutate(cfg.muInternal, cfg, rng);
    insert(std::move(rehearsed), cfg);
}

void Agent::receiveMeme(const Meme& source, const SimConfig& cfg, RandomSource& rng) {
    insert(source.mutate(cfg.muExternal, cfg, rng), cfg);
}

void Agent::insert(Meme meme, const SimConfig& cfg) {
    pool_.push_back(std::move(meme));
    if (pool_.size() <= cfg.poolCapacity) return;

    std::size_t worst = 0;
    double worstFitness = memeFitness(pool_[0], cfg);
    for (std::size_t i = 1; i < pool_.size(); ++i) {
        double f = memeFitness(pool_[i], cfg);
        if (f < worstFitness) {
            worstFitness = f;
            worst = i;
        }
    }
    pool_.erase(pool_.begin() + static_cast<std::ptrdiff_t>(worst));
}

void Agent::ageAll() {
    for (auto& meme : pool_) {
        meme.incrementAge();
    }
}

Agent Agent::snapshotCopy() const {
    // Meme holds its pattern by value, so copying the vector copies every pattern
    Agent copy(*this);
    return copy;
}

PoolStats Agent::poolStats(const SimConfig& cfg) const {
    PoolStats s;
    s.poolSize = pool_.size();
    s.minComplexity = pool_[0].complexity();
    s.maxComplexity = pool_[0].complexity();
    s.minUtility = pool_[0].utility();
    s.maxUtility = pool_[0].utility();

    for (const auto& meme : pool_) {
        s.avgComplexity += meme.complexity();
        s.avgUtility += meme.utility();
        s.avgScore += meme.combinedScore(cfg.alpha, cfg.beta);
        s.avgAge += meme.age();
        s.minComplexity = std::min(s.minComplexity, meme.complexity());
        s.maxComplexity = std::max(s.maxComplexity, meme.complexity());
        s.minUtility = std::min(s.minUtility, meme.utility());
        s.maxUtility = std::max(s.maxUtility, meme.utility());
    }
    const double n = static_cast<double>(pool_.size());
    s.avgComplexity /= n;
    s.avgUtility /= n;
    s.avgScore /= n;
    s.avgAge /= n;

    const Meme& dominant = getDominant(cfg);
    s.dominantComplexity = dominant.complexity();
    s.dominantUtility = dominant.utility();
    s.dominantScore = dominant.combinedScore(cfg.alpha, cfg.beta);
    return s;
}
