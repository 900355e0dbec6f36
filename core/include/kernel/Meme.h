#pragma once

#include <cstdint>
#include <string>
#include "kernel/SimConfig.h"

class RandomSource;

/**
 * Meme: a fixed-length bit pattern plus an age.
 *
 * The pattern never changes after construction, so entropy, complexity and
 * utility are computed once in create(). Mutation produces a new Meme.
 */
class Meme {
public:
    // Throws InvalidPatternError if length != cfg.memeLength or an element is not 0/1
    static Meme create(Pattern pattern, const SimConfig& cfg, std::uint32_t age = 0);

    // L independent fair bits
    static Meme random(const SimConfig& cfg, RandomSource& rng);

    const Pattern& pattern() const { return pattern_; }
    std::size_t length() const { return pattern_.size(); }
    std::uint32_t age() const { return age_; }

    double entropy() const { return entropy_; }        // Shannon entropy of bit frequency, bits
    double complexity() const { return complexity_; }  // entropy / log2(L)
    double utility() const { return utility_; }        // 1 - min Hamming distance to a reference

    double combinedScore(double alpha, double beta) const {
        return alpha * utility_ - beta * complexity_;
    }

    // Normalized Hamming distance in [0, 1]
    double hammingDistance(const Meme& other) const;
    double hammingDistance(const Pattern& other) const;

    // mu_eff = muBase + k * basis; one uniform draw per bit, flip when draw < mu_eff
    Meme mutate(double muBase, const SimConfig& cfg, RandomSource& rng) const;

    void incrementAge() { ++age_; }

    std::string toString() const;

    bool samePattern(const Meme& other) const { return pattern_ == other.pattern_; }

private:
    Meme(Pattern pattern, std::uint32_t age, const SimConfig& cfg);

    Pattern pattern_;
    std::uint32_t age_ = 0;
    double entropy_ = 0.0;
    double complexity_ = 0.0;
    double utility_ = 0.0;
};

// Free-standing scoring helpers (shared with statistics and census code)
double patternEntropy(const Pattern& pattern);
double patternComplexity(const Pattern& pattern);
double patternUtility(const Pattern& pattern, const std::vector<Pattern>& references);
