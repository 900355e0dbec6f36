#include "kernel/Meme.h"
#include "kernel/Errors.h"
#include "kernel/RandomSource.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace {

// Count of differing positions; caller guarantees equal lengths
std::size_t differingBits(const Pattern& a, const Pattern& b) {
    std::size_t diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) ++diff;
    }
    return diff;
}

}

double patternEntropy(const Pattern& pattern) {
    if (pattern.empty()) return 0.0;

    const double len = static_cast<double>(pattern.size());
    const auto ones = std::count(pattern.begin(), pattern.end(), static_cast<std::uint8_t>(1));
    const double p1 = static_cast<double>(ones) / len;
    const double p0 = 1.0 - p1;

    // 0 * log2(0) contributes nothing
    double h = 0.0;
    if (p0 > 0.0) h -= p0 * std::log2(p0);
    if (p1 > 0.0) h -= p1 * std::log2(p1);
    return h;
}

double patternComplexity(const Pattern& pattern) {
    // log2(1) == 0: a single bit carries no normalizable entropy
    if (pattern.size() < 2) return 0.0;
    return patternEntropy(pattern) / std::log2(static_cast<double>(pattern.size()));
}

double patternUtility(const Pattern& pattern, const std::vector<Pattern>& references) {
    if (references.empty() || pattern.empty()) return 0.0;

    std::size_t best = pattern.size();
    for (const auto& ref : references) {
        if (ref.size() != pattern.size()) continue;
        best = std::min(best, differingBits(pattern, ref));
    }
    return 1.0 - static_cast<double>(best) / static_cast<double>(pattern.size());
}

Meme::Meme(Pattern pattern, std::uint32_t age, const SimConfig& cfg)
    : pattern_(std::move(pattern)), age_(age) {
    entropy_ = patternEntropy(pattern_);
    complexity_ = patternComplexity(pattern_);
    utility_ = patternUtility(pattern_, cfg.referencePatterns);

    validation::checkRange(entropy_, 0.0, std::log2(std::max<double>(2.0, pattern_.size())), "Meme entropy");
    validation::checkUnitInterval(complexity_, "Meme complexity");
    validation::checkUnitInterval(utility_, "Meme utility");
}

Meme Meme::create(Pattern pattern, const SimConfig& cfg, std::uint32_t age) {
    if (pattern.size() != cfg.memeLength) {
        throw InvalidPatternError("pattern length " + std::to_string(pattern.size()) +
                                  " != meme length " + std::to_string(cfg.memeLength));
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] > 1) {
            throw InvalidPatternError("pattern element " + std::to_string(i) + " is " +
                                      std::to_string(static_cast<int>(pattern[i])) +
                                      " (must be 0 or 1)");
        }
    }
    return Meme(std::move(pattern), age, cfg);
}

Meme Meme::random(const SimConfig& cfg, RandomSource& rng) {
    Pattern bits(cfg.memeLength);
    for (auto& b : bits) {
        b = static_cast<std::uint8_t>(rng.choice(2));
    }
    return Meme(std::move(bits), 0, cfg);
}

double Meme::hammingDistance(const Pattern& other) const {
    if (other.size() != pattern_.size()) {
        throw InvalidPatternError("cannot compare patterns of length " +
                                  std::to_string(pattern_.size()) + " and " +
                                  std::to_string(other.size()));
    }
    if (pattern_.empty()) return 0.0;
    return static_cast<double>(differingBits(pattern_, other)) /
           static_cast<double>(pattern_.size());
}

double Meme::hammingDistance(const Meme& other) const {
    return hammingDistance(other.pattern_);
}

Meme Meme::mutate(double muBase, const SimConfig& cfg, RandomSource& rng) const {
    const double basis = (cfg.effectiveMutationBasis() == MutationBasis::Entropy)
                             ? entropy_
                             : complexity_;
    const double muEff = muBase + cfg.scaleFactor * basis;

    // Always L draws, so the draw count never depends on the rate
    Pattern bits = pattern_;
    for (auto& b : bits) {
        if (rng.uniform() < muEff) {
            b = static_cast<std::uint8_t>(1 - b);
        }
    }
    return Meme(std::move(bits), 0, cfg);
}

std::string Meme::toString() const {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "Meme(pattern=" << patternToString(pattern_)
       << ", C=" << complexity_
       << ", U=" << utility_
       << ", age=" << age_ << ")";
    return os.str();
}
