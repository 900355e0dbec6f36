#include "kernel/SimConfig.h"
#include "kernel/Errors.h"

#include <stdexcept>

namespace {

void checkPatternSet(const std::vector<Pattern>& patterns, std::uint32_t length, const char* what) {
    for (std::size_t p = 0; p < patterns.size(); ++p) {
        const auto& pattern = patterns[p];
        if (pattern.size() != length) {
            throw InvalidPatternError(std::string(what) + " " + std::to_string(p) + " has length " +
                                      std::to_string(pattern.size()) + " (expected " +
                                      std::to_string(length) + ")");
        }
        for (auto bit : pattern) {
            if (bit > 1) {
                throw InvalidPatternError(std::string(what) + " " + std::to_string(p) +
                                          " contains a non-binary element");
            }
        }
    }
}

}

void SimConfig::validate() const {
    if (gridSize < 3) {
        throw std::invalid_argument("gridSize must be >= 3 (got " + std::to_string(gridSize) + ")");
    }
    if (memeLength < 1) {
        throw std::invalid_argument("memeLength must be >= 1");
    }
    if (poolCapacity == 0) {
        throw EmptyPoolError("poolCapacity must be > 0");
    }
    if (muInternal < 0.0 || muExternal < 0.0) {
        throw std::invalid_argument("mutation rates must be >= 0");
    }
    if (scaleFactor < 0.0) {
        throw std::invalid_argument("scaleFactor must be >= 0 (got " + std::to_string(scaleFactor) + ")");
    }
    checkPatternSet(referencePatterns, memeLength, "reference pattern");
    checkPatternSet(seedPatterns, memeLength, "seed pattern");
}

MutationBasis SimConfig::effectiveMutationBasis() const {
    if (mutationBasis != MutationBasis::PolicyDefault) return mutationBasis;
    return policy == SelectionPolicy::Utility ? MutationBasis::Complexity : MutationBasis::Entropy;
}

std::vector<Pattern> SimConfig::defaultReferencePatterns() {
    return {
        // Alternating blocks
        {0, 0, 0, 0,
         1, 1, 1, 1,
         0, 0, 0, 0,
         1, 1, 1, 1},
        // Half and half
        {1, 1, 1, 1,
         1, 1, 1, 1,
         0, 0, 0, 0,
         0, 0, 0, 0},
        // Checkerboard
        {0, 1, 0, 1,
         1, 0, 1, 0,
         0, 1, 0, 1,
         1, 0, 1, 0},
        // Square with a hole
        {1, 1, 1, 1,
         1, 0, 0, 1,
         1, 0, 0, 1,
         1, 1, 1, 1},
        // Cross
        {1, 0, 0, 1,
         0, 1, 1, 0,
         0, 1, 1, 0,
         1, 0, 0, 1},
    };
}

const char* toString(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::Fidelity: return "fidelity";
        case SelectionPolicy::Utility: return "utility";
    }
    return "unknown";
}

const char* toString(RngMode mode) {
    switch (mode) {
        case RngMode::Serial: return "serial";
        case RngMode::PerCell: return "per-cell";
    }
    return "unknown";
}

SelectionPolicy parseSelectionPolicy(const std::string& name) {
    if (name == "fidelity") return SelectionPolicy::Fidelity;
    if (name == "utility") return SelectionPolicy::Utility;
    throw std::invalid_argument("unknown selection policy '" + name + "' (expected fidelity|utility)");
}

std::string patternToString(const Pattern& pattern) {
    std::string out;
    out.reserve(pattern.size());
    for (auto bit : pattern) {
        out.push_back(bit ? '1' : '0');
    }
    return out;
}

Pattern parsePattern(const std::string& bits) {
    Pattern pattern;
    pattern.reserve(bits.size());
    for (char c : bits) {
        if (c == '0' || c == '1') {
            pattern.push_back(static_cast<std::uint8_t>(c - '0'));
        } else {
            throw InvalidPatternError(std::string("invalid bit character '") + c + "'");
        }
    }
    return pattern;
}
