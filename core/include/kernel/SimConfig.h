#ifndef SIM_CONFIG_H
#define SIM_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Pattern = std::vector<std::uint8_t>;

// Which score ranks memes inside a pool
enum class SelectionPolicy : std::uint8_t {
    Fidelity = 0,   // keep simple memes: rank by complexity (or entropy) alone
    Utility = 1     // rank by alpha * utility - beta * complexity
};

// Score used by the fidelity policy (same ordering, different scale)
enum class FidelityMetric : std::uint8_t {
    Complexity = 0,
    Entropy = 1
};

// Term scaled by k in mu_eff = mu_base + k * basis
enum class MutationBasis : std::uint8_t {
    PolicyDefault = 0,  // complexity under Utility, entropy under Fidelity
    Complexity = 1,
    Entropy = 2
};

// Draw discipline for the shared random source
enum class RngMode : std::uint8_t {
    Serial = 0,     // one stream, canonical traversal order
    PerCell = 1     // one sub-stream per (generation, phase, cell); parallel phases
};

// ---------- Configuration ----------
struct SimConfig {
    std::uint32_t gridSize = 30;        // N (lattice is N x N)
    std::uint32_t memeLength = 16;      // L
    std::uint32_t poolCapacity = 5;     // K

    double muInternal = 0.1;            // base rehearsal mutation rate
    double muExternal = 0.5;            // base transmission mutation rate
    double scaleFactor = 0.5;           // k

    SelectionPolicy policy = SelectionPolicy::Utility;
    FidelityMetric fidelityMetric = FidelityMetric::Complexity;
    MutationBasis mutationBasis = MutationBasis::PolicyDefault;
    double alpha = 0.5;                 // utility weight
    double beta = 0.5;                  // complexity weight

    std::vector<Pattern> referencePatterns = defaultReferencePatterns();
    std::vector<Pattern> seedPatterns;  // injected after the reference patterns
    bool injectReferencePatterns = true;

    std::uint64_t seed = 42;
    RngMode rngMode = RngMode::Serial;

    // Throws InvalidPatternError / EmptyPoolError / std::invalid_argument
    void validate() const;

    // Basis actually used by mutate() after resolving PolicyDefault
    MutationBasis effectiveMutationBasis() const;

    std::size_t cellCount() const {
        return static_cast<std::size_t>(gridSize) * gridSize;
    }

    // The five 16-bit (4x4) reference patterns of the default run
    static std::vector<Pattern> defaultReferencePatterns();
};

const char* toString(SelectionPolicy policy);
const char* toString(RngMode mode);

// Parses "fidelity" / "utility"; throws std::invalid_argument otherwise
SelectionPolicy parseSelectionPolicy(const std::string& name);

// "0110..." <-> {0,1,1,0,...}; parsePattern throws InvalidPatternError on other characters
std::string patternToString(const Pattern& pattern);
Pattern parsePattern(const std::string& bits);

#endif
