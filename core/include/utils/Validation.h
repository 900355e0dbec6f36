#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

// Range checks for derived values. Active in debug builds only.
namespace validation {

#ifndef NDEBUG
inline void checkFinite(double value, const char* context) {
    if (!std::isfinite(value)) {
        throw std::logic_error(std::string("non-finite value in ") + context);
    }
}

inline void checkRange(double value, double lo, double hi, const char* context) {
    checkFinite(value, context);
    // small slack for log2 rounding at the bounds
    if (value < lo - 1e-12 || value > hi + 1e-12) {
        throw std::logic_error(std::string("value out of range in ") + context + ": " +
                               std::to_string(value));
    }
}

inline void checkIndex(std::size_t idx, std::size_t size, const char* context) {
    if (idx >= size) {
        throw std::logic_error(std::string("index out of bounds in ") + context + ": " +
                               std::to_string(idx) + " >= " + std::to_string(size));
    }
}
#else
inline void checkFinite(double, const char*) {}
inline void checkRange(double, double, double, const char*) {}
inline void checkIndex(std::size_t, std::size_t, const char*) {}
#endif

inline void checkUnitInterval(double value, const char* context) {
    checkRange(value, 0.0, 1.0, context);
}

}  // namespace validation

#endif
