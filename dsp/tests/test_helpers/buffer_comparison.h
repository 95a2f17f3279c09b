#pragma once
// ==============================================================================
// Buffer Comparison Utilities
// ==============================================================================
// Tools for comparing audio buffers in tests.
// ==============================================================================

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <span>
#include <sstream>
#include <string>

namespace TestHelpers {

// ==============================================================================
// Comparison Results
// ==============================================================================

struct ComparisonResult {
    bool passed = true;
    bool sizeMismatch = false;
    size_t expectedSize = 0;
    size_t actualSize = 0;
    size_t firstDifferenceIndex = 0;
    float maxDifference = 0.0f;
    float expectedValue = 0.0f;
    float actualValue = 0.0f;

    std::string message() const {
        if (passed) return "Buffers match";

        std::ostringstream oss;
        if (sizeMismatch) {
            oss << "Buffer sizes differ: expected " << expectedSize
                << ", got " << actualSize;
            return oss.str();
        }
        oss << std::fixed << std::setprecision(8);
        oss << "Buffers differ at index " << firstDifferenceIndex
            << ": expected " << expectedValue
            << ", got " << actualValue
            << " (diff: " << maxDifference << ")";
        return oss.str();
    }

    explicit operator bool() const { return passed; }
};

// ==============================================================================
// Buffer Comparison Functions
// ==============================================================================

// Compare two buffers with absolute tolerance (0 = bit-identical values)
inline ComparisonResult compareBuffers(std::span<const float> expected,
                                       std::span<const float> actual,
                                       float tolerance = 0.0f) {
    ComparisonResult result;
    result.expectedSize = expected.size();
    result.actualSize = actual.size();

    if (expected.size() != actual.size()) {
        result.passed = false;
        result.sizeMismatch = true;
        return result;
    }

    for (size_t i = 0; i < expected.size(); ++i) {
        float diff = std::abs(expected[i] - actual[i]);
        if (diff > result.maxDifference) {
            result.maxDifference = diff;
        }
        if (diff > tolerance && result.passed) {
            result.passed = false;
            result.firstDifferenceIndex = i;
            result.expectedValue = expected[i];
            result.actualValue = actual[i];
        }
    }

    return result;
}

// ==============================================================================
// Buffer Validation Functions
// ==============================================================================

// Check that all samples are finite (no NaN or Inf)
inline bool allFinite(std::span<const float> buffer) {
    return std::all_of(buffer.begin(), buffer.end(),
                       [](float s) { return std::isfinite(s); });
}

} // namespace TestHelpers
