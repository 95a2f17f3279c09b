#pragma once
// ==============================================================================
// Test Signal Generators
// ==============================================================================
// Standard test signals for streaming denoiser verification.
// ==============================================================================

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <random>
#include <vector>

namespace TestHelpers {

// ==============================================================================
// Constants
// ==============================================================================

constexpr float kPi = std::numbers::pi_v<float>;
constexpr float kTwoPi = 2.0f * kPi;
constexpr double kTestSampleRate = 48000.0;

// ==============================================================================
// White Noise
// ==============================================================================
// Random values in [-1, 1]. Same seed, same samples.

inline std::vector<float> makeWhiteNoise(std::size_t size, uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> buffer(size);
    for (auto& sample : buffer) {
        sample = dist(gen);
    }
    return buffer;
}

// ==============================================================================
// Ramp
// ==============================================================================
// start, start+1, start+2, ... Every sample is unique, which makes dropped,
// duplicated or reordered samples visible.

inline std::vector<float> makeRamp(std::size_t size, float start = 0.0f) {
    std::vector<float> buffer(size);
    for (std::size_t i = 0; i < size; ++i) {
        buffer[i] = start + static_cast<float>(i);
    }
    return buffer;
}

// ==============================================================================
// Noisy Tone
// ==============================================================================
// Sine at int16 scale with additive noise, roughly what RNNoise sees from a
// microphone.

inline std::vector<float> makeNoisyTone(std::size_t size,
                                        float frequency = 220.0f,
                                        float amplitude = 8000.0f,
                                        float noiseLevel = 1000.0f,
                                        uint32_t seed = 7) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-noiseLevel, noiseLevel);
    const float phaseIncrement = kTwoPi * frequency / static_cast<float>(kTestSampleRate);
    std::vector<float> buffer(size);
    for (std::size_t i = 0; i < size; ++i) {
        buffer[i] = amplitude * std::sin(phaseIncrement * static_cast<float>(i)) + dist(gen);
    }
    return buffer;
}

// ==============================================================================
// Chunking
// ==============================================================================
// Split [0, total) into consecutive chunk sizes drawn from [1, maxChunk].

inline std::vector<std::size_t> makeRandomChunkSizes(std::size_t total,
                                                     std::size_t maxChunk,
                                                     uint32_t seed = 1234) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> dist(1, maxChunk);
    std::vector<std::size_t> sizes;
    std::size_t remaining = total;
    while (remaining > 0) {
        const std::size_t size = std::min(dist(gen), remaining);
        sizes.push_back(size);
        remaining -= size;
    }
    return sizes;
}

} // namespace TestHelpers
