// ==============================================================================
// Layer 0: Core Utility - SIMD Downmix Kernels
// ==============================================================================
// Bulk accumulate/scale used by the planar mono downmix.
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "hush/dsp/core/downmix_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Hush {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// AccumulateImpl: dst[] += src[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void AccumulateImpl(const float* HWY_RESTRICT src, float* HWY_RESTRICT dst,
                    size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto sum = hn::Add(hn::LoadU(d, dst + k), hn::LoadU(d, src + k));
        hn::StoreU(sum, d, dst + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        dst[k] += src[k];
    }
}

// -----------------------------------------------------------------------------
// ScaleImpl: data[] *= scale
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ScaleImpl(float* HWY_RESTRICT data, size_t count, float scale) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto vScale = hn::Set(d, scale);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        hn::StoreU(hn::Mul(hn::LoadU(d, data + k), vScale), d, data + k);
    }
    for (; k < count; ++k) {
        data[k] *= scale;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Hush

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch (compiled once)
// =============================================================================

#if HWY_ONCE

#include "hush/dsp/core/downmix.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Hush {
namespace DSP {

HWY_EXPORT(AccumulateImpl);
HWY_EXPORT(ScaleImpl);

void accumulateBulk(const float* src, float* dst, std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(AccumulateImpl)(src, dst, count);
}

void scaleBulk(float* data, std::size_t count, float scale) noexcept {
    HWY_DYNAMIC_DISPATCH(ScaleImpl)(data, count, scale);
}

}  // namespace DSP
}  // namespace Hush

#endif  // HWY_ONCE
