// ==============================================================================
// Audio Format Implementation
// ==============================================================================
// Validation is inline in the header. This file holds the message formatting,
// which allocates and therefore stays off the audio path.
// ==============================================================================

#include "audio_format.h"

#include <iomanip>
#include <sstream>

namespace Hush {
namespace DSP {

namespace {

// Enough digits that a rejected rate never prints like an accepted one
constexpr int kRatePrecision = 12;

} // namespace

std::string describeFormatError(const FormatError& error) {
    std::ostringstream oss;
    switch (error.kind) {
        case FormatErrorKind::None:
            oss << "No error";
            break;
        case FormatErrorKind::UnsupportedSampleFormat:
            oss << "RNNoise expects PCM Float32 audio";
            break;
        case FormatErrorKind::UnsupportedChannelCount:
            oss << "RNNoise expects at least one audio channel (got "
                << error.channelCount << ")";
            break;
        case FormatErrorKind::UnsupportedSampleRate:
            oss << "RNNoise expects " << static_cast<long long>(error.expectedSampleRate)
                << " Hz input (got " << std::setprecision(kRatePrecision) << error.actualSampleRate
                << " Hz)";
            break;
    }
    return oss.str();
}

} // namespace DSP
} // namespace Hush
