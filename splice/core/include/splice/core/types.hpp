/**
 * @file types.hpp
 * @brief Core type definitions for Splice
 *
 * All timeline positions use int64_t ticks (microseconds) so that
 * positioning stays exact regardless of the output frame rate.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>

namespace spl {

// ============================================================================
// Time Types - ALL timeline positions are ticks (int64_t)
// ============================================================================

/// Timeline position in ticks
using Tick = int64_t;

/// Duration in ticks
using TickDuration = int64_t;

/// Time base constant: 1 second = 1,000,000 ticks
constexpr Tick kTicksPerSecond = 1'000'000;

/// Invalid tick sentinel
constexpr Tick kNoTick = INT64_MIN;

/// std::chrono duration types
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

/// High-resolution clock
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Convert seconds to ticks
constexpr Tick secondsToTicks(double seconds) {
    return static_cast<Tick>(seconds * static_cast<double>(kTicksPerSecond));
}

/// Convert ticks to seconds
constexpr double ticksToSeconds(Tick ticks) {
    return static_cast<double>(ticks) / static_cast<double>(kTicksPerSecond);
}

// ============================================================================
// Geometry / Rate Types
// ============================================================================

/// Rational number (frame rates, time bases)
struct Rational {
    int num = 0;
    int den = 1;

    [[nodiscard]] bool valid() const { return num > 0 && den > 0; }
    [[nodiscard]] double toDouble() const {
        return den != 0 ? static_cast<double>(num) / den : 0.0;
    }

    bool operator==(const Rational& other) const {
        return num == other.num && den == other.den;
    }
    bool operator!=(const Rational& other) const { return !(*this == other); }
};

/// Frame dimensions
struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
};

/// Number of frames needed to cover [0, ticks) at the given rate (rounded up)
constexpr int64_t frameCountForTicks(Tick ticks, Rational rate) {
    if (ticks <= 0 || rate.num <= 0 || rate.den <= 0) return 0;
    const int64_t numer = ticks * rate.num;
    const int64_t denom = kTicksPerSecond * rate.den;
    return (numer + denom - 1) / denom;
}

/// Tick offset of the given frame index at the given rate (rounded down)
constexpr Tick frameIndexToTicks(int64_t frameIndex, Rational rate) {
    if (rate.num <= 0 || rate.den <= 0) return 0;
    return frameIndex * kTicksPerSecond * rate.den / rate.num;
}

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,
    NotFound,
    NotSupported,
    OutOfMemory,

    // Timeline validation
    OverlapError,
    InvalidRange,
    InvalidOrder,
    DuplicateId,
    IncompatibleTrack,
    AssetNotReady,
    InvalidState,

    // Job lifecycle
    JobAlreadyActive,
    AssetLoadError,
    TranscriptionFailed,
    Cancelled,
    Timeout,

    // I/O errors
    FileNotFound,
    FileOpenFailed,
    ReadError,
    WriteError,
    EndOfFile,
    ParseError,

    // Codec errors
    CodecNotFound,
    CodecOpenFailed,
    DecoderError,
    EncoderError,
    InvalidData,

    // Render errors
    RenderError,

    // Programming defects
    InvariantViolation,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::OutOfMemory: return "Out of memory";
        case ErrorCode::OverlapError: return "Element overlaps an existing element";
        case ErrorCode::InvalidRange: return "Invalid range";
        case ErrorCode::InvalidOrder: return "Invalid track order";
        case ErrorCode::DuplicateId: return "Duplicate id";
        case ErrorCode::IncompatibleTrack: return "Incompatible track";
        case ErrorCode::AssetNotReady: return "Asset not ready";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::JobAlreadyActive: return "Job already active";
        case ErrorCode::AssetLoadError: return "Asset load error";
        case ErrorCode::TranscriptionFailed: return "Transcription failed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileOpenFailed: return "File open failed";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::EndOfFile: return "End of file";
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::CodecNotFound: return "Codec not found";
        case ErrorCode::CodecOpenFailed: return "Codec open failed";
        case ErrorCode::DecoderError: return "Decoder error";
        case ErrorCode::EncoderError: return "Encoder error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::RenderError: return "Render error";
        case ErrorCode::InvariantViolation: return "Invariant violation";
        default: return "Unknown error code";
    }
}

// ============================================================================
// Error Taxonomy
// ============================================================================

/**
 * @brief How an error is surfaced
 *
 * - Validation: rejected mutation, returned synchronously, no state change
 * - Job: collaborator failure, recorded on the owning job
 * - FrameRender: single frame failure, retried by the export pipeline
 * - Invariant: programming defect
 */
enum class ErrorCategory : uint8_t {
    None,
    Validation,
    Job,
    FrameRender,
    Invariant,
};

inline ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorCategory::None;
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotFound:
        case ErrorCode::OverlapError:
        case ErrorCode::InvalidRange:
        case ErrorCode::InvalidOrder:
        case ErrorCode::DuplicateId:
        case ErrorCode::IncompatibleTrack:
        case ErrorCode::AssetNotReady:
        case ErrorCode::InvalidState:
        case ErrorCode::JobAlreadyActive:
            return ErrorCategory::Validation;
        case ErrorCode::RenderError:
            return ErrorCategory::FrameRender;
        case ErrorCode::InvariantViolation:
            return ErrorCategory::Invariant;
        default:
            return ErrorCategory::Job;
    }
}

inline const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::Job: return "JobError";
        case ErrorCategory::FrameRender: return "FrameRenderError";
        case ErrorCategory::Invariant: return "InvariantViolation";
        default: return "Unknown";
    }
}

} // namespace spl
