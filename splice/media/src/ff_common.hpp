/**
 * @file ff_common.hpp
 * @brief Common FFmpeg includes and utilities
 *
 * Keeps FFmpeg headers inside splice/media/src; the public headers of
 * the media module only use splice types.
 */

#pragma once

// FFmpeg C headers
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

#include <splice/core/result.hpp>
#include <splice/core/types.hpp>

#include <memory>
#include <string>

namespace spl::media::ff {

// ============================================================================
// RAII deleters
// ============================================================================

struct InputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx) avformat_close_input(&ctx);
    }
};

/// Output contexts own their AVIOContext unless the muxer has AVFMT_NOFILE
struct OutputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (!ctx) return;
        if (ctx->oformat && !(ctx->oformat->flags & AVFMT_NOFILE) && ctx->pb) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        if (ctx) avcodec_free_context(&ctx);
    }
};

struct FrameDeleter {
    void operator()(AVFrame* frame) const {
        if (frame) av_frame_free(&frame);
    }
};

struct PacketDeleter {
    void operator()(AVPacket* packet) const {
        if (packet) av_packet_free(&packet);
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        if (ctx) sws_freeContext(ctx);
    }
};

using InputContextPtr = std::unique_ptr<AVFormatContext, InputContextDeleter>;
using OutputContextPtr = std::unique_ptr<AVFormatContext, OutputContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Convert FFmpeg error code to string
 */
inline std::string avErrorString(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

/**
 * @brief Convert FFmpeg error to a splice Error
 *
 * @param fallback code for errors without a more specific mapping
 */
inline Error avError(int errnum, const std::string& context = "",
                     ErrorCode fallback = ErrorCode::Unknown) {
    std::string msg = context;
    if (!msg.empty()) msg += ": ";
    msg += avErrorString(errnum);

    ErrorCode code = fallback;
    if (errnum == AVERROR(ENOMEM)) {
        code = ErrorCode::OutOfMemory;
    } else if (errnum == AVERROR(ENOENT) || errnum == AVERROR_STREAM_NOT_FOUND) {
        code = ErrorCode::FileNotFound;
    } else if (errnum == AVERROR_EOF) {
        code = ErrorCode::EndOfFile;
    } else if (errnum == AVERROR_DECODER_NOT_FOUND || errnum == AVERROR_ENCODER_NOT_FOUND) {
        code = ErrorCode::CodecNotFound;
    } else if (errnum == AVERROR_INVALIDDATA) {
        code = ErrorCode::InvalidData;
    }

    return Error(code, msg);
}

// ============================================================================
// Time
// ============================================================================

inline Rational fromAVRational(AVRational r) {
    return {r.num, r.den};
}

/**
 * @brief Convert timestamp from AVStream time_base to ticks
 */
inline Tick toTicks(int64_t pts, AVRational timeBase) {
    if (pts == AV_NOPTS_VALUE) return kNoTick;
    return av_rescale_q(pts, timeBase, {1, static_cast<int>(kTicksPerSecond)});
}

/**
 * @brief Convert ticks to AVStream time_base
 */
inline int64_t fromTicks(Tick tick, AVRational timeBase) {
    if (tick == kNoTick) return AV_NOPTS_VALUE;
    return av_rescale_q(tick, {1, static_cast<int>(kTicksPerSecond)}, timeBase);
}

} // namespace spl::media::ff
