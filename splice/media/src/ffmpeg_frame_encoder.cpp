/**
 * @file ffmpeg_frame_encoder.cpp
 * @brief Video file writer implementation
 */

#include <splice/media/ffmpeg_frame_encoder.hpp>
#include "ff_common.hpp"

#include <splice/core/logger.hpp>

#include <algorithm>

namespace spl::media {

struct FfmpegFrameEncoder::Impl {
    ff::OutputContextPtr formatCtx;
    ff::CodecContextPtr codecCtx;
    ff::SwsContextPtr swsCtx;
    ff::FramePtr yuvFrame;
    ff::PacketPtr packet;
    AVStream* stream = nullptr;

    int width = 0;
    int height = 0;
    int64_t nextPts = 0;
    int64_t framesWritten = 0;
    int64_t totalBytes = 0;
    std::string codecName;
    std::string path;
    bool headerWritten = false;

    const AVCodec* findEncoder(const std::string& preferred) {
        if (!preferred.empty()) {
            if (const AVCodec* codec = avcodec_find_encoder_by_name(preferred.c_str())) {
                return codec;
            }
            LOG_WARN("Encoder '{}' not available, falling back", preferred);
        }
        if (const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_H264)) {
            return codec;
        }
        return avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    }

    /// Write every packet the encoder has ready
    Result<void> drain() {
        while (true) {
            int ret = avcodec_receive_packet(codecCtx.get(), packet.get());
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                return Ok();
            }
            if (ret < 0) {
                return ff::avError(ret, "Error receiving packet from encoder", ErrorCode::EncoderError);
            }

            av_packet_rescale_ts(packet.get(), codecCtx->time_base, stream->time_base);
            packet->stream_index = stream->index;
            totalBytes += packet->size;

            ret = av_interleaved_write_frame(formatCtx.get(), packet.get());
            if (ret < 0) {
                return ff::avError(ret, "Failed to write packet", ErrorCode::WriteError);
            }
        }
    }

    void reset() {
        swsCtx.reset();
        yuvFrame.reset();
        packet.reset();
        codecCtx.reset();
        formatCtx.reset();
        stream = nullptr;
        headerWritten = false;
    }
};

FfmpegFrameEncoder::FfmpegFrameEncoder()
    : m_impl(std::make_unique<Impl>()) {
}

FfmpegFrameEncoder::~FfmpegFrameEncoder() {
    if (isOpen()) {
        auto result = finish();
        if (!result) {
            LOG_ERROR("Closing encoder failed: {}", result.error().what());
        }
    }
}

Result<void> FfmpegFrameEncoder::open(const engine::ExportSettings& settings) {
    Impl& d = *m_impl;
    if (d.formatCtx) {
        return Error(ErrorCode::InvalidState, "Encoder already open");
    }
    if (settings.outputPath.empty()) {
        return Error(ErrorCode::InvalidArgument, "No output path");
    }
    if (settings.width % 2 != 0 || settings.height % 2 != 0) {
        return Error(ErrorCode::InvalidArgument, "Output size must be even for 4:2:0 video");
    }

    AVFormatContext* raw = nullptr;
    int ret = avformat_alloc_output_context2(&raw, nullptr, nullptr, settings.outputPath.c_str());
    if (ret < 0 || !raw) {
        return ff::avError(ret, "No muxer for " + settings.outputPath, ErrorCode::NotSupported);
    }
    d.formatCtx.reset(raw);
    d.path = settings.outputPath;

    const AVCodec* codec = d.findEncoder(settings.videoCodec);
    if (!codec) {
        d.reset();
        return Error(ErrorCode::CodecNotFound, "No H.264 or MPEG-4 encoder available");
    }
    d.codecName = codec->name;

    d.stream = avformat_new_stream(d.formatCtx.get(), nullptr);
    d.codecCtx.reset(avcodec_alloc_context3(codec));
    if (!d.stream || !d.codecCtx) {
        d.reset();
        return Error(ErrorCode::OutOfMemory, "Failed to allocate encoder context");
    }

    AVCodecContext* ctx = d.codecCtx.get();
    ctx->width = settings.width;
    ctx->height = settings.height;
    ctx->time_base = {settings.frameRate.den, settings.frameRate.num};
    ctx->framerate = {settings.frameRate.num, settings.frameRate.den};
    ctx->bit_rate = settings.videoBitrate();
    ctx->gop_size = std::max(1, settings.frameRate.num / settings.frameRate.den * 2);  // 2 s GOP
    ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    if (d.formatCtx->oformat->flags & AVFMT_GLOBALHEADER) {
        ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    if (codec->id == AV_CODEC_ID_H264) {
        av_opt_set(ctx->priv_data, "preset", "medium", 0);
    }

    ret = avcodec_open2(ctx, codec, nullptr);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to open encoder " + d.codecName, ErrorCode::CodecOpenFailed);
    }

    ret = avcodec_parameters_from_context(d.stream->codecpar, ctx);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to copy encoder parameters", ErrorCode::EncoderError);
    }
    d.stream->time_base = ctx->time_base;

    if (!(d.formatCtx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&d.formatCtx->pb, settings.outputPath.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            d.reset();
            return ff::avError(ret, "Cannot open " + settings.outputPath, ErrorCode::FileOpenFailed);
        }
    }

    ret = avformat_write_header(d.formatCtx.get(), nullptr);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to write header", ErrorCode::WriteError);
    }
    d.headerWritten = true;

    d.yuvFrame.reset(av_frame_alloc());
    d.packet.reset(av_packet_alloc());
    if (!d.yuvFrame || !d.packet) {
        d.reset();
        return Error(ErrorCode::OutOfMemory, "Failed to allocate frame");
    }
    d.yuvFrame->format = AV_PIX_FMT_YUV420P;
    d.yuvFrame->width = settings.width;
    d.yuvFrame->height = settings.height;
    ret = av_frame_get_buffer(d.yuvFrame.get(), 0);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to allocate frame buffer", ErrorCode::OutOfMemory);
    }

    d.width = settings.width;
    d.height = settings.height;
    d.nextPts = 0;
    d.framesWritten = 0;
    d.totalBytes = 0;

    LOG_INFO("Encoder {} opened: {}x{}, {}/{} fps, {} bps -> {}",
             d.codecName, d.width, d.height, settings.frameRate.num, settings.frameRate.den,
             ctx->bit_rate, settings.outputPath);
    return Ok();
}

Result<void> FfmpegFrameEncoder::writeFrame(const engine::FrameBuffer& frame) {
    Impl& d = *m_impl;
    if (!d.codecCtx) {
        return Error(ErrorCode::InvalidState, "Encoder not open");
    }
    if (frame.empty()) {
        return Error(ErrorCode::InvalidArgument, "Empty frame");
    }

    d.swsCtx.reset(sws_getCachedContext(d.swsCtx.release(),
        frame.width, frame.height, AV_PIX_FMT_RGBA,
        d.width, d.height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!d.swsCtx) {
        return Error(ErrorCode::EncoderError, "Failed to create colour converter");
    }

    int ret = av_frame_make_writable(d.yuvFrame.get());
    if (ret < 0) {
        return ff::avError(ret, "Frame not writable", ErrorCode::EncoderError);
    }

    const uint8_t* srcData[1] = {frame.pixels.data()};
    const int srcStride[1] = {static_cast<int>(frame.stride())};
    sws_scale(d.swsCtx.get(), srcData, srcStride, 0, frame.height,
              d.yuvFrame->data, d.yuvFrame->linesize);

    d.yuvFrame->pts = d.nextPts++;

    ret = avcodec_send_frame(d.codecCtx.get(), d.yuvFrame.get());
    if (ret < 0) {
        return ff::avError(ret, "Error sending frame to encoder", ErrorCode::EncoderError);
    }

    auto drained = d.drain();
    if (!drained) {
        return drained;
    }
    ++d.framesWritten;
    return Ok();
}

Result<void> FfmpegFrameEncoder::finish() {
    Impl& d = *m_impl;
    if (!d.codecCtx) {
        return Ok();
    }

    Result<void> result = Ok();

    int ret = avcodec_send_frame(d.codecCtx.get(), nullptr);
    if (ret < 0) {
        result = ff::avError(ret, "Error flushing encoder", ErrorCode::EncoderError);
    } else {
        result = d.drain();
    }

    if (d.headerWritten) {
        ret = av_write_trailer(d.formatCtx.get());
        if (ret < 0 && result) {
            result = ff::avError(ret, "Failed to write trailer", ErrorCode::WriteError);
        }
    }

    LOG_INFO("Encoder closed: {} frames, {} bytes -> {}", d.framesWritten, d.totalBytes, d.path);
    d.reset();
    return result;
}

bool FfmpegFrameEncoder::isOpen() const {
    return m_impl->codecCtx != nullptr;
}

int64_t FfmpegFrameEncoder::framesWritten() const {
    return m_impl->framesWritten;
}

std::string FfmpegFrameEncoder::codecName() const {
    return m_impl->codecName;
}

} // namespace spl::media
