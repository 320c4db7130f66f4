/**
 * @file ffmpeg_frame_reader.cpp
 * @brief Frame reader implementation
 */

#include <splice/media/ffmpeg_frame_reader.hpp>
#include "ff_common.hpp"

#include <splice/core/logger.hpp>

namespace spl::media {

namespace {

constexpr int kSeekAheadFrames = 10;
constexpr TickDuration kFallbackFrameDuration = kTicksPerSecond / 30;

} // anonymous namespace

struct FfmpegFrameReader::Impl {
    ff::InputContextPtr formatCtx;
    ff::CodecContextPtr codecCtx;
    ff::SwsContextPtr swsCtx;
    ff::PacketPtr packet;
    ff::FramePtr decoded;
    ff::FramePtr current;       ///< Most recent picture, kept for holds

    int streamIdx = -1;
    AVRational timeBase{1, 1};
    Tick streamStart = 0;
    TickDuration frameDuration = kFallbackFrameDuration;

    Tick currentPts = kNoTick;
    bool eof = false;
    bool draining = false;
    bool stillImage = false;
    int64_t seeks = 0;
    std::string path;

    void reset() {
        swsCtx.reset();
        codecCtx.reset();
        formatCtx.reset();
        packet.reset();
        decoded.reset();
        current.reset();
        streamIdx = -1;
        currentPts = kNoTick;
        eof = false;
        draining = false;
        stillImage = false;
        seeks = 0;
    }

    Result<void> seek(Tick target) {
        int64_t ts = ff::fromTicks(target + streamStart, timeBase);
        int ret = av_seek_frame(formatCtx.get(), streamIdx, ts, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            return ff::avError(ret, "Seek failed in " + path, ErrorCode::DecoderError);
        }
        avcodec_flush_buffers(codecCtx.get());
        currentPts = kNoTick;
        eof = false;
        draining = false;
        ++seeks;
        return Ok();
    }

    /// Decode the next picture into current; false at end of stream
    Result<bool> decodeNext() {
        while (true) {
            int ret = avcodec_receive_frame(codecCtx.get(), decoded.get());
            if (ret == 0) {
                int64_t pts = decoded->best_effort_timestamp;
                if (pts == AV_NOPTS_VALUE) pts = decoded->pts;
                Tick tick = ff::toTicks(pts, timeBase);
                currentPts = (tick == kNoTick) ? (currentPts == kNoTick ? 0 : currentPts + frameDuration)
                                               : tick - streamStart;
                av_frame_unref(current.get());
                av_frame_move_ref(current.get(), decoded.get());
                return true;
            }
            if (ret == AVERROR_EOF) {
                eof = true;
                return false;
            }
            if (ret != AVERROR(EAGAIN)) {
                return ff::avError(ret, "Decode failed in " + path, ErrorCode::DecoderError);
            }

            if (draining) {
                eof = true;
                return false;
            }

            ret = av_read_frame(formatCtx.get(), packet.get());
            if (ret == AVERROR_EOF) {
                draining = true;
                ret = avcodec_send_packet(codecCtx.get(), nullptr);
                if (ret < 0 && ret != AVERROR_EOF) {
                    return ff::avError(ret, "Flush failed in " + path, ErrorCode::DecoderError);
                }
                continue;
            }
            if (ret < 0) {
                return ff::avError(ret, "Read failed in " + path, ErrorCode::ReadError);
            }

            if (packet->stream_index == streamIdx) {
                ret = avcodec_send_packet(codecCtx.get(), packet.get());
                av_packet_unref(packet.get());
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    return ff::avError(ret, "Decode failed in " + path, ErrorCode::DecoderError);
                }
            } else {
                av_packet_unref(packet.get());
            }
        }
    }

    Result<engine::FrameBuffer> convert(int width, int height) {
        AVFrame* src = current.get();
        swsCtx.reset(sws_getCachedContext(swsCtx.release(),
            src->width, src->height, static_cast<AVPixelFormat>(src->format),
            width, height, AV_PIX_FMT_RGBA,
            SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!swsCtx) {
            return Error(ErrorCode::DecoderError, "Failed to create colour converter");
        }

        engine::FrameBuffer frame;
        frame.width = width;
        frame.height = height;
        frame.pixels.resize(frame.stride() * static_cast<size_t>(height));
        frame.timestamp = currentPts;

        uint8_t* dstData[1] = {frame.pixels.data()};
        const int dstStride[1] = {static_cast<int>(frame.stride())};
        sws_scale(swsCtx.get(), src->data, src->linesize, 0, src->height, dstData, dstStride);
        return frame;
    }

    bool hasPicture() const { return current && current->data[0] != nullptr; }
};

FfmpegFrameReader::FfmpegFrameReader()
    : m_impl(std::make_unique<Impl>()) {
}

FfmpegFrameReader::~FfmpegFrameReader() = default;

Result<void> FfmpegFrameReader::open(const std::string& path) {
    Impl& d = *m_impl;
    d.reset();
    d.path = path;

    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return ff::avError(ret, "Failed to open " + path, ErrorCode::FileOpenFailed);
    }
    d.formatCtx.reset(raw);

    ret = avformat_find_stream_info(d.formatCtx.get(), nullptr);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to find stream info", ErrorCode::InvalidData);
    }

    const AVCodec* codec = nullptr;
    d.streamIdx = av_find_best_stream(d.formatCtx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (d.streamIdx < 0 || !codec) {
        d.reset();
        return Error(ErrorCode::NotSupported, "No decodable video stream in " + path);
    }

    AVStream* stream = d.formatCtx->streams[d.streamIdx];
    d.codecCtx.reset(avcodec_alloc_context3(codec));
    if (!d.codecCtx) {
        d.reset();
        return Error(ErrorCode::OutOfMemory, "Failed to allocate codec context");
    }
    ret = avcodec_parameters_to_context(d.codecCtx.get(), stream->codecpar);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to copy codec parameters", ErrorCode::DecoderError);
    }
    d.codecCtx->thread_count = 0;
    d.codecCtx->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;

    ret = avcodec_open2(d.codecCtx.get(), codec, nullptr);
    if (ret < 0) {
        d.reset();
        return ff::avError(ret, "Failed to open decoder", ErrorCode::CodecOpenFailed);
    }

    d.timeBase = stream->time_base;
    d.streamStart = (stream->start_time != AV_NOPTS_VALUE) ? ff::toTicks(stream->start_time, d.timeBase) : 0;
    if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0) {
        d.frameDuration = av_rescale_q(1, av_inv_q(stream->avg_frame_rate),
                                       {1, static_cast<int>(kTicksPerSecond)});
    }

    const std::string demuxer = d.formatCtx->iformat ? d.formatCtx->iformat->name : "";
    d.stillImage = demuxer == "image2" || demuxer.find("_pipe") != std::string::npos;

    d.packet.reset(av_packet_alloc());
    d.decoded.reset(av_frame_alloc());
    d.current.reset(av_frame_alloc());
    if (!d.packet || !d.decoded || !d.current) {
        d.reset();
        return Error(ErrorCode::OutOfMemory, "Failed to allocate frame");
    }

    LOG_DEBUG("Frame reader opened {} ({}x{}, {} us/frame{})", path,
              d.codecCtx->width, d.codecCtx->height, d.frameDuration,
              d.stillImage ? ", still" : "");
    return Ok();
}

void FfmpegFrameReader::close() {
    m_impl->reset();
}

bool FfmpegFrameReader::isOpen() const {
    return m_impl->codecCtx != nullptr;
}

Result<engine::FrameBuffer> FfmpegFrameReader::frameAt(Tick sourceTick, int width, int height) {
    Impl& d = *m_impl;
    if (!d.codecCtx) {
        return Error(ErrorCode::InvalidState, "Frame reader not open");
    }
    if (width <= 0 || height <= 0) {
        return Error(ErrorCode::InvalidArgument, "Invalid output size");
    }

    if (d.stillImage) {
        if (!d.hasPicture()) {
            auto got = d.decodeNext();
            if (!got) return got.error();
            if (!got.value()) {
                return Error(ErrorCode::DecoderError, "No picture in " + d.path);
            }
        }
        return d.convert(width, height);
    }

    if (d.hasPicture() && d.currentPts != kNoTick) {
        if (sourceTick >= d.currentPts && sourceTick < d.currentPts + d.frameDuration) {
            return d.convert(width, height);
        }
        if (d.eof && sourceTick >= d.currentPts) {
            return d.convert(width, height);
        }
    }

    const bool behind = d.currentPts != kNoTick && sourceTick < d.currentPts;
    const bool farAhead = d.currentPts == kNoTick
        ? sourceTick > d.frameDuration * kSeekAheadFrames
        : sourceTick > d.currentPts + d.frameDuration * kSeekAheadFrames;
    if (behind || farAhead) {
        auto sought = d.seek(sourceTick);
        if (!sought) return sought.error();
    }

    while (true) {
        auto got = d.decodeNext();
        if (!got) return got.error();

        if (!got.value()) {
            if (d.hasPicture()) {
                return d.convert(width, height);
            }
            return Error(ErrorCode::EndOfFile, "No picture at " + std::to_string(sourceTick) + " in " + d.path);
        }

        // Frames wholly before the target are skipped
        if (d.currentPts + d.frameDuration <= sourceTick) {
            continue;
        }
        return d.convert(width, height);
    }
}

Size FfmpegFrameReader::sourceSize() const {
    if (!m_impl->codecCtx) return {};
    return {m_impl->codecCtx->width, m_impl->codecCtx->height};
}

int64_t FfmpegFrameReader::seekCount() const {
    return m_impl->seeks;
}

} // namespace spl::media
