/**
 * @file ffmpeg_media_decoder.cpp
 * @brief Media file probing implementation
 */

#include <splice/media/ffmpeg_media_decoder.hpp>
#include "ff_common.hpp"

#include <splice/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <future>
#include <vector>

namespace spl::media {

namespace {

const std::vector<std::string> kVideoExtensions = {
    ".mp4", ".mov", ".avi", ".mkv", ".webm", ".m4v",
    ".wmv", ".flv", ".mpg", ".mpeg", ".mts", ".m2ts",
    ".ts", ".3gp", ".mxf", ".ogv"
};

const std::vector<std::string> kAudioExtensions = {
    ".mp3", ".wav", ".aac", ".m4a", ".flac", ".ogg",
    ".wma", ".aiff", ".aif", ".opus", ".ac3"
};

const std::vector<std::string> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tiff",
    ".tif", ".webp", ".tga"
};

std::string extensionOf(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool contains(const std::vector<std::string>& list, const std::string& ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

/// Image demuxers ("image2", "png_pipe", ...) or a still-image extension
bool isStillImage(const AVFormatContext* fmtCtx, const std::string& path) {
    if (contains(kImageExtensions, extensionOf(path))) return true;
    const std::string name = fmtCtx->iformat ? fmtCtx->iformat->name : "";
    return name == "image2" || name.find("_pipe") != std::string::npos;
}

} // anonymous namespace

std::future<Result<model::MediaAssetInfo>> FfmpegMediaDecoder::decode(const std::string& descriptor) {
    return std::async(std::launch::async, [descriptor] { return inspect(descriptor); });
}

Result<model::MediaAssetInfo> FfmpegMediaDecoder::inspect(const std::string& path) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return ff::avError(ret, "Failed to open " + path, ErrorCode::FileOpenFailed);
    }
    ff::InputContextPtr fmtCtx(raw);

    ret = avformat_find_stream_info(fmtCtx.get(), nullptr);
    if (ret < 0) {
        return ff::avError(ret, "Failed to find stream info", ErrorCode::InvalidData);
    }

    model::MediaAssetInfo info;

    if (fmtCtx->duration != AV_NOPTS_VALUE) {
        info.durationTicks = av_rescale_q(fmtCtx->duration, AV_TIME_BASE_Q,
                                          {1, static_cast<int>(kTicksPerSecond)});
    }

    int videoStreamIdx = av_find_best_stream(fmtCtx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoStreamIdx >= 0) {
        AVStream* stream = fmtCtx->streams[videoStreamIdx];
        AVCodecParameters* codecpar = stream->codecpar;

        info.resolution = {codecpar->width, codecpar->height};
        info.frameRate = ff::fromAVRational(stream->avg_frame_rate);
        if (const AVCodecDescriptor* desc = avcodec_descriptor_get(codecpar->codec_id)) {
            info.videoCodec = desc->name;
        }
    }

    int audioStreamIdx = av_find_best_stream(fmtCtx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioStreamIdx >= 0) {
        AVCodecParameters* codecpar = fmtCtx->streams[audioStreamIdx]->codecpar;
        info.sampleRate = codecpar->sample_rate;
        info.channels = codecpar->ch_layout.nb_channels;
        if (const AVCodecDescriptor* desc = avcodec_descriptor_get(codecpar->codec_id)) {
            info.audioCodec = desc->name;
        }
    }

    if (videoStreamIdx >= 0 && isStillImage(fmtCtx.get(), path)) {
        info.kind = model::MediaAssetKind::Image;
        info.durationTicks = 0;
    } else if (videoStreamIdx >= 0) {
        info.kind = model::MediaAssetKind::Video;
    } else if (audioStreamIdx >= 0) {
        info.kind = model::MediaAssetKind::Audio;
    } else {
        return Error(ErrorCode::NotSupported, "No audio or video stream in " + path);
    }

    if (info.kind != model::MediaAssetKind::Image && info.durationTicks <= 0) {
        return Error(ErrorCode::InvalidData, "Unknown duration for " + path);
    }

    LOG_DEBUG("Inspected {}: {} {}x{} {} us", path, model::mediaAssetKindToString(info.kind),
              info.resolution.width, info.resolution.height, info.durationTicks);
    return info;
}

bool FfmpegMediaDecoder::isSupported(const std::string& path) {
    const std::string ext = extensionOf(path);
    return contains(kVideoExtensions, ext) || contains(kAudioExtensions, ext) ||
           contains(kImageExtensions, ext);
}

} // namespace spl::media
