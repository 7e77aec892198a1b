#include "video_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace halftone {

namespace {

bool ends_with_ci(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(value[offset + i]);
        unsigned char b = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

// Dithered output is palette-limited, so GIF keeps it exactly; other codecs
// get 4:2:0 unless they cannot take it.
AVPixelFormat choose_pixel_format(const AVCodec* codec, bool gif_output) {
    const AVPixelFormat fallback = gif_output ? AV_PIX_FMT_RGB8 : AV_PIX_FMT_YUV420P;

    const void* raw_formats = nullptr;
    int num_formats = 0;
    const int ret = avcodec_get_supported_config(
        nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &raw_formats, &num_formats);
    if (ret < 0 || !raw_formats || num_formats <= 0) {
        return fallback;
    }

    const auto* pix_fmts = static_cast<const AVPixelFormat*>(raw_formats);
    auto has_format = [&](AVPixelFormat fmt) {
        return std::find(pix_fmts, pix_fmts + num_formats, fmt) != pix_fmts + num_formats;
    };

    const std::vector<AVPixelFormat> preferred = gif_output
        ? std::vector<AVPixelFormat>{AV_PIX_FMT_RGB8, AV_PIX_FMT_BGR8, AV_PIX_FMT_PAL8}
        : std::vector<AVPixelFormat>{AV_PIX_FMT_YUV420P};
    for (AVPixelFormat pf : preferred) {
        if (has_format(pf)) return pf;
    }
    return pix_fmts[0];
}

std::vector<const AVCodec*> codec_candidates(const std::string& requested, bool gif_output) {
    std::vector<const AVCodec*> out;
    auto push = [&out](const AVCodec* codec) {
        if (!codec) return;
        for (const AVCodec* existing : out) {
            if (std::strcmp(existing->name, codec->name) == 0) return;
        }
        out.push_back(codec);
    };

    if (gif_output) {
        push(avcodec_find_encoder(AV_CODEC_ID_GIF));
    } else {
        push(avcodec_find_encoder_by_name(requested.c_str()));
        push(avcodec_find_encoder_by_name("libx264"));
        push(avcodec_find_encoder_by_name("libopenh264"));
        push(avcodec_find_encoder(AV_CODEC_ID_H264));
        push(avcodec_find_encoder(AV_CODEC_ID_MPEG4));
    }
    return out;
}

}  // namespace

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() {
    if (is_open()) {
        close();
    }
    release();
}

Result VideoEncoder::open(const std::string& filename, const Config& config) {
    if (is_open()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "encoder already open");
    }
    if (config.width <= 0 || config.height <= 0 || config.fps <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "encoder needs positive width, height and fps");
    }
    config_ = config;
    output_is_gif_ = ends_with_ci(filename, ".gif");

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, filename.c_str());
    if (ret < 0 || !format_ctx_) {
        format_ctx_ = nullptr;
        return Result::fail(ErrorCode::INVALID_FORMAT, "no output format for " + filename);
    }

    Result codec_result = init_codec();
    if (codec_result.failure()) {
        release();
        return codec_result;
    }

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
        if (avio_open(&format_ctx_->pb, filename.c_str(), AVIO_FLAG_WRITE) < 0) {
            release();
            return Result::fail(ErrorCode::IO_ERROR, "cannot create " + filename);
        }
    }

    if (avformat_write_header(format_ctx_, nullptr) < 0) {
        release();
        return Result::fail(ErrorCode::IO_ERROR, "cannot write header to " + filename);
    }
    return Result::ok();
}

Result VideoEncoder::init_codec() {
    for (const AVCodec* codec : codec_candidates(config_.codec, output_is_gif_)) {
        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) {
            continue;
        }

        codec_ctx_->width = config_.width;
        codec_ctx_->height = config_.height;
        codec_ctx_->time_base = {1, config_.fps};
        codec_ctx_->framerate = {config_.fps, 1};
        codec_ctx_->pix_fmt = choose_pixel_format(codec, output_is_gif_);
        codec_ctx_->gop_size = config_.fps;
        if (!output_is_gif_) {
            codec_ctx_->bit_rate = config_.bitrate;
        }
        if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }
        if (std::strcmp(codec->name, "libx264") == 0) {
            av_opt_set(codec_ctx_->priv_data, "preset", config_.preset.c_str(), 0);
        }

        if (avcodec_open2(codec_ctx_, codec, nullptr) >= 0) {
            break;
        }
        avcodec_free_context(&codec_ctx_);
    }
    if (!codec_ctx_) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "no usable video encoder");
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate output stream");
    }
    stream_->time_base = codec_ctx_->time_base;
    if (avcodec_parameters_from_context(stream_->codecpar, codec_ctx_) < 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot copy encoder parameters");
    }

    frame_ = av_frame_alloc();
    pkt_ = av_packet_alloc();
    if (!frame_ || !pkt_) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate encoder frame");
    }
    frame_->format = codec_ctx_->pix_fmt;
    frame_->width = codec_ctx_->width;
    frame_->height = codec_ctx_->height;
    if (av_frame_get_buffer(frame_, 0) < 0) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate encoder frame buffer");
    }
    return Result::ok();
}

bool VideoEncoder::drain_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) return false;

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        if (av_interleaved_write_frame(format_ctx_, pkt_) < 0) return false;
    }
}

Result VideoEncoder::write_frame(const Raster& frame) {
    if (!is_open()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "encoder is not open");
    }
    if (frame.empty() || (frame.channels() != 1 && frame.channels() != 3)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "encoder needs a 1- or 3-channel raster");
    }
    if (input_channels_ != 0 && frame.channels() != input_channels_) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "raster channel count changed mid-stream");
    }

    if (!sws_ctx_) {
        input_channels_ = frame.channels();
        sws_ctx_ = sws_getContext(
            frame.width(), frame.height(), input_channels_ == 1 ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_RGB24,
            config_.width, config_.height, codec_ctx_->pix_fmt,
            SWS_POINT, nullptr, nullptr, nullptr);
        if (!sws_ctx_) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot create pixel format converter");
        }
    }

    if (av_frame_make_writable(frame_) < 0) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "encoder frame not writable");
    }

    const uint8_t* src_data[1] = { frame.data() };
    int src_linesize[1] = { frame.width() * frame.channels() };
    sws_scale(sws_ctx_, src_data, src_linesize, 0, frame.height(), frame_->data, frame_->linesize);

    frame_->pts = pts_++;
    if (avcodec_send_frame(codec_ctx_, frame_) < 0 || !drain_packets()) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to encode frame " + std::to_string(pts_ - 1));
    }
    return Result::ok();
}

Result VideoEncoder::close() {
    if (!is_open()) {
        return Result::ok();
    }

    bool ok = true;
    if (codec_ctx_ && pkt_) {
        avcodec_send_frame(codec_ctx_, nullptr);
        ok = drain_packets();
    }
    ok = av_write_trailer(format_ctx_) >= 0 && ok;
    release();

    if (!ok) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to finalize video output");
    }
    return Result::ok();
}

void VideoEncoder::release() {
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }
    if (format_ctx_) {
        if (!(format_ctx_->oformat->flags & AVFMT_NOFILE) && format_ctx_->pb) {
            avio_closep(&format_ctx_->pb);
        }
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }
    if (frame_) {
        av_frame_free(&frame_);
    }
    if (pkt_) {
        av_packet_free(&pkt_);
    }
    if (sws_ctx_) {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = nullptr;
    }
    stream_ = nullptr;
    input_channels_ = 0;
    pts_ = 0;
    output_is_gif_ = false;
}

}
