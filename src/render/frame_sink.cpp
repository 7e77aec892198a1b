#include "frame_sink.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>

#ifdef HALFTONE_USE_OPENCV
#include <opencv2/opencv.hpp>
#else
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
}
#endif

namespace halftone {

std::string frame_filename(const std::string& prefix, int index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d", index);
    return prefix + buf + ".png";
}

bool is_video_path(const std::string& path) {
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower.ends_with(".mp4") || lower.ends_with(".mkv") ||
           lower.ends_with(".mov") || lower.ends_with(".avi") ||
           lower.ends_with(".webm") || lower.ends_with(".gif");
}

#ifdef HALFTONE_USE_OPENCV
struct PngSequenceSink::Encoder {
    Result encode(const Raster& frame, const std::string& path) {
        cv::Mat mat;
        if (frame.channels() == 1) {
            mat = cv::Mat(frame.height(), frame.width(), CV_8UC1, const_cast<uint8_t*>(frame.data())).clone();
        } else {
            cv::Mat rgb(frame.height(), frame.width(), CV_8UC3, const_cast<uint8_t*>(frame.data()));
            cv::cvtColor(rgb, mat, cv::COLOR_RGB2BGR);
        }
        if (!cv::imwrite(path, mat)) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot write " + path);
        }
        return Result::ok();
    }
};
#else
// libavcodec PNG encoder, opened on the first frame and reused after that.
struct PngSequenceSink::Encoder {
    AVCodecContext* ctx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* pkt = nullptr;

    ~Encoder() {
        if (pkt) av_packet_free(&pkt);
        if (frame) av_frame_free(&frame);
        if (ctx) avcodec_free_context(&ctx);
    }

    Result init(const Raster& raster) {
        const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
        if (!codec) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "libavcodec has no PNG encoder");
        }
        ctx = avcodec_alloc_context3(codec);
        frame = av_frame_alloc();
        pkt = av_packet_alloc();
        if (!ctx || !frame || !pkt) {
            return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate PNG encoder");
        }

        ctx->width = raster.width();
        ctx->height = raster.height();
        ctx->pix_fmt = raster.channels() == 1 ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_RGB24;
        ctx->time_base = {1, 25};
        if (avcodec_open2(ctx, codec, nullptr) < 0) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "cannot open PNG encoder");
        }

        frame->format = ctx->pix_fmt;
        frame->width = ctx->width;
        frame->height = ctx->height;
        if (av_frame_get_buffer(frame, 0) < 0) {
            return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate PNG frame buffer");
        }
        return Result::ok();
    }

    Result encode(const Raster& raster, const std::string& path) {
        if (!ctx) {
            Result r = init(raster);
            if (r.failure()) return r;
        }
        if (raster.width() != ctx->width || raster.height() != ctx->height ||
            (raster.channels() == 1) != (ctx->pix_fmt == AV_PIX_FMT_GRAY8)) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "frame shape changed mid-sequence");
        }
        if (av_frame_make_writable(frame) < 0) {
            return Result::fail(ErrorCode::MEMORY_ERROR, "PNG frame not writable");
        }

        const size_t row_bytes = static_cast<size_t>(raster.width()) * raster.channels();
        for (int y = 0; y < raster.height(); ++y) {
            std::copy_n(raster.data() + y * row_bytes, row_bytes,
                        frame->data[0] + static_cast<size_t>(y) * frame->linesize[0]);
        }

        if (avcodec_send_frame(ctx, frame) < 0 || avcodec_receive_packet(ctx, pkt) < 0) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "PNG encoding failed for " + path);
        }

        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(pkt->data), pkt->size);
        av_packet_unref(pkt);
        if (!out) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot write " + path);
        }
        return Result::ok();
    }
};
#endif

PngSequenceSink::PngSequenceSink() = default;
PngSequenceSink::~PngSequenceSink() = default;

Result PngSequenceSink::open(const std::string& target, const Config& config) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec || !fs::is_directory(target)) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot create output directory " + target);
    }

    directory_ = target;
    config_ = config;
    written_ = 0;
    encoder_ = std::make_unique<Encoder>();
    return Result::ok();
}

Result PngSequenceSink::write(const Raster& frame) {
    if (!encoder_) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "PNG sink is not open");
    }
    std::string path = (std::filesystem::path(directory_) / frame_filename(config_.prefix, written_)).string();
    Result r = encoder_->encode(frame, path);
    if (r.success()) {
        ++written_;
    }
    return r;
}

Result PngSequenceSink::close() {
    encoder_.reset();
    return Result::ok();
}

Result VideoFileSink::open(const std::string& target, const Config& config) {
    path_ = target;
    config_ = config;
    written_ = 0;
    return Result::ok();
}

Result VideoFileSink::write(const Raster& frame) {
    if (!encoder_.is_open()) {
        VideoEncoder::Config enc;
        enc.width = frame.width();
        enc.height = frame.height();
        enc.fps = config_.fps;
        Result r = encoder_.open(path_, enc);
        if (r.failure()) return r;
    }
    Result r = encoder_.write_frame(frame);
    if (r.success()) {
        ++written_;
    }
    return r;
}

Result VideoFileSink::close() {
    return encoder_.close();
}

std::unique_ptr<FrameSink> create_sink(const std::string& target) {
    if (is_video_path(target)) {
        return std::make_unique<VideoFileSink>();
    }
    return std::make_unique<PngSequenceSink>();
}

}
