#include "frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <regex>
#include <sstream>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include <stb_image.h>

#ifdef HALFTONE_USE_OPENCV
#include <opencv2/opencv.hpp>
#else
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}
#endif

namespace halftone {

#ifdef HALFTONE_USE_OPENCV
void FrameSource::mat_to_frame(const cv::Mat& mat, FrameBuffer& out) {
    if (mat.empty()) return;

    cv::Mat rgba;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA);
    } else if (mat.channels() == 1) {
        cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA);
    } else {
        return;
    }

    if (out.width() != rgba.cols || out.height() != rgba.rows) {
        out = FrameBuffer(rgba.cols, rgba.rows);
    }
    for (int y = 0; y < rgba.rows; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * rgba.cols * 4,
                    rgba.ptr<uint8_t>(y), static_cast<size_t>(rgba.cols) * 4);
    }
}
#endif

namespace {

std::string wildcard_to_regex(const std::string& pattern) {
    std::string regex = "^";
    for (char c : pattern) {
        switch (c) {
            case '*': regex += ".*"; break;
            case '?': regex += "."; break;
            case '.': case '\\': case '+': case '^': case '$': case '(': case ')':
            case '[': case ']': case '{': case '}': case '|':
                regex += '\\';
                regex += c;
                break;
            default:
                regex += c;
                break;
        }
    }
    regex += "$";
    return regex;
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

bool has_wildcard(const std::string& s) {
    return s.find('*') != std::string::npos || s.find('?') != std::string::npos;
}

bool load_image_file(const std::string& path, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!data) {
        return false;
    }
    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }

    out = FrameBuffer(w, h);
    std::memcpy(out.data(), data, static_cast<size_t>(w) * h * 4);
    stbi_image_free(data);
    return true;
}

#ifndef HALFTONE_USE_OPENCV
// Owns every libav* object of one open input.
struct Decoder {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    AVFrame* rgba_frame = nullptr;
    SwsContext* sws_ctx = nullptr;
    std::vector<uint8_t> rgba_buffer;
    int stream_idx = -1;
    int sws_width = 0;
    int sws_height = 0;
    int sws_format = -1;
    bool eof = false;

    ~Decoder() { close(); }

    void close() {
        if (sws_ctx) sws_freeContext(sws_ctx);
        if (rgba_frame) av_frame_free(&rgba_frame);
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) avformat_close_input(&format_ctx);
        sws_ctx = nullptr;
        stream_idx = -1;
        sws_width = sws_height = 0;
        sws_format = -1;
        eof = false;
        rgba_buffer.clear();
    }
};

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

Result open_decoder(const std::string& uri, Decoder& dec, Size& size, double& fps, long& frame_count) {
    dec.close();

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "probesize", "5000000", 0);
    av_dict_set(&opts, "analyzeduration", "5000000", 0);
    int ret = avformat_open_input(&dec.format_ctx, uri.c_str(), nullptr, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open " + uri + ": " + av_error_string(ret));
    }
    if (avformat_find_stream_info(dec.format_ctx, nullptr) < 0) {
        dec.close();
        return Result::fail(ErrorCode::INVALID_FORMAT, "no stream info in " + uri);
    }

    dec.stream_idx = av_find_best_stream(dec.format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (dec.stream_idx < 0) {
        dec.close();
        return Result::fail(ErrorCode::INVALID_FORMAT, "no video stream in " + uri);
    }

    AVStream* stream = dec.format_ctx->streams[dec.stream_idx];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        dec.close();
        return Result::fail(ErrorCode::INVALID_FORMAT, "no decoder for video stream in " + uri);
    }

    dec.codec_ctx = avcodec_alloc_context3(codec);
    if (!dec.codec_ctx) {
        dec.close();
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate decoder context");
    }
    if (avcodec_parameters_to_context(dec.codec_ctx, stream->codecpar) < 0 ||
        avcodec_open2(dec.codec_ctx, codec, nullptr) < 0) {
        dec.close();
        return Result::fail(ErrorCode::INVALID_FORMAT, "cannot open decoder for " + uri);
    }

    size.width = dec.codec_ctx->width;
    size.height = dec.codec_ctx->height;

    AVRational fr = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    fps = (fr.num > 0 && fr.den > 0) ? av_q2d(fr) : 30.0;
    if (fps <= 0.0) fps = 30.0;
    frame_count = stream->nb_frames > 0 ? static_cast<long>(stream->nb_frames) : -1;

    dec.packet = av_packet_alloc();
    dec.frame = av_frame_alloc();
    dec.rgba_frame = av_frame_alloc();
    if (!dec.packet || !dec.frame || !dec.rgba_frame) {
        dec.close();
        return Result::fail(ErrorCode::MEMORY_ERROR, "cannot allocate decoder frames");
    }
    return Result::ok();
}

bool ensure_scaler(Decoder& dec, int width, int height, AVPixelFormat src_fmt) {
    if (dec.sws_ctx && dec.sws_width == width && dec.sws_height == height && dec.sws_format == src_fmt) {
        return true;
    }
    if (dec.sws_ctx) {
        sws_freeContext(dec.sws_ctx);
        dec.sws_ctx = nullptr;
    }

    int bytes = av_image_get_buffer_size(AV_PIX_FMT_RGBA, width, height, 1);
    if (bytes <= 0) return false;
    dec.rgba_buffer.resize(static_cast<size_t>(bytes));
    if (av_image_fill_arrays(dec.rgba_frame->data, dec.rgba_frame->linesize, dec.rgba_buffer.data(),
                             AV_PIX_FMT_RGBA, width, height, 1) < 0) {
        return false;
    }

    dec.sws_ctx = sws_getContext(width, height, src_fmt,
                                 width, height, AV_PIX_FMT_RGBA,
                                 SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!dec.sws_ctx) return false;

    dec.sws_width = width;
    dec.sws_height = height;
    dec.sws_format = src_fmt;
    return true;
}

bool convert_decoded_frame(Decoder& dec, Size& size, FrameBuffer& out) {
    const int w = dec.frame->width;
    const int h = dec.frame->height;
    if (w <= 0 || h <= 0 ||
        !ensure_scaler(dec, w, h, static_cast<AVPixelFormat>(dec.frame->format))) {
        av_frame_unref(dec.frame);
        return false;
    }

    sws_scale(dec.sws_ctx, dec.frame->data, dec.frame->linesize, 0, h,
              dec.rgba_frame->data, dec.rgba_frame->linesize);
    av_frame_unref(dec.frame);

    size = {w, h};
    if (out.width() != w || out.height() != h) {
        out = FrameBuffer(w, h);
    }
    for (int y = 0; y < h; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * w * 4,
                    dec.rgba_frame->data[0] + static_cast<size_t>(y) * dec.rgba_frame->linesize[0],
                    static_cast<size_t>(w) * 4);
    }
    return true;
}

bool decode_next_frame(Decoder& dec, Size& size, FrameBuffer& out) {
    while (true) {
        int recv = avcodec_receive_frame(dec.codec_ctx, dec.frame);
        if (recv == 0) {
            return convert_decoded_frame(dec, size, out);
        }
        if (recv != AVERROR(EAGAIN) || dec.eof) {
            return false;
        }

        // Feed packets until the decoder accepts one from our stream.
        while (true) {
            int read_ret = av_read_frame(dec.format_ctx, dec.packet);
            if (read_ret < 0) {
                dec.eof = true;
                avcodec_send_packet(dec.codec_ctx, nullptr);
                break;
            }
            if (dec.packet->stream_index != dec.stream_idx) {
                av_packet_unref(dec.packet);
                continue;
            }
            int send_ret = avcodec_send_packet(dec.codec_ctx, dec.packet);
            av_packet_unref(dec.packet);
            if (send_ret < 0 && send_ret != AVERROR(EAGAIN)) {
                return false;
            }
            break;
        }
    }
}
#endif

}  // namespace

bool is_image_path(const std::string& path) {
    std::string lower = to_lower_copy(path);
    return lower.ends_with(".png") || lower.ends_with(".jpg") ||
           lower.ends_with(".jpeg") || lower.ends_with(".bmp") ||
           lower.ends_with(".gif") || lower.ends_with(".tga") ||
           lower.ends_with(".psd") || lower.ends_with(".pnm");
}

#ifndef HALFTONE_USE_OPENCV
struct VideoFileSource::Impl {
    Decoder decoder;
    bool opened = false;
};
#endif

VideoFileSource::VideoFileSource() {
#ifndef HALFTONE_USE_OPENCV
    impl_ = std::make_unique<Impl>();
#endif
}

VideoFileSource::~VideoFileSource() = default;

Result VideoFileSource::open(const std::string& uri) {
#ifdef HALFTONE_USE_OPENCV
    cap_.open(uri);
    if (!cap_.isOpened()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open video file " + uri);
    }

    fps_ = cap_.get(cv::CAP_PROP_FPS);
    if (fps_ <= 0) fps_ = 30.0;
    size_.width = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    size_.height = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    double count = cap_.get(cv::CAP_PROP_FRAME_COUNT);
    frame_count_ = count > 0 ? static_cast<long>(count) : -1;
    return Result::ok();
#else
    Result r = open_decoder(uri, impl_->decoder, size_, fps_, frame_count_);
    impl_->opened = r.success();
    return r;
#endif
}

bool VideoFileSource::read(FrameBuffer& out) {
#ifdef HALFTONE_USE_OPENCV
    cv::Mat frame;
    if (!cap_.read(frame)) return false;
    mat_to_frame(frame, out);
    return !out.empty();
#else
    if (!impl_->opened) return false;
    return decode_next_frame(impl_->decoder, size_, out);
#endif
}

bool VideoFileSource::is_open() const {
#ifdef HALFTONE_USE_OPENCV
    return cap_.isOpened();
#else
    return impl_->opened;
#endif
}

ImageSource::ImageSource() = default;
ImageSource::~ImageSource() = default;

Result ImageSource::open(const std::string& uri) {
    sent_ = false;
#ifdef HALFTONE_USE_OPENCV
    cv::Mat mat = cv::imread(uri, cv::IMREAD_COLOR);
    if (mat.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot read image " + uri);
    }
    mat_to_frame(mat, image_);
#else
    if (!load_image_file(uri, image_)) {
        const char* reason = stbi_failure_reason();
        return Result::fail(ErrorCode::FILE_NOT_FOUND,
                            "cannot read image " + uri + (reason ? std::string(" (") + reason + ")" : ""));
    }
#endif
    return Result::ok();
}

bool ImageSource::read(FrameBuffer& out) {
    if (sent_ || image_.empty()) return false;
    out = image_;
    sent_ = true;
    return true;
}

ImageSequenceSource::ImageSequenceSource() = default;
ImageSequenceSource::~ImageSequenceSource() = default;

Result ImageSequenceSource::open(const std::string& uri) {
    files_.clear();
    current_index_ = 0;
    size_ = {};

    namespace fs = std::filesystem;
    fs::path path(uri);
    fs::path directory = path.has_parent_path() ? path.parent_path() : fs::path(".");
    std::string pattern = path.filename().string();

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "no such directory: " + directory.string());
    }

    std::regex matcher(wildcard_to_regex(pattern), std::regex::icase);
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) continue;
        if (std::regex_match(entry.path().filename().string(), matcher)) {
            files_.push_back(entry.path().string());
        }
    }
    std::sort(files_.begin(), files_.end());

    if (files_.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "no files match " + uri);
    }
    return Result::ok();
}

bool ImageSequenceSource::read(FrameBuffer& out) {
    while (current_index_ < files_.size()) {
        const std::string& file = files_[current_index_++];
#ifdef HALFTONE_USE_OPENCV
        cv::Mat image = cv::imread(file, cv::IMREAD_COLOR);
        if (image.empty()) {
            std::cerr << "Warning: Skipping unreadable image: " << file << "\n";
            continue;
        }
        mat_to_frame(image, out);
#else
        if (!load_image_file(file, out)) {
            std::cerr << "Warning: Skipping unreadable image: " << file << "\n";
            continue;
        }
#endif
        if (size_.width == 0 || size_.height == 0) {
            size_ = out.size();
        }
        return true;
    }
    return false;
}

PipeSource::PipeSource() = default;
PipeSource::~PipeSource() = default;

Result PipeSource::open(const std::string& uri) {
    opened_ = false;
    width_ = 0;
    height_ = 0;
    channels_ = 3;
    fps_ = 30.0;

    auto invalid = [&uri]() {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "invalid pipe source '" + uri + "', expected pipe:WIDTHxHEIGHT[:rgb|rgba[:FPS]]");
    };

    if (uri.rfind("pipe:", 0) != 0) return invalid();

    auto parts = split(uri.substr(5), ':');
    if (parts.empty()) return invalid();

    size_t x_pos = parts[0].find('x');
    if (x_pos == std::string::npos) return invalid();

    try {
        width_ = std::stoi(parts[0].substr(0, x_pos));
        height_ = std::stoi(parts[0].substr(x_pos + 1));
        if (parts.size() >= 3) {
            fps_ = std::stod(parts[2]);
        }
    } catch (const std::exception&) {
        return invalid();
    }
    if (width_ <= 0 || height_ <= 0 || fps_ <= 0.0) return invalid();

    if (parts.size() >= 2) {
        std::string fmt = to_lower_copy(parts[1]);
        if (fmt == "rgb") {
            channels_ = 3;
        } else if (fmt == "rgba") {
            channels_ = 4;
        } else {
            return invalid();
        }
    }

    opened_ = true;
    return Result::ok();
}

bool PipeSource::read(FrameBuffer& out) {
    if (!opened_) return false;

    const size_t frame_bytes = static_cast<size_t>(width_) * height_ * channels_;
    std::vector<uint8_t> buffer(frame_bytes);
    std::cin.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(frame_bytes));
    if (static_cast<size_t>(std::cin.gcount()) != frame_bytes) {
        return false;
    }

    if (out.width() != width_ || out.height() != height_) {
        out = FrameBuffer(width_, height_);
    }
    uint8_t* dst = out.data();
    const size_t pixels = static_cast<size_t>(width_) * height_;
    for (size_t i = 0; i < pixels; ++i) {
        const uint8_t* px = buffer.data() + i * channels_;
        dst[i * 4 + 0] = px[0];
        dst[i * 4 + 1] = px[1];
        dst[i * 4 + 2] = px[2];
        dst[i * 4 + 3] = channels_ == 4 ? px[3] : 255;
    }
    return true;
}

std::unique_ptr<FrameSource> create_source(const std::string& uri) {
    if (uri.rfind("pipe:", 0) == 0) {
        return std::make_unique<PipeSource>();
    }
    if (has_wildcard(uri)) {
        return std::make_unique<ImageSequenceSource>();
    }
    if (is_image_path(uri)) {
        return std::make_unique<ImageSource>();
    }
    return std::make_unique<VideoFileSource>();
}

}  // namespace halftone
