#pragma once

#include "core/types.hpp"
#include <string>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;
}

namespace halftone {

// Encodes dithered rasters into a video container through libavformat.
// A ".gif" target uses the GIF encoder, anything else an H.264/MPEG-4 one.
class VideoEncoder {
public:
    struct Config {
        int width = 540;
        int height = 960;
        int fps = 30;
        int bitrate = 4000000;
        std::string codec = "libx264";
        std::string preset = "medium";
    };

    VideoEncoder();
    ~VideoEncoder();

    VideoEncoder(const VideoEncoder&) = delete;
    VideoEncoder& operator=(const VideoEncoder&) = delete;

    Result open(const std::string& filename, const Config& config);
    /// Flushes the encoder and writes the trailer.
    Result close();
    /// Accepts 1-channel or 3-channel rasters. The channel count of the first
    /// frame fixes the input format for the rest of the stream.
    Result write_frame(const Raster& frame);
    bool is_open() const { return format_ctx_ != nullptr; }

private:
    Result init_codec();
    bool drain_packets();
    void release();

    Config config_;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    int input_channels_ = 0;
    int64_t pts_ = 0;
    bool output_is_gif_ = false;
};

}
