#pragma once

#include "core/types.hpp"
#include <string>
#include <memory>
#include <vector>
#include <cstddef>
#ifdef HALFTONE_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

namespace halftone {

// Produces decoded RGBA frames one at a time.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual Result open(const std::string& uri) = 0;
    virtual bool read(FrameBuffer& out) = 0;
    virtual double fps() const = 0;
    virtual Size frame_size() const = 0;
    /// Total frames when the container reports it, -1 otherwise.
    virtual long frame_count() const = 0;
    virtual bool is_open() const = 0;

protected:
#ifdef HALFTONE_USE_OPENCV
    static void mat_to_frame(const cv::Mat& mat, FrameBuffer& out);
#endif
};

class VideoFileSource : public FrameSource {
public:
    VideoFileSource();
    ~VideoFileSource() override;

    Result open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return size_; }
    long frame_count() const override { return frame_count_; }
    bool is_open() const override;

private:
#ifdef HALFTONE_USE_OPENCV
    cv::VideoCapture cap_;
#else
    struct Impl;
    std::unique_ptr<Impl> impl_;
#endif
    double fps_ = 30.0;
    Size size_;
    long frame_count_ = -1;
};

class ImageSource : public FrameSource {
public:
    ImageSource();
    ~ImageSource() override;

    Result open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return 0.0; }
    Size frame_size() const override { return image_.size(); }
    long frame_count() const override { return image_.empty() ? 0 : 1; }
    bool is_open() const override { return !image_.empty(); }

private:
    FrameBuffer image_;
    bool sent_ = false;
};

// Sorted files matching a wildcard pattern, e.g. "clips/shot_*.png".
class ImageSequenceSource : public FrameSource {
public:
    ImageSequenceSource();
    ~ImageSequenceSource() override;

    Result open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return size_; }
    long frame_count() const override { return static_cast<long>(files_.size()); }
    bool is_open() const override { return !files_.empty(); }

private:
    std::vector<std::string> files_;
    std::size_t current_index_ = 0;
    Size size_;
    double fps_ = 30.0;
};

// Raw frames on stdin: "pipe:WIDTHxHEIGHT[:rgb|rgba[:FPS]]".
class PipeSource : public FrameSource {
public:
    PipeSource();
    ~PipeSource() override;

    Result open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return fps_; }
    Size frame_size() const override { return {width_, height_}; }
    long frame_count() const override { return -1; }
    bool is_open() const override { return opened_; }

private:
    bool opened_ = false;
    int width_ = 0;
    int height_ = 0;
    int channels_ = 3;
    double fps_ = 30.0;
};

bool is_image_path(const std::string& path);

std::unique_ptr<FrameSource> create_source(const std::string& uri);

}
