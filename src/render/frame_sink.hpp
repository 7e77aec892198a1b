#pragma once

#include "core/types.hpp"
#include "render/video_encoder.hpp"

#include <memory>
#include <string>

namespace halftone {

// Consumes dithered rasters one at a time.
class FrameSink {
public:
    struct Config {
        int fps = 30;
        std::string prefix = "frame_";
    };

    virtual ~FrameSink() = default;
    virtual Result open(const std::string& target, const Config& config) = 0;
    virtual Result write(const Raster& frame) = 0;
    virtual Result close() = 0;
    virtual int frames_written() const = 0;
    /// Human-readable description of where frames went.
    virtual std::string destination() const = 0;
};

/// "<prefix>0000.png", zero-padded to four digits.
std::string frame_filename(const std::string& prefix, int index);

// One PNG per frame in a directory, created if missing.
class PngSequenceSink : public FrameSink {
public:
    PngSequenceSink();
    ~PngSequenceSink() override;

    Result open(const std::string& target, const Config& config) override;
    Result write(const Raster& frame) override;
    Result close() override;
    int frames_written() const override { return written_; }
    std::string destination() const override { return directory_; }

private:
    struct Encoder;
    std::unique_ptr<Encoder> encoder_;
    std::string directory_;
    Config config_;
    int written_ = 0;
};

class VideoFileSink : public FrameSink {
public:
    Result open(const std::string& target, const Config& config) override;
    Result write(const Raster& frame) override;
    Result close() override;
    int frames_written() const override { return written_; }
    std::string destination() const override { return path_; }

private:
    VideoEncoder encoder_;
    std::string path_;
    Config config_;
    int written_ = 0;
};

bool is_video_path(const std::string& path);

/// Video container extensions get a VideoFileSink, anything else is treated
/// as an output directory for a PNG sequence.
std::unique_ptr<FrameSink> create_sink(const std::string& target);

}
