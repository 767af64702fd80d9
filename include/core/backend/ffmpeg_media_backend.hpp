#pragma once

#include "core/backend/ffmpeg_process.hpp"
#include "core/backend/media_backend.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace cv
{
    class Mat;
}
class PocoConfigAdapter;

struct BackendOptions
{
    std::string ffmpeg_path = "ffmpeg";
    int render_threads = 4;
    int pdf_dpi = 150;

    static BackendOptions fromConfig(const PocoConfigAdapter &config);
};

/**
 * @brief MediaBackend on top of FFmpeg, OpenCV and PDFium.
 *
 * - libavformat/libavcodec/libswresample: probing and audio envelopes
 * - ffmpeg executable: audio/video re-encode, GIF output, muxing
 * - OpenCV: still images, frame grabs, waveform drawing, frame rendering
 * - PDFium: page rasterisation and image-to-PDF composition
 *
 * PDFium is not thread safe; every PDFium call is serialised on one mutex.
 */
class FFmpegMediaBackend : public MediaBackend
{
public:
    explicit FFmpegMediaBackend(BackendOptions options);
    ~FFmpegMediaBackend() override;

    FFmpegMediaBackend(const FFmpegMediaBackend &) = delete;
    FFmpegMediaBackend &operator=(const FFmpegMediaBackend &) = delete;

    ProbeResult probe(const std::string &path) override;

    BackendResult reencode(const std::string &input, const std::string &output, const FormatDescriptor &target,
                           const EncodeOptions &options, const ProgressCallback &progress,
                           const CancellationToken &token) override;

    RasterResult rasterize(const std::string &document, const PageRange &pages,
                           const std::vector<std::string> &outputs, const RasterOptions &options,
                           const CancellationToken &token) override;

    SampleResult sampleAudio(const std::string &asset, const TimeRange &range, size_t max_points,
                             const CancellationToken &token) override;

    BackendResult renderFrames(const FrameSequence &frames, double duration_seconds, const std::string &output,
                               const ProgressCallback &progress, const CancellationToken &token) override;

    BackendResult renderWaveformImage(const std::vector<float> &samples, int width, int height,
                                      const std::string &output, double quality) override;

    BackendResult extractFrame(const std::string &video, double time_seconds, const std::string &output,
                               double quality, const CancellationToken &token) override;

    BackendResult composeDocument(const std::vector<std::string> &images, const std::string &output) override;

    /**
     * @brief ffmpeg arguments (after the common flags) for reencode() of audio, video and GIF targets
     */
    static std::vector<std::string> buildEncodeArguments(const std::string &input, const std::string &output,
                                                         const FormatDescriptor &target,
                                                         const EncodeOptions &options);

private:
    ProbeResult probeDocument(const std::string &path);
    ProbeResult probeMedia(const std::string &path);
    BackendResult reencodeImage(const std::string &input, const std::string &output, const EncodeOptions &options,
                                const CancellationToken &token);

    /**
     * @brief imwrite with quality flags; formats OpenCV cannot write (gif) go through ffmpeg
     */
    BackendResult writeImage(const cv::Mat &image, const std::string &output, double quality,
                             const CancellationToken &token);

    BackendOptions options_;
    FFmpegProcess ffmpeg_;
    std::mutex pdfium_mutex_;
};
