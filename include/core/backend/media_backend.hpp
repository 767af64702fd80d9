#pragma once

#include "core/cancellation_token.hpp"
#include "core/format_descriptor.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Receives fractional progress in [0, 1] from long-running backend calls
 */
using ProgressCallback = std::function<void(double)>;

/**
 * @brief Outcome of a backend call: codec failures are reported here, never thrown
 */
struct BackendResult
{
    bool success;
    std::string reason;

    BackendResult() : success(false) {}
    BackendResult(bool s, const std::string &r = "") : success(s), reason(r) {}

    static BackendResult ok() { return BackendResult(true); }
    static BackendResult failure(const std::string &reason) { return BackendResult(false, reason); }
};

struct ProbeResult : BackendResult
{
    double duration_seconds = 0.0;
    int page_count = 0;
    int width = 0;
    int height = 0;
    bool has_audio = false;
    bool has_video = false;
};

struct SampleResult : BackendResult
{
    std::vector<float> samples; // Peak envelope, each value in [0, 1]
    int sample_rate = 0;        // Source sample rate
};

struct RasterResult : BackendResult
{
    std::vector<std::string> outputs;
};

struct TimeRange
{
    double start_seconds = 0.0;
    double duration_seconds = 0.0; // 0 means "to the end"
};

struct PageRange
{
    int first = 0; // Zero-based, inclusive
    int last = 0;  // Zero-based, inclusive

    int count() const { return last - first + 1; }
};

/**
 * @brief Knobs for reencode(); unset optionals keep the encoder's defaults
 */
struct EncodeOptions
{
    double quality = 0.95; // Lossy compression factor for still images
    bool preserve_metadata = true;
    bool reduced_quality = false;

    // Geometry (images and video)
    std::optional<int> target_width;
    std::optional<int> target_height;
    bool maintain_aspect_ratio = true;

    // Image filters
    bool enhance = false;
    bool adjust_colors = false;
    double saturation = 1.0;
    double brightness = 0.0;
    double contrast = 1.0;

    // Audio and video
    std::optional<int> video_bitrate_kbps;
    std::optional<int> audio_bitrate_kbps;
    std::optional<int> frame_rate;
    std::string preset; // Encoder speed preset, empty for default
    bool audio_only = false;
    double volume = 1.0;
    double tempo = 1.0;

    // Animated GIF output from video
    std::optional<double> start_seconds;
    int animation_frame_count = 0;
    double animation_frame_duration = 0.0;
};

struct RasterOptions
{
    int dpi = 150;
    double quality = 0.95;
};

/**
 * @brief Frames to encode into a video container.
 *
 * Either `still_images` (each shown for an equal share of the duration) or
 * `waveform_frames` (one envelope window per output frame) is populated.
 */
struct FrameSequence
{
    std::vector<std::string> still_images;
    std::vector<std::vector<float>> waveform_frames;
    int frame_count = 0;
    double frame_rate = 30.0;
    int width = 1280;
    int height = 720;
    std::optional<std::string> audio_source; // Muxed into the output when set
    std::optional<int> video_bitrate_kbps;
};

/**
 * @brief Codec, rasterizer and renderer service used by the converters.
 *
 * Implementations must be safe to call from several threads, report failures
 * through the result structs, and stop promptly once the token is cancelled.
 */
class MediaBackend
{
public:
    virtual ~MediaBackend() = default;

    virtual ProbeResult probe(const std::string &path) = 0;

    virtual BackendResult reencode(const std::string &input, const std::string &output,
                                   const FormatDescriptor &target, const EncodeOptions &options,
                                   const ProgressCallback &progress, const CancellationToken &token) = 0;

    virtual RasterResult rasterize(const std::string &document, const PageRange &pages,
                                   const std::vector<std::string> &outputs, const RasterOptions &options,
                                   const CancellationToken &token) = 0;

    virtual SampleResult sampleAudio(const std::string &asset, const TimeRange &range, size_t max_points,
                                     const CancellationToken &token) = 0;

    virtual BackendResult renderFrames(const FrameSequence &frames, double duration_seconds,
                                       const std::string &output, const ProgressCallback &progress,
                                       const CancellationToken &token) = 0;

    virtual BackendResult renderWaveformImage(const std::vector<float> &samples, int width, int height,
                                              const std::string &output, double quality) = 0;

    virtual BackendResult extractFrame(const std::string &video, double time_seconds, const std::string &output,
                                       double quality, const CancellationToken &token) = 0;

    virtual BackendResult composeDocument(const std::vector<std::string> &images, const std::string &output) = 0;
};
