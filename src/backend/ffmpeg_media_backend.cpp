#include "core/backend/ffmpeg_media_backend.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <fpdf_edit.h>
#include <fpdf_save.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace fs = std::filesystem;

namespace
{
    constexpr double kPointsPerInch = 72.0;
    constexpr double kRenderShare = 0.8; // Share of renderFrames() progress spent drawing frames
    constexpr int kFramesPerThreadBatch = 8;
    constexpr int kDefaultGifWidth = 480;

    std::string avError(int code)
    {
        char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    std::string formatNumber(double value)
    {
        std::ostringstream ss;
        ss.precision(6);
        ss << value;
        return ss.str();
    }

    void ensurePdfiumInitialized()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
            FPDF_InitLibrary();
            Logger::debug("PDFium initialized"); });
    }

    std::string pdfiumError()
    {
        switch (FPDF_GetLastError())
        {
        case FPDF_ERR_FILE:
            return "file not found or could not be opened";
        case FPDF_ERR_FORMAT:
            return "not a PDF or corrupted";
        case FPDF_ERR_PASSWORD:
            return "password required";
        case FPDF_ERR_SECURITY:
            return "unsupported security scheme";
        default:
            return "unknown PDFium error";
        }
    }

    struct PdfFileWriter : FPDF_FILEWRITE
    {
        std::ofstream *stream = nullptr;

        static int writeBlock(FPDF_FILEWRITE *self, const void *data, unsigned long size)
        {
            auto *writer = static_cast<PdfFileWriter *>(self);
            writer->stream->write(static_cast<const char *>(data), static_cast<std::streamsize>(size));
            return writer->stream->good() ? 1 : 0;
        }
    };

    struct RemoveOnExit
    {
        std::string path;
        ~RemoveOnExit()
        {
            std::error_code ec;
            fs::remove(path, ec);
        }
    };

    // Scale `image` to fit inside width x height, centred on a black canvas
    cv::Mat letterbox(const cv::Mat &image, int width, int height)
    {
        cv::Mat canvas(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        double scale = std::min(static_cast<double>(width) / image.cols, static_cast<double>(height) / image.rows);
        int fitted_w = std::max(1, static_cast<int>(std::lround(image.cols * scale)));
        int fitted_h = std::max(1, static_cast<int>(std::lround(image.rows * scale)));
        cv::Mat resized;
        cv::resize(image, resized, cv::Size(fitted_w, fitted_h), 0, 0, cv::INTER_AREA);
        resized.copyTo(canvas(cv::Rect((width - fitted_w) / 2, (height - fitted_h) / 2, fitted_w, fitted_h)));
        return canvas;
    }

    void drawWaveform(cv::Mat &canvas, const std::vector<float> &samples)
    {
        canvas.setTo(cv::Scalar(24, 24, 24));
        const int center = canvas.rows / 2;
        const int half_height = std::max(1, canvas.rows / 2 - canvas.rows / 20);
        cv::line(canvas, cv::Point(0, center), cv::Point(canvas.cols - 1, center), cv::Scalar(80, 80, 80));
        if (samples.empty())
        {
            return;
        }
        for (int x = 0; x < canvas.cols; ++x)
        {
            size_t index = static_cast<size_t>(x) * samples.size() / static_cast<size_t>(canvas.cols);
            float value = std::clamp(samples[std::min(index, samples.size() - 1)], 0.0f, 1.0f);
            int amplitude = static_cast<int>(std::lround(value * half_height));
            cv::line(canvas, cv::Point(x, center - amplitude), cv::Point(x, center + amplitude),
                     cv::Scalar(255, 170, 60));
        }
    }

    std::vector<int> imageWriteParams(const std::string &extension, double quality)
    {
        int percent = std::clamp(static_cast<int>(std::lround(quality * 100.0)), 1, 100);
        if (extension == "jpg" || extension == "jpeg")
        {
            return {cv::IMWRITE_JPEG_QUALITY, percent};
        }
        if (extension == "webp")
        {
            return {cv::IMWRITE_WEBP_QUALITY, percent};
        }
        if (extension == "jp2")
        {
            return {cv::IMWRITE_JPEG2000_COMPRESSION_X1000, percent * 10};
        }
        return {};
    }

    std::vector<std::string> audioFilters(const EncodeOptions &options)
    {
        std::vector<std::string> filters;
        if (options.volume != 1.0)
        {
            filters.push_back("volume=" + formatNumber(options.volume));
        }
        if (options.tempo > 0.0 && options.tempo != 1.0)
        {
            // atempo accepts 0.5..2.0 per stage on older ffmpeg builds
            double tempo = options.tempo;
            while (tempo > 2.0)
            {
                filters.push_back("atempo=2.0");
                tempo /= 2.0;
            }
            while (tempo < 0.5)
            {
                filters.push_back("atempo=0.5");
                tempo /= 0.5;
            }
            filters.push_back("atempo=" + formatNumber(tempo));
        }
        return filters;
    }

    std::string join(const std::vector<std::string> &parts, char separator)
    {
        std::string joined;
        for (const auto &part : parts)
        {
            if (!joined.empty())
            {
                joined += separator;
            }
            joined += part;
        }
        return joined;
    }
}

BackendOptions BackendOptions::fromConfig(const PocoConfigAdapter &config)
{
    BackendOptions options;
    options.ffmpeg_path = config.getFFmpegPath();
    options.render_threads = std::max(1, config.getRenderThreads());
    options.pdf_dpi = std::max(36, config.getPdfDpi());
    return options;
}

FFmpegMediaBackend::FFmpegMediaBackend(BackendOptions options)
    : options_(std::move(options)), ffmpeg_(options_.ffmpeg_path)
{
    Logger::info("Media backend: ffmpeg=" + options_.ffmpeg_path + ", render threads=" +
                 std::to_string(options_.render_threads) + ", pdf dpi=" + std::to_string(options_.pdf_dpi));
}

FFmpegMediaBackend::~FFmpegMediaBackend() = default;

ProbeResult FFmpegMediaBackend::probe(const std::string &path)
{
    auto format = FormatDescriptor::forPath(path);
    if (format && format->category() == MediaCategory::Document)
    {
        return probeDocument(path);
    }
    return probeMedia(path);
}

ProbeResult FFmpegMediaBackend::probeMedia(const std::string &path)
{
    ProbeResult result;
    AVFormatContextRAII format_ctx;

    int ret = avformat_open_input(format_ctx.address(), path.c_str(), nullptr, nullptr);
    if (ret < 0)
    {
        result.reason = "Could not open " + path + ": " + avError(ret);
        return result;
    }
    ret = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (ret < 0)
    {
        result.reason = "Could not find stream information in " + path + ": " + avError(ret);
        return result;
    }

    AVFormatContext *fmt = format_ctx.get();
    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
    {
        result.duration_seconds = static_cast<double>(fmt->duration) / AV_TIME_BASE;
    }

    int video_index = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    int audio_index = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (video_index >= 0)
    {
        AVCodecParameters *params = fmt->streams[video_index]->codecpar;
        result.has_video = true;
        result.width = params->width;
        result.height = params->height;
    }
    result.has_audio = audio_index >= 0;
    result.page_count = 1;
    result.success = true;

    Logger::debug("Probed " + path + ": duration=" + formatNumber(result.duration_seconds) + "s, " +
                  std::to_string(result.width) + "x" + std::to_string(result.height) +
                  (result.has_audio ? ", audio" : "") + (result.has_video ? ", video" : ""));
    return result;
}

ProbeResult FFmpegMediaBackend::probeDocument(const std::string &path)
{
    ProbeResult result;
    std::lock_guard<std::mutex> lock(pdfium_mutex_);
    ensurePdfiumInitialized();

    FPDFDocumentRAII doc(FPDF_LoadDocument(path.c_str(), nullptr));
    if (!doc.get())
    {
        result.reason = "Could not open document " + path + ": " + pdfiumError();
        return result;
    }

    result.page_count = FPDF_GetPageCount(doc.get());
    double width = 0.0;
    double height = 0.0;
    if (result.page_count > 0 && FPDF_GetPageSizeByIndex(doc.get(), 0, &width, &height))
    {
        result.width = static_cast<int>(std::lround(width * options_.pdf_dpi / kPointsPerInch));
        result.height = static_cast<int>(std::lround(height * options_.pdf_dpi / kPointsPerInch));
    }
    result.success = true;
    return result;
}

std::vector<std::string> FFmpegMediaBackend::buildEncodeArguments(const std::string &input, const std::string &output,
                                                                  const FormatDescriptor &target,
                                                                  const EncodeOptions &options)
{
    std::vector<std::string> args;
    if (options.start_seconds)
    {
        args.insert(args.end(), {"-ss", formatNumber(*options.start_seconds)});
    }
    args.insert(args.end(), {"-i", input});

    // Animated GIF clip
    if (target.identifier() == "gif" && options.animation_frame_count > 0 && options.animation_frame_duration > 0.0)
    {
        double clip = options.animation_frame_count * options.animation_frame_duration;
        int width = options.target_width.value_or(kDefaultGifWidth);
        args.insert(args.end(), {"-t", formatNumber(clip), "-vf",
                                 "fps=" + formatNumber(1.0 / options.animation_frame_duration) + ",scale=" +
                                     std::to_string(width) + ":-1:flags=lanczos",
                                 "-loop", "0", "-an", output});
        return args;
    }

    if (options.audio_only || target.category() == MediaCategory::Audio)
    {
        args.push_back("-vn");
        auto filters = audioFilters(options);
        if (!filters.empty())
        {
            args.insert(args.end(), {"-af", join(filters, ',')});
        }
        if (options.audio_bitrate_kbps)
        {
            args.insert(args.end(), {"-b:a", std::to_string(*options.audio_bitrate_kbps) + "k"});
        }
        if (options.preserve_metadata)
        {
            args.insert(args.end(), {"-map_metadata", "0"});
        }
        args.push_back(output);
        return args;
    }

    if (options.target_width && options.target_height)
    {
        std::string size = std::to_string(*options.target_width) + ":" + std::to_string(*options.target_height);
        std::string scale = options.maintain_aspect_ratio
                                ? "scale=" + size + ":force_original_aspect_ratio=decrease,scale=trunc(iw/2)*2:trunc(ih/2)*2"
                                : "scale=" + size;
        args.insert(args.end(), {"-vf", scale});
    }
    if (options.frame_rate)
    {
        args.insert(args.end(), {"-r", std::to_string(*options.frame_rate)});
    }
    if (options.video_bitrate_kbps)
    {
        args.insert(args.end(), {"-b:v", std::to_string(*options.video_bitrate_kbps) + "k"});
    }
    else if (options.reduced_quality)
    {
        args.insert(args.end(), {"-crf", "28"});
    }
    if (!options.preset.empty())
    {
        args.insert(args.end(), {"-preset", options.preset});
    }
    if (options.audio_bitrate_kbps)
    {
        args.insert(args.end(), {"-b:a", std::to_string(*options.audio_bitrate_kbps) + "k"});
    }
    if (options.preserve_metadata)
    {
        args.insert(args.end(), {"-map_metadata", "0"});
    }
    args.insert(args.end(), {"-pix_fmt", "yuv420p", output});
    return args;
}

BackendResult FFmpegMediaBackend::reencode(const std::string &input, const std::string &output,
                                           const FormatDescriptor &target, const EncodeOptions &options,
                                           const ProgressCallback &progress, const CancellationToken &token)
{
    auto source = FormatDescriptor::forPath(input);
    if (target.category() == MediaCategory::Image && source && source->category() == MediaCategory::Image)
    {
        auto result = reencodeImage(input, output, options, token);
        if (result.success && progress)
        {
            progress(1.0);
        }
        return result;
    }

    double expected = 0.0;
    if (options.animation_frame_count > 0 && options.animation_frame_duration > 0.0)
    {
        expected = options.animation_frame_count * options.animation_frame_duration;
    }
    else
    {
        auto info = probeMedia(input);
        if (info.success && info.duration_seconds > 0.0)
        {
            expected = info.duration_seconds / (options.tempo > 0.0 ? options.tempo : 1.0);
        }
    }

    Logger::info("Encoding " + input + " -> " + target.toString() +
                 (options.reduced_quality ? " (reduced quality)" : ""));
    return ffmpeg_.run(buildEncodeArguments(input, output, target, options), expected, progress, token);
}

BackendResult FFmpegMediaBackend::reencodeImage(const std::string &input, const std::string &output,
                                                const EncodeOptions &options, const CancellationToken &token)
{
    try
    {
        cv::Mat image = cv::imread(input, cv::IMREAD_COLOR);
        if (image.empty())
        {
            // Formats without an OpenCV codec (heic) are decoded by ffmpeg first
            RemoveOnExit decoded{output + ".decode.png"};
            auto decode = ffmpeg_.run({"-i", input, "-frames:v", "1", decoded.path}, 0.0, nullptr, token);
            if (!decode.success)
            {
                return BackendResult::failure("Could not decode image " + input + ": " + decode.reason);
            }
            image = cv::imread(decoded.path, cv::IMREAD_COLOR);
            if (image.empty())
            {
                return BackendResult::failure("Could not decode image " + input);
            }
        }

        if (options.target_width && options.target_height)
        {
            cv::Size size(*options.target_width, *options.target_height);
            if (options.maintain_aspect_ratio)
            {
                double scale = std::min(static_cast<double>(size.width) / image.cols,
                                        static_cast<double>(size.height) / image.rows);
                size = cv::Size(std::max(1, static_cast<int>(std::lround(image.cols * scale))),
                                std::max(1, static_cast<int>(std::lround(image.rows * scale))));
            }
            cv::resize(image, image, size, 0, 0, cv::INTER_AREA);
        }

        if (options.enhance)
        {
            // Unsharp mask
            cv::Mat blurred;
            cv::GaussianBlur(image, blurred, cv::Size(0, 0), 3.0);
            cv::addWeighted(image, 1.5, blurred, -0.5, 0, image);
        }

        if (options.adjust_colors)
        {
            cv::Mat hsv;
            cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
            std::vector<cv::Mat> channels;
            cv::split(hsv, channels);
            channels[1].convertTo(channels[1], -1, options.saturation);
            cv::merge(channels, hsv);
            cv::cvtColor(hsv, image, cv::COLOR_HSV2BGR);
            image.convertTo(image, -1, options.contrast, options.brightness * 255.0);
        }

        return writeImage(image, output, options.quality, token);
    }
    catch (const cv::Exception &e)
    {
        return BackendResult::failure("OpenCV error while converting " + input + ": " + e.what());
    }
}

BackendResult FFmpegMediaBackend::writeImage(const cv::Mat &image, const std::string &output, double quality,
                                             const CancellationToken &token)
{
    auto format = FormatDescriptor::forPath(output);
    std::string extension = format ? format->identifier() : "";

    try
    {
        if (extension == "gif")
        {
            RemoveOnExit staged{output + ".png"};
            if (!cv::imwrite(staged.path, image))
            {
                return BackendResult::failure("OpenCV could not write " + staged.path);
            }
            return ffmpeg_.run({"-i", staged.path, "-frames:v", "1", output}, 0.0, nullptr, token);
        }

        if (!cv::imwrite(output, image, imageWriteParams(extension, quality)))
        {
            return BackendResult::failure("OpenCV could not write " + output);
        }
        return BackendResult::ok();
    }
    catch (const cv::Exception &e)
    {
        return BackendResult::failure("OpenCV error while writing " + output + ": " + e.what());
    }
}

RasterResult FFmpegMediaBackend::rasterize(const std::string &document, const PageRange &pages,
                                           const std::vector<std::string> &outputs, const RasterOptions &options,
                                           const CancellationToken &token)
{
    RasterResult result;
    if (pages.count() <= 0 || outputs.size() != static_cast<size_t>(pages.count()))
    {
        result.reason = "Page range and output list do not match";
        return result;
    }

    std::lock_guard<std::mutex> lock(pdfium_mutex_);
    ensurePdfiumInitialized();

    FPDFDocumentRAII doc(FPDF_LoadDocument(document.c_str(), nullptr));
    if (!doc.get())
    {
        result.reason = "Could not open document " + document + ": " + pdfiumError();
        return result;
    }

    int page_count = FPDF_GetPageCount(doc.get());
    if (pages.first < 0 || pages.last >= page_count)
    {
        result.reason = "Pages " + std::to_string(pages.first + 1) + "-" + std::to_string(pages.last + 1) +
                        " outside document of " + std::to_string(page_count) + " pages";
        return result;
    }

    const double scale = (options.dpi > 0 ? options.dpi : options_.pdf_dpi) / kPointsPerInch;
    for (int index = pages.first; index <= pages.last; ++index)
    {
        if (token.isCancelled())
        {
            result.reason = "Rasterization cancelled";
            return result;
        }

        FPDFPageRAII page(FPDF_LoadPage(doc.get(), index));
        if (!page.get())
        {
            result.reason = "Could not load page " + std::to_string(index + 1) + " of " + document;
            return result;
        }

        int width = std::max(1, static_cast<int>(std::lround(FPDF_GetPageWidthF(page.get()) * scale)));
        int height = std::max(1, static_cast<int>(std::lround(FPDF_GetPageHeightF(page.get()) * scale)));
        FPDFBitmapRAII bitmap(FPDFBitmap_Create(width, height, 0));
        if (!bitmap.get())
        {
            result.reason = "Could not allocate " + std::to_string(width) + "x" + std::to_string(height) + " bitmap";
            return result;
        }
        FPDFBitmap_FillRect(bitmap.get(), 0, 0, width, height, 0xFFFFFFFF);
        FPDF_RenderPageBitmap(bitmap.get(), page.get(), 0, 0, width, height, 0, FPDF_ANNOT);

        const std::string &output = outputs[static_cast<size_t>(index - pages.first)];
        BackendResult written;
        try
        {
            cv::Mat bgra(height, width, CV_8UC4, FPDFBitmap_GetBuffer(bitmap.get()),
                         static_cast<size_t>(FPDFBitmap_GetStride(bitmap.get())));
            cv::Mat bgr;
            cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
            written = writeImage(bgr, output, options.quality, token);
        }
        catch (const cv::Exception &e)
        {
            written = BackendResult::failure(std::string("OpenCV error: ") + e.what());
        }
        if (!written.success)
        {
            result.reason = "Could not write page " + std::to_string(index + 1) + ": " + written.reason;
            return result;
        }
        result.outputs.push_back(output);
    }

    result.success = true;
    return result;
}

SampleResult FFmpegMediaBackend::sampleAudio(const std::string &asset, const TimeRange &range, size_t max_points,
                                             const CancellationToken &token)
{
    SampleResult result;
    if (max_points == 0)
    {
        result.reason = "No sample points requested";
        return result;
    }

    AVFormatContextRAII format_ctx;
    int ret = avformat_open_input(format_ctx.address(), asset.c_str(), nullptr, nullptr);
    if (ret < 0)
    {
        result.reason = "Could not open " + asset + ": " + avError(ret);
        return result;
    }
    if ((ret = avformat_find_stream_info(format_ctx.get(), nullptr)) < 0)
    {
        result.reason = "Could not find stream information: " + avError(ret);
        return result;
    }

    AVFormatContext *fmt = format_ctx.get();
    const AVCodec *codec = nullptr;
    int stream_index = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index < 0 || !codec)
    {
        result.reason = "No decodable audio stream in " + asset;
        return result;
    }

    AVCodecContextRAII codec_ctx(avcodec_alloc_context3(codec));
    if (!codec_ctx.get())
    {
        result.reason = "Could not allocate decoder context";
        return result;
    }
    if ((ret = avcodec_parameters_to_context(codec_ctx.get(), fmt->streams[stream_index]->codecpar)) < 0 ||
        (ret = avcodec_open2(codec_ctx.get(), codec, nullptr)) < 0)
    {
        result.reason = "Could not open audio decoder: " + avError(ret);
        return result;
    }

    const int sample_rate = codec_ctx.get()->sample_rate;
    SwrContextRAII swr;
    AVChannelLayout out_layout{};
    av_channel_layout_default(&out_layout, 1);
    AVChannelLayout in_layout{};
    if (codec_ctx.get()->ch_layout.nb_channels <= 0 ||
        av_channel_layout_copy(&in_layout, &codec_ctx.get()->ch_layout) < 0)
    {
        av_channel_layout_default(&in_layout, 2);
    }
    ret = swr_alloc_set_opts2(swr.address(), &out_layout, AV_SAMPLE_FMT_FLT, sample_rate, &in_layout,
                              codec_ctx.get()->sample_fmt, sample_rate, 0, nullptr);
    av_channel_layout_uninit(&in_layout);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || (ret = swr_init(swr.get())) < 0)
    {
        result.reason = "Could not set up resampler: " + avError(ret);
        return result;
    }

    double total_seconds = range.duration_seconds;
    if (total_seconds <= 0.0 && fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
    {
        total_seconds = static_cast<double>(fmt->duration) / AV_TIME_BASE - range.start_seconds;
    }
    if (range.start_seconds > 0.0)
    {
        av_seek_frame(fmt, -1, static_cast<int64_t>(range.start_seconds * AV_TIME_BASE), AVSEEK_FLAG_BACKWARD);
    }

    const uint64_t expected_samples =
        total_seconds > 0.0 ? static_cast<uint64_t>(total_seconds * sample_rate) : static_cast<uint64_t>(max_points);
    const uint64_t bucket_size = std::max<uint64_t>(1, (expected_samples + max_points - 1) / max_points);
    const uint64_t sample_limit = range.duration_seconds > 0.0 ? expected_samples
                                                               : std::numeric_limits<uint64_t>::max();

    std::vector<float> mono;
    float peak = 0.0f;
    uint64_t in_bucket = 0;
    uint64_t consumed = 0;
    result.samples.reserve(max_points);

    auto consume = [&](AVFrame *frame)
    {
        int capacity = swr_get_out_samples(swr.get(), frame->nb_samples);
        if (capacity <= 0)
        {
            return;
        }
        mono.resize(static_cast<size_t>(capacity));
        uint8_t *out_planes[1] = {reinterpret_cast<uint8_t *>(mono.data())};
        int converted = swr_convert(swr.get(), out_planes, capacity,
                                    const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
        for (int i = 0; i < converted && consumed < sample_limit; ++i, ++consumed)
        {
            peak = std::max(peak, std::fabs(mono[static_cast<size_t>(i)]));
            if (++in_bucket == bucket_size)
            {
                result.samples.push_back(std::min(peak, 1.0f));
                peak = 0.0f;
                in_bucket = 0;
            }
        }
    };

    AVPacketRAII packet;
    AVFrameRAII frame;
    while (consumed < sample_limit && av_read_frame(fmt, packet.get()) >= 0)
    {
        if (token.isCancelled())
        {
            av_packet_unref(packet.get());
            result.samples.clear();
            result.reason = "Audio sampling cancelled";
            return result;
        }
        if (packet.get()->stream_index == stream_index && avcodec_send_packet(codec_ctx.get(), packet.get()) >= 0)
        {
            while (avcodec_receive_frame(codec_ctx.get(), frame.get()) >= 0)
            {
                consume(frame.get());
                av_frame_unref(frame.get());
            }
        }
        av_packet_unref(packet.get());
    }

    // Drain the decoder
    if (avcodec_send_packet(codec_ctx.get(), nullptr) >= 0)
    {
        while (consumed < sample_limit && avcodec_receive_frame(codec_ctx.get(), frame.get()) >= 0)
        {
            consume(frame.get());
            av_frame_unref(frame.get());
        }
    }
    if (in_bucket > 0)
    {
        result.samples.push_back(std::min(peak, 1.0f));
    }
    if (result.samples.size() > max_points)
    {
        result.samples.resize(max_points);
    }
    if (result.samples.empty())
    {
        result.reason = "No audio samples decoded from " + asset;
        return result;
    }

    result.sample_rate = sample_rate;
    result.success = true;
    Logger::debug("Sampled " + std::to_string(result.samples.size()) + " envelope points from " + asset);
    return result;
}

BackendResult FFmpegMediaBackend::renderFrames(const FrameSequence &frames, double duration_seconds,
                                               const std::string &output, const ProgressCallback &progress,
                                               const CancellationToken &token)
{
    if (frames.frame_count <= 0 || frames.frame_rate <= 0.0)
    {
        return BackendResult::failure("Frame sequence is empty");
    }
    if (frames.still_images.empty() && frames.waveform_frames.size() < static_cast<size_t>(frames.frame_count))
    {
        return BackendResult::failure("Frame sequence has no source for every frame");
    }

    // Most encoders need even dimensions
    const int width = std::max(2, frames.width & ~1);
    const int height = std::max(2, frames.height & ~1);

    RemoveOnExit intermediate{output + ".frames.avi"};
    try
    {
        std::vector<cv::Mat> stills;
        for (const auto &path : frames.still_images)
        {
            cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
            if (image.empty())
            {
                return BackendResult::failure("Could not decode still image " + path);
            }
            stills.push_back(letterbox(image, width, height));
        }

        cv::VideoWriter writer(intermediate.path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), frames.frame_rate,
                               cv::Size(width, height));
        if (!writer.isOpened())
        {
            return BackendResult::failure("Could not open frame writer for " + intermediate.path);
        }

        tbb::task_arena arena(std::max(1, options_.render_threads));
        const int batch_size = std::max(1, options_.render_threads) * kFramesPerThreadBatch;
        std::vector<cv::Mat> batch(static_cast<size_t>(batch_size));

        for (int start = 0; start < frames.frame_count; start += batch_size)
        {
            if (token.isCancelled())
            {
                return BackendResult::failure("Frame rendering cancelled");
            }

            const int end = std::min(frames.frame_count, start + batch_size);
            arena.execute([&]
                          { tbb::parallel_for(tbb::blocked_range<int>(start, end),
                                              [&](const tbb::blocked_range<int> &range)
                                              {
                                                  for (int i = range.begin(); i < range.end(); ++i)
                                                  {
                                                      cv::Mat &slot = batch[static_cast<size_t>(i - start)];
                                                      if (!stills.empty())
                                                      {
                                                          size_t index = static_cast<size_t>(i) * stills.size() /
                                                                         static_cast<size_t>(frames.frame_count);
                                                          slot = stills[std::min(index, stills.size() - 1)];
                                                      }
                                                      else
                                                      {
                                                          slot.create(height, width, CV_8UC3);
                                                          drawWaveform(slot, frames.waveform_frames[static_cast<size_t>(i)]);
                                                      }
                                                  }
                                              }); });

            for (int i = start; i < end; ++i)
            {
                writer.write(batch[static_cast<size_t>(i - start)]);
            }
            if (progress)
            {
                progress(kRenderShare * end / frames.frame_count);
            }
        }
        writer.release();
    }
    catch (const cv::Exception &e)
    {
        return BackendResult::failure(std::string("OpenCV error while rendering frames: ") + e.what());
    }

    std::vector<std::string> args = {"-i", intermediate.path};
    if (frames.audio_source)
    {
        args.insert(args.end(), {"-i", *frames.audio_source, "-map", "0:v:0", "-map", "1:a:0?", "-shortest"});
    }
    if (duration_seconds > 0.0)
    {
        args.insert(args.end(), {"-t", formatNumber(duration_seconds)});
    }
    if (frames.video_bitrate_kbps)
    {
        args.insert(args.end(), {"-b:v", std::to_string(*frames.video_bitrate_kbps) + "k"});
    }
    args.insert(args.end(), {"-pix_fmt", "yuv420p", output});

    ProgressCallback encode_progress;
    if (progress)
    {
        encode_progress = [progress](double value)
        { progress(kRenderShare + (1.0 - kRenderShare) * value); };
    }
    return ffmpeg_.run(args, duration_seconds, encode_progress, token);
}

BackendResult FFmpegMediaBackend::renderWaveformImage(const std::vector<float> &samples, int width, int height,
                                                      const std::string &output, double quality)
{
    if (width <= 0 || height <= 0)
    {
        return BackendResult::failure("Invalid waveform size " + std::to_string(width) + "x" + std::to_string(height));
    }
    cv::Mat canvas(height, width, CV_8UC3);
    drawWaveform(canvas, samples);
    return writeImage(canvas, output, quality, CancellationToken());
}

BackendResult FFmpegMediaBackend::extractFrame(const std::string &video, double time_seconds,
                                               const std::string &output, double quality,
                                               const CancellationToken &token)
{
    if (token.isCancelled())
    {
        return BackendResult::failure("Frame extraction cancelled");
    }
    try
    {
        cv::VideoCapture capture(video);
        if (!capture.isOpened())
        {
            return BackendResult::failure("Could not open video " + video);
        }
        capture.set(cv::CAP_PROP_POS_MSEC, std::max(0.0, time_seconds) * 1000.0);
        cv::Mat frame;
        if (!capture.read(frame) || frame.empty())
        {
            return BackendResult::failure("No frame at " + formatNumber(time_seconds) + "s in " + video);
        }
        return writeImage(frame, output, quality, token);
    }
    catch (const cv::Exception &e)
    {
        return BackendResult::failure("OpenCV error while grabbing frame from " + video + ": " + e.what());
    }
}

BackendResult FFmpegMediaBackend::composeDocument(const std::vector<std::string> &images, const std::string &output)
{
    if (images.empty())
    {
        return BackendResult::failure("No images to compose");
    }

    std::lock_guard<std::mutex> lock(pdfium_mutex_);
    ensurePdfiumInitialized();

    FPDFDocumentRAII doc(FPDF_CreateNewDocument());
    if (!doc.get())
    {
        return BackendResult::failure("Could not create PDF document");
    }

    for (size_t i = 0; i < images.size(); ++i)
    {
        cv::Mat bgra;
        try
        {
            cv::Mat image = cv::imread(images[i], cv::IMREAD_COLOR);
            if (image.empty())
            {
                return BackendResult::failure("Could not decode image " + images[i]);
            }
            cv::cvtColor(image, bgra, cv::COLOR_BGR2BGRA);
        }
        catch (const cv::Exception &e)
        {
            return BackendResult::failure("OpenCV error while reading " + images[i] + ": " + e.what());
        }

        // One pixel per point
        const double page_width = bgra.cols;
        const double page_height = bgra.rows;
        FPDFPageRAII page(FPDFPage_New(doc.get(), static_cast<int>(i), page_width, page_height));
        if (!page.get())
        {
            return BackendResult::failure("Could not add page " + std::to_string(i + 1));
        }

        FPDFBitmapRAII bitmap(FPDFBitmap_CreateEx(bgra.cols, bgra.rows, FPDFBitmap_BGRA, bgra.data,
                                                  static_cast<int>(bgra.step)));
        FPDF_PAGEOBJECT image_object = FPDFPageObj_NewImageObj(doc.get());
        FPDF_PAGE targets[] = {page.get()};
        if (!bitmap.get() || !image_object || !FPDFImageObj_SetBitmap(targets, 1, image_object, bitmap.get()))
        {
            if (image_object)
            {
                FPDFPageObj_Destroy(image_object);
            }
            return BackendResult::failure("Could not embed " + images[i]);
        }
        FPDFImageObj_SetMatrix(image_object, page_width, 0, 0, page_height, 0, 0);
        FPDFPage_InsertObject(page.get(), image_object);
        if (!FPDFPage_GenerateContent(page.get()))
        {
            return BackendResult::failure("Could not generate content for page " + std::to_string(i + 1));
        }
    }

    std::ofstream stream(output, std::ios::binary | std::ios::trunc);
    if (!stream)
    {
        return BackendResult::failure("Could not open " + output + " for writing");
    }
    PdfFileWriter writer;
    writer.version = 1;
    writer.WriteBlock = &PdfFileWriter::writeBlock;
    writer.stream = &stream;
    if (!FPDF_SaveAsCopy(doc.get(), &writer, 0))
    {
        return BackendResult::failure("PDFium could not save " + output);
    }
    stream.close();
    if (!stream)
    {
        return BackendResult::failure("Write error on " + output);
    }
    return BackendResult::ok();
}
