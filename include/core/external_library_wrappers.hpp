#pragma once
#include <functional>
#include <memory>
extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
}
#include <fpdfview.h>

// RAII wrapper for FFmpeg AVFormatContext (input side)
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;
    std::function<void(AVFormatContext **)> cleanup_func_;

public:
    AVFormatContextRAII() : ctx_(nullptr), cleanup_func_(avformat_close_input) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            cleanup_func_(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept
        : ctx_(other.ctx_), cleanup_func_(other.cleanup_func_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    explicit AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    // Allow move
    AVCodecContextRAII(AVCodecContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}

    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

    // Allow move
    AVFrameRAII(AVFrameRAII &&other) noexcept : frame_(other.frame_)
    {
        other.frame_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}

    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

    // Allow move
    AVPacketRAII(AVPacketRAII &&other) noexcept : packet_(other.packet_)
    {
        other.packet_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwrContext
class SwrContextRAII
{
private:
    SwrContext *ctx_;

public:
    SwrContextRAII() : ctx_(nullptr) {}
    ~SwrContextRAII()
    {
        if (ctx_)
            swr_free(&ctx_);
    }

    SwrContext *get() { return ctx_; }
    SwrContext **address() { return &ctx_; }

    // Disable copy
    SwrContextRAII(const SwrContextRAII &) = delete;
    SwrContextRAII &operator=(const SwrContextRAII &) = delete;

    // Allow move
    SwrContextRAII(SwrContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a PDFium document handle
class FPDFDocumentRAII
{
private:
    FPDF_DOCUMENT doc_;

public:
    FPDFDocumentRAII() : doc_(nullptr) {}
    explicit FPDFDocumentRAII(FPDF_DOCUMENT doc) : doc_(doc) {}
    ~FPDFDocumentRAII()
    {
        if (doc_)
            FPDF_CloseDocument(doc_);
    }

    FPDF_DOCUMENT get() { return doc_; }

    // Disable copy
    FPDFDocumentRAII(const FPDFDocumentRAII &) = delete;
    FPDFDocumentRAII &operator=(const FPDFDocumentRAII &) = delete;

    // Allow move
    FPDFDocumentRAII(FPDFDocumentRAII &&other) noexcept : doc_(other.doc_)
    {
        other.doc_ = nullptr;
    }
};

// RAII wrapper for a PDFium page handle
class FPDFPageRAII
{
private:
    FPDF_PAGE page_;

public:
    explicit FPDFPageRAII(FPDF_PAGE page) : page_(page) {}
    ~FPDFPageRAII()
    {
        if (page_)
            FPDF_ClosePage(page_);
    }

    FPDF_PAGE get() { return page_; }

    // Disable copy
    FPDFPageRAII(const FPDFPageRAII &) = delete;
    FPDFPageRAII &operator=(const FPDFPageRAII &) = delete;
};

// RAII wrapper for a PDFium bitmap
class FPDFBitmapRAII
{
private:
    FPDF_BITMAP bitmap_;

public:
    explicit FPDFBitmapRAII(FPDF_BITMAP bitmap) : bitmap_(bitmap) {}
    ~FPDFBitmapRAII()
    {
        if (bitmap_)
            FPDFBitmap_Destroy(bitmap_);
    }

    FPDF_BITMAP get() { return bitmap_; }

    // Disable copy
    FPDFBitmapRAII(const FPDFBitmapRAII &) = delete;
    FPDFBitmapRAII &operator=(const FPDFBitmapRAII &) = delete;
};
