#pragma once
#include <functional>
#include <string>
extern "C"
{
#include <libavformat/avformat.h>
}

// RAII wrapper for FFmpeg AVFormatContext opened with avformat_open_input
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

// Human-readable text for an FFmpeg error code
inline std::string ffmpegErrorString(int error_code)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf);
}
