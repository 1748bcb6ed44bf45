#include "encode/EncoderFFmpeg.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <memory>
#include <string>

namespace snarp {

namespace {

std::string avErrorString(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

}  // namespace

class EncoderFFmpeg final : public IFrameEncoder {
public:
    explicit EncoderFFmpeg(LogSink& log) : log_(log) {}

    ~EncoderFFmpeg() override {
        close();
    }

    bool open(const std::string& path, int width, int height, int fps,
              std::string& err) override {
        if (formatCtx_) {
            err = "encoder already open";
            return false;
        }
        if (width <= 0 || height <= 0 || (width % 2) != 0 ||
            (height % 2) != 0) {
            err = "unsupported frame size " + std::to_string(width) + "x" +
                  std::to_string(height) + " (must be positive and even)";
            return false;
        }
        if (fps <= 0) {
            err = "frame rate must be positive";
            return false;
        }

        if (!openStreams(path, width, height, fps, err)) {
            release();
            return false;
        }
        width_ = width;
        height_ = height;
        path_ = path;
        LOG_DEBUG(log_, "ffmpeg: opened %s (%dx%d @ %d fps)", path.c_str(),
                  width, height, fps);
        return true;
    }

    bool writeFrame(const Image& frame, std::string& err) override {
        if (!formatCtx_ || !headerWritten_) {
            err = "encoder is not open";
            return false;
        }
        if (frame.w != width_ || frame.h != height_ ||
            frame.pixels.size() < frame.expectedSize()) {
            err = "frame size " + std::to_string(frame.w) + "x" +
                  std::to_string(frame.h) + " does not match stream " +
                  std::to_string(width_) + "x" + std::to_string(height_);
            return false;
        }
        if (frame.order != PixelOrder::BGR) {
            err = "frame is not in BGR order";
            return false;
        }

        int ret = av_frame_make_writable(frame_);
        if (ret < 0) {
            err = "av_frame_make_writable: " + avErrorString(ret);
            return false;
        }

        const std::uint8_t* srcData[4] = {frame.pixels.data(), nullptr,
                                          nullptr, nullptr};
        const int srcStride[4] = {frame.w * 3, 0, 0, 0};
        sws_scale(sws_, srcData, srcStride, 0, frame.h, frame_->data,
                  frame_->linesize);
        frame_->pts = nextPts_++;

        if (!encode(frame_, err)) {
            return false;
        }
        ++framesWritten_;
        return true;
    }

    void close() override {
        if (!formatCtx_) {
            release();
            return;
        }
        if (headerWritten_) {
            std::string err;
            if (!encode(nullptr, err)) {
                LOG_WARN(log_, "ffmpeg: flush failed: %s", err.c_str());
            }
            int ret = av_write_trailer(formatCtx_);
            if (ret < 0) {
                LOG_ERROR(log_, "ffmpeg: av_write_trailer: %s",
                          avErrorString(ret).c_str());
            }
            LOG_DEBUG(log_, "ffmpeg: finalized %s (%llu frames)",
                      path_.c_str(),
                      static_cast<unsigned long long>(framesWritten_));
        }
        release();
    }

    PixelOrder inputOrder() const override {
        return PixelOrder::BGR;
    }

    std::uint64_t framesWritten() const override {
        return framesWritten_;
    }

private:
    bool openStreams(const std::string& path, int width, int height, int fps,
                     std::string& err) {
        int ret = avformat_alloc_output_context2(&formatCtx_, nullptr, "mp4",
                                                 path.c_str());
        if (ret < 0 || !formatCtx_) {
            err = "avformat_alloc_output_context2: " + avErrorString(ret);
            return false;
        }

        const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
        if (!codec) {
            err = "MPEG-4 encoder not available in this FFmpeg build";
            return false;
        }

        stream_ = avformat_new_stream(formatCtx_, nullptr);
        if (!stream_) {
            err = "avformat_new_stream failed";
            return false;
        }

        codecCtx_ = avcodec_alloc_context3(codec);
        if (!codecCtx_) {
            err = "avcodec_alloc_context3 failed";
            return false;
        }
        codecCtx_->codec_id = AV_CODEC_ID_MPEG4;
        codecCtx_->width = width;
        codecCtx_->height = height;
        codecCtx_->time_base = AVRational{1, fps};
        codecCtx_->framerate = AVRational{fps, 1};
        codecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
        codecCtx_->gop_size = fps;
        codecCtx_->bit_rate =
            static_cast<int64_t>(width) * height * fps / 4;
        if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        ret = avcodec_open2(codecCtx_, codec, nullptr);
        if (ret < 0) {
            err = "avcodec_open2: " + avErrorString(ret);
            return false;
        }
        ret = avcodec_parameters_from_context(stream_->codecpar, codecCtx_);
        if (ret < 0) {
            err = "avcodec_parameters_from_context: " + avErrorString(ret);
            return false;
        }
        stream_->time_base = codecCtx_->time_base;

        frame_ = av_frame_alloc();
        packet_ = av_packet_alloc();
        if (!frame_ || !packet_) {
            err = "failed to allocate frame or packet";
            return false;
        }
        frame_->format = codecCtx_->pix_fmt;
        frame_->width = width;
        frame_->height = height;
        ret = av_frame_get_buffer(frame_, 0);
        if (ret < 0) {
            err = "av_frame_get_buffer: " + avErrorString(ret);
            return false;
        }

        sws_ = sws_getContext(width, height, AV_PIX_FMT_BGR24, width, height,
                              AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr,
                              nullptr, nullptr);
        if (!sws_) {
            err = "sws_getContext failed";
            return false;
        }

        if (!(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
            ret = avio_open(&formatCtx_->pb, path.c_str(), AVIO_FLAG_WRITE);
            if (ret < 0) {
                err = "cannot open " + path + ": " + avErrorString(ret);
                return false;
            }
        }

        ret = avformat_write_header(formatCtx_, nullptr);
        if (ret < 0) {
            err = "avformat_write_header: " + avErrorString(ret);
            return false;
        }
        headerWritten_ = true;
        return true;
    }

    // Sends one frame (or nullptr to flush) and drains every packet the
    // encoder has ready.
    bool encode(AVFrame* frame, std::string& err) {
        int ret = avcodec_send_frame(codecCtx_, frame);
        if (ret < 0) {
            err = "avcodec_send_frame: " + avErrorString(ret);
            return false;
        }
        for (;;) {
            ret = avcodec_receive_packet(codecCtx_, packet_);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                return true;
            }
            if (ret < 0) {
                err = "avcodec_receive_packet: " + avErrorString(ret);
                return false;
            }
            av_packet_rescale_ts(packet_, codecCtx_->time_base,
                                 stream_->time_base);
            packet_->stream_index = stream_->index;
            ret = av_interleaved_write_frame(formatCtx_, packet_);
            av_packet_unref(packet_);
            if (ret < 0) {
                err = "av_interleaved_write_frame: " + avErrorString(ret);
                return false;
            }
        }
    }

    void release() {
        if (sws_) {
            sws_freeContext(sws_);
            sws_ = nullptr;
        }
        if (frame_) {
            av_frame_free(&frame_);
        }
        if (packet_) {
            av_packet_free(&packet_);
        }
        if (codecCtx_) {
            avcodec_free_context(&codecCtx_);
        }
        if (formatCtx_) {
            if (formatCtx_->pb &&
                !(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
                avio_closep(&formatCtx_->pb);
            }
            avformat_free_context(formatCtx_);
            formatCtx_ = nullptr;
        }
        stream_ = nullptr;
        headerWritten_ = false;
    }

    LogSink& log_;
    AVFormatContext* formatCtx_ = nullptr;
    AVCodecContext* codecCtx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* packet_ = nullptr;
    SwsContext* sws_ = nullptr;
    bool headerWritten_ = false;
    int width_ = 0;
    int height_ = 0;
    int64_t nextPts_ = 0;
    std::uint64_t framesWritten_ = 0;
    std::string path_;
};

std::unique_ptr<IFrameEncoder> CreateEncoderFFmpeg(LogSink& log) {
    return std::make_unique<EncoderFFmpeg>(log);
}

}  // namespace snarp
