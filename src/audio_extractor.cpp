#include "speechtext/audio_extractor.h"
#include <iostream>

extern "C" {
    #include <libavformat/avformat.h>
    #include <libavcodec/avcodec.h>
    #include <libavutil/avutil.h>
    #include <libavutil/channel_layout.h>
    #include <libavutil/opt.h>
    #include <libswresample/swresample.h>
}

namespace speechtext {

// =======================
// AudioExtractor::Impl
// =======================

class AudioExtractor::Impl {
public:
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int stream_index = -1;

    std::string current_file;
    bool is_open = false;

    Impl() {
        packet = av_packet_alloc();
        frame = av_frame_alloc();
    }

    ~Impl() {
        release();
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
    }

    void release() {
        if (swr_ctx) swr_free(&swr_ctx);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) avformat_close_input(&format_ctx);
        stream_index = -1;
        is_open = false;
        current_file.clear();
    }

    // Returns an error message, empty on success
    std::string open_stream(const std::string& file_path) {
        if (!packet || !frame) {
            return "Failed to allocate packet/frame";
        }

        if (avformat_open_input(&format_ctx, file_path.c_str(), nullptr, nullptr) < 0) {
            return "Cannot open file: " + file_path;
        }

        if (avformat_find_stream_info(format_ctx, nullptr) < 0) {
            return "Cannot find stream info";
        }

        stream_index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (stream_index < 0) {
            return "No audio stream found in file";
        }

        AVCodecParameters* codecpar = format_ctx->streams[stream_index]->codecpar;
        const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
        if (!codec) {
            return "Unsupported audio codec";
        }

        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            return "Cannot allocate codec context";
        }

        if (avcodec_parameters_to_context(codec_ctx, codecpar) < 0) {
            return "Cannot copy codec parameters";
        }

        codec_ctx->thread_count = 0;  // 0 = let FFmpeg pick

        if (avcodec_open2(codec_ctx, codec, nullptr) < 0) {
            return "Cannot open codec";
        }

        // Some containers leave the layout unspecified
        AVChannelLayout in_layout{};
        if (codec_ctx->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC && codec_ctx->ch_layout.nb_channels > 0) {
            av_channel_layout_copy(&in_layout, &codec_ctx->ch_layout);
        } else {
            int channels = codecpar->ch_layout.nb_channels > 0 ? codecpar->ch_layout.nb_channels : 1;
            av_channel_layout_default(&in_layout, channels);
        }

        AVChannelLayout mono_layout = AV_CHANNEL_LAYOUT_MONO;
        int rc = swr_alloc_set_opts2(&swr_ctx,
                                     &mono_layout, AV_SAMPLE_FMT_FLT, WHISPER_SAMPLE_RATE,
                                     &in_layout, codec_ctx->sample_fmt, codec_ctx->sample_rate,
                                     0, nullptr);
        av_channel_layout_uninit(&in_layout);

        if (rc < 0 || !swr_ctx || swr_init(swr_ctx) < 0) {
            return "Cannot initialize resampler";
        }

        current_file = file_path;
        is_open = true;
        return "";
    }

    void append_converted(const AVFrame* decoded, std::vector<float>& samples) {
        int64_t delay = swr_get_delay(swr_ctx, codec_ctx->sample_rate);
        int out_capacity = static_cast<int>(av_rescale_rnd(
            delay + decoded->nb_samples, WHISPER_SAMPLE_RATE, codec_ctx->sample_rate, AV_ROUND_UP));
        if (out_capacity <= 0) return;

        size_t offset = samples.size();
        samples.resize(offset + out_capacity);
        uint8_t* out = reinterpret_cast<uint8_t*>(samples.data() + offset);

        int converted = swr_convert(swr_ctx, &out, out_capacity,
                                    const_cast<const uint8_t**>(decoded->extended_data),
                                    decoded->nb_samples);
        samples.resize(offset + (converted > 0 ? converted : 0));
    }

    void drain_decoder(std::vector<float>& samples) {
        while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
            append_converted(frame, samples);
            av_frame_unref(frame);
        }
    }

    void decode_all(std::vector<float>& samples) {
        samples.clear();

        while (av_read_frame(format_ctx, packet) >= 0) {
            if (packet->stream_index == stream_index &&
                avcodec_send_packet(codec_ctx, packet) >= 0) {
                drain_decoder(samples);
            }
            av_packet_unref(packet);
        }

        // Flush decoder
        avcodec_send_packet(codec_ctx, nullptr);
        drain_decoder(samples);

        // Flush resampler
        int64_t pending = swr_get_delay(swr_ctx, WHISPER_SAMPLE_RATE);
        if (pending > 0) {
            size_t offset = samples.size();
            samples.resize(offset + pending);
            uint8_t* out = reinterpret_cast<uint8_t*>(samples.data() + offset);
            int converted = swr_convert(swr_ctx, &out, static_cast<int>(pending), nullptr, 0);
            samples.resize(offset + (converted > 0 ? converted : 0));
        }
    }
};

AudioExtractor::AudioExtractor()
    : pimpl_(std::make_unique<Impl>())
{
}

AudioExtractor::~AudioExtractor() = default;

bool AudioExtractor::open(const std::string& file_path)
{
    last_error_.clear();
    pimpl_->release();

    std::string error = pimpl_->open_stream(file_path);
    if (!error.empty()) {
        last_error_ = error;
        std::cerr << "[Audio] " << last_error_ << "\n";
        pimpl_->release();
        return false;
    }

    std::cout << "[Audio] Opened " << file_path << " (" << pimpl_->codec_ctx->sample_rate << "Hz, "
              << pimpl_->codec_ctx->ch_layout.nb_channels << " channel(s), duration: "
              << get_duration() << "s)\n";
    return true;
}

void AudioExtractor::close()
{
    pimpl_->release();
}

float AudioExtractor::get_duration() const
{
    if (!pimpl_->is_open || pimpl_->format_ctx->duration == AV_NOPTS_VALUE) return 0.0f;
    return static_cast<float>(pimpl_->format_ctx->duration) / AV_TIME_BASE;
}

bool AudioExtractor::extract(std::vector<float>& samples)
{
    last_error_.clear();

    if (!pimpl_->is_open) {
        last_error_ = "No file is open";
        return false;
    }

    pimpl_->decode_all(samples);

    if (samples.empty()) {
        last_error_ = "No audio decoded from " + pimpl_->current_file;
        std::cerr << "[Audio] " << last_error_ << "\n";
        return false;
    }

    std::cout << "[Audio] Decoded " << samples.size() << " samples ("
              << (samples.size() / static_cast<float>(WHISPER_SAMPLE_RATE)) << "s at 16kHz)\n";
    return true;
}

bool AudioExtractor::extract_audio(const std::string& file_path,
                                   std::vector<float>& samples,
                                   float& duration)
{
    if (!open(file_path)) {
        return false;
    }

    duration = get_duration();
    bool ok = extract(samples);
    close();

    if (ok && duration <= 0.0f) {
        duration = samples.size() / static_cast<float>(WHISPER_SAMPLE_RATE);
    }
    return ok;
}

} // namespace speechtext
