#include "AudioProbe.hpp"
#include <algorithm>
#include <memory>
#include "core/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

namespace babel {

namespace {
std::string avError(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

std::string tag(AVDictionary* dict, const char* key) {
    if (auto* entry = av_dict_get(dict, key, nullptr, AV_DICT_IGNORE_SUFFIX))
        return entry->value;
    return {};
}

struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};
} // namespace

Result<AudioInfo> AudioProbe::probe(const std::filesystem::path& path) {
    AVFormatContext* raw = nullptr;
    if (int ret = avformat_open_input(&raw, path.string().c_str(), nullptr, nullptr);
        ret < 0) {
        return Result<AudioInfo>::err("Could not open " + path.string() + ": " +
                                      avError(ret));
    }
    std::unique_ptr<AVFormatContext, FormatContextCloser> formatCtx(raw);

    if (int ret = avformat_find_stream_info(formatCtx.get(), nullptr); ret < 0) {
        return Result<AudioInfo>::err("Could not find stream info: " +
                                      avError(ret));
    }

    int streamIndex = av_find_best_stream(
            formatCtx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        return Result<AudioInfo>::err("No audio stream found in " +
                                      path.string());
    }

    AVStream* stream = formatCtx->streams[streamIndex];
    AVCodecParameters* params = stream->codecpar;

    AudioInfo info;
    if (const AVCodecDescriptor* desc = avcodec_descriptor_get(params->codec_id))
        info.codec = desc->name;
    info.sampleRate = static_cast<u32>(std::max(params->sample_rate, 0));
    info.channels = static_cast<u32>(std::max(params->ch_layout.nb_channels, 0));

    if (formatCtx->duration != AV_NOPTS_VALUE && formatCtx->duration > 0) {
        info.duration = Duration(av_rescale(formatCtx->duration, 1000, AV_TIME_BASE));
    } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        info.duration = Duration(av_rescale_q(
                stream->duration, stream->time_base, AVRational{1, 1000}));
    }

    info.title = tag(formatCtx->metadata, "title");
    info.artist = tag(formatCtx->metadata, "artist");

    LOG_DEBUG("Probed {}: codec={}, rate={}, channels={}, duration={}ms",
              path.filename().string(),
              info.codec,
              info.sampleRate,
              info.channels,
              info.duration ? info.duration->count() : -1);

    return Result<AudioInfo>::ok(std::move(info));
}

} // namespace babel
