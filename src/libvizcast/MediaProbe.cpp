// Created by block on 2026-10-19.

#include <libvizcast/MediaProbe.hpp>
#include <libvizcast/Subprocess.hpp>

#include <shared/Logger.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace vizcast {

	namespace {

		std::string FirstLine(const std::string& text) {
			std::size_t start = text.find_first_not_of(" \t\r\n");
			if (start == std::string::npos)
				return {};

			std::size_t end = text.find_first_of("\r\n", start);
			std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);

			while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
				line.pop_back();

			return line;
		}

	} // namespace

	int MediaProbe::MediaInfo::CountStreams(StreamType type) const {
		return static_cast<int>(std::ranges::count_if(streams, [type](const StreamInfo& s) { return s.type == type; }));
	}

	std::optional<double> MediaProbe::ProbeDuration(const MediaEngine& engine, const std::filesystem::path& file) {
		Subprocess::Result res = Subprocess::Capture({
			engine.ffprobe,
			"-v", "error",
			"-show_entries", "format=duration",
			"-of", "default=noprint_wrappers=1:nokey=1",
			file.string()
		});

		if (!res.Succeeded()) {
			LogDebug("ffprobe exited with {} while reading duration of {}", res.exit_code, file.string());
			return std::nullopt;
		}

		std::string line = FirstLine(res.output);

		double seconds = 0.0;
		auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), seconds);
		if (line.empty() || ec != std::errc {} || ptr != line.data() + line.size() || !std::isfinite(seconds)) {
			LogDebug("Couldn't parse duration \"{}\" for {}", line, file.string());
			return std::nullopt;
		}

		return seconds;
	}

	std::optional<std::string> MediaProbe::ProbeVideoCodec(const MediaEngine& engine, const std::filesystem::path& file, std::string_view selector) {
		Subprocess::Result res = Subprocess::Capture({
			engine.ffprobe,
			"-v", "error",
			"-select_streams", std::string(selector),
			"-show_entries", "stream=codec_name",
			"-of", "default=noprint_wrappers=1:nokey=1",
			file.string()
		});

		// an unknown selector is an ffprobe error, which is the same as "nothing there"
		std::string codec = FirstLine(res.output);
		if (codec.empty())
			return std::nullopt;

		return codec;
	}

	std::optional<MediaProbe::MediaInfo> MediaProbe::InspectMedia(const std::filesystem::path& file) {
		AVFormatContext* fmt_ctx = nullptr;

		int ret = avformat_open_input(&fmt_ctx, file.c_str(), nullptr, nullptr);
		if (ret < 0) {
			LogDebug("Could not open {}: {}", file.string(), AVErrorToString(ret));
			return std::nullopt;
		}

		ret = avformat_find_stream_info(fmt_ctx, nullptr);
		if (ret < 0) {
			LogDebug("Could not find stream information for {}: {}", file.string(), AVErrorToString(ret));
			avformat_close_input(&fmt_ctx);
			return std::nullopt;
		}

		MediaInfo info {};
		info.duration_seconds = fmt_ctx->duration > 0 ? static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE : 0.0;

		for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
			const AVStream* st = fmt_ctx->streams[i];

			StreamType type = StreamType::Other;
			if (st->codecpar->codec_type == AVMEDIA_TYPE_VIDEO)
				type = StreamType::Video;
			else if (st->codecpar->codec_type == AVMEDIA_TYPE_AUDIO)
				type = StreamType::Audio;

			info.streams.push_back({
				.type = type,
				.codec = avcodec_get_name(st->codecpar->codec_id),
				.attached_picture = (st->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0
			});
		}

		avformat_close_input(&fmt_ctx);
		return info;
	}

	void MediaProbe::SetLibavVerbose(bool verbose) {
		av_log_set_level(verbose ? AV_LOG_INFO : AV_LOG_QUIET);
	}

	std::string MediaProbe::AVErrorToString(int errnum) {
		char buf[AV_ERROR_MAX_STRING_SIZE] {};
		if (av_strerror(errnum, buf, sizeof(buf)) < 0)
			return "unknown error " + std::to_string(errnum);
		return buf;
	}

} // namespace vizcast
