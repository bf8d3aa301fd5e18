// Created by block on 2026-10-19.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vizcast {

	/// Where to find the external media engine. Bare names are looked up on PATH.
	struct MediaEngine {
		std::string ffmpeg = "ffmpeg";
		std::string ffprobe = "ffprobe";
	};

	class MediaProbe {
	public:
		enum class StreamType : std::uint8_t {
			Video,
			Audio,
			Other
		};

		struct StreamInfo {
			StreamType type;
			std::string codec;
			bool attached_picture;
		};

		struct MediaInfo {
			std::vector<StreamInfo> streams;
			double duration_seconds;

			// counts attached pictures as video too
			int CountStreams(StreamType type) const;
		};

		/// Container duration in seconds via ffprobe, nullopt if it didn't report a number.
		static std::optional<double> ProbeDuration(const MediaEngine& engine, const std::filesystem::path& file);

		/// Codec name of the first stream matched by an ffprobe selector (eg. "v:0"), nullopt if none.
		static std::optional<std::string> ProbeVideoCodec(const MediaEngine& engine, const std::filesystem::path& file, std::string_view selector);

		/// Full stream/format listing, read in-process with libavformat.
		static std::optional<MediaInfo> InspectMedia(const std::filesystem::path& file);

		/// Quiet libav's own logging unless we're verbose.
		static void SetLibavVerbose(bool verbose);

		static std::string AVErrorToString(int errnum);
	};

} // namespace vizcast
