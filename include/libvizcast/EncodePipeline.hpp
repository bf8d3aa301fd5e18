// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/MediaProbe.hpp>
#include <libvizcast/Visualization.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vizcast {

	/// Everything needed to render one audio file.
	struct ResolvedJob {
		std::filesystem::path audio_path;
		std::filesystem::path output_path;
		std::optional<std::filesystem::path> image_path {};
		VisualizationRequest visualization {};
		std::optional<double> target_duration {};
		bool verbose = false;
		bool cover_from_audio = false;
		std::optional<std::filesystem::path> cover_out {};
		MediaEngine engine {};
	};

	struct OutputArtifact {
		std::filesystem::path video;
		std::filesystem::path thumbnail;
		std::uintmax_t size;
	};

	/// Renders a job in two engine passes: the visualization composite into a scratch file,
	/// then a remux of that video with the original audio into the final output.
	class EncodePipeline {
	public:
		/// Throws vizcast::Error on any failure; scratch files are cleaned up either way.
		static OutputArtifact Produce(const ResolvedJob& job);

		static std::vector<std::string> BuildCompositeCommand(const MediaEngine& engine, const std::filesystem::path& image, const std::filesystem::path& audio,
															  const std::string& graph, double seconds, const std::filesystem::path& output);

		static std::vector<std::string> BuildRemuxCommand(const MediaEngine& engine, const std::filesystem::path& video, const std::filesystem::path& audio,
														  const std::filesystem::path& output);

		/// Where the thumbnail for a job goes: next to the video, named after the audio.
		/// PNG only when the background already is one, JPEG otherwise.
		static std::filesystem::path ThumbnailPath(const std::filesystem::path& background, const std::filesystem::path& audio, const std::filesystem::path& video);

		/// Copies or re-encodes the background into the thumbnail slot. Returns the thumbnail path.
		static std::filesystem::path WriteThumbnail(const std::filesystem::path& background, const std::filesystem::path& audio, const std::filesystem::path& video);
	};

} // namespace vizcast
