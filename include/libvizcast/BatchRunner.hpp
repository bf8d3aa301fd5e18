// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/EncodePipeline.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace vizcast {

	/// Options shared by every job in a batch.
	struct SharedOptions {
		std::optional<std::filesystem::path> image_path {};
		VisualizationRequest visualization {};
		std::optional<double> target_duration {};
		bool verbose = false;
		bool cover_from_audio = false;
		std::optional<std::filesystem::path> cover_out {}; // single input only
		MediaEngine engine {};
	};

	class BatchRunner {
	public:
		/// "<dir>/<name>.mp4", either beside the input or under out_dir (created if needed).
		static std::filesystem::path DeriveOutputPath(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& out_dir);

		static ResolvedJob MakeJob(const std::filesystem::path& audio, const SharedOptions& shared, const std::optional<std::filesystem::path>& out_dir);

		/// Renders the inputs in order. The first failure propagates and the rest are skipped;
		/// outputs already written stay where they are.
		static std::vector<OutputArtifact> RunAll(const std::vector<std::filesystem::path>& inputs, const SharedOptions& shared, const std::optional<std::filesystem::path>& out_dir);
	};

} // namespace vizcast
