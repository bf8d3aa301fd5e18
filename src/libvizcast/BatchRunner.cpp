// Created by block on 2026-10-19.

#include <libvizcast/BatchRunner.hpp>
#include <libvizcast/Error.hpp>

#include <shared/Logger.hpp>

#include <format>

namespace vizcast {

	std::filesystem::path BatchRunner::DeriveOutputPath(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& out_dir) {
		std::filesystem::path out = audio;
		out.replace_extension("mp4");

		if (!out_dir)
			return out;

		std::error_code ec;
		std::filesystem::create_directories(*out_dir, ec);
		if (ec)
			throw Error(ErrorKind::OutputValidationFailed, std::format("Couldn't create output directory {}: {}", out_dir->string(), ec.message()));

		return *out_dir / out.filename();
	}

	ResolvedJob BatchRunner::MakeJob(const std::filesystem::path& audio, const SharedOptions& shared, const std::optional<std::filesystem::path>& out_dir) {
		return {
			.audio_path = audio,
			.output_path = DeriveOutputPath(audio, out_dir),
			.image_path = shared.image_path,
			.visualization = shared.visualization,
			.target_duration = shared.target_duration,
			.verbose = shared.verbose,
			.cover_from_audio = shared.cover_from_audio,
			.cover_out = shared.cover_out,
			.engine = shared.engine
		};
	}

	std::vector<OutputArtifact> BatchRunner::RunAll(const std::vector<std::filesystem::path>& inputs, const SharedOptions& shared, const std::optional<std::filesystem::path>& out_dir) {
		std::vector<OutputArtifact> outputs;
		outputs.reserve(inputs.size());

		for (const std::filesystem::path& audio : inputs) {
			LogInfo("Processing: {}", audio.string());
			outputs.push_back(EncodePipeline::Produce(MakeJob(audio, shared, out_dir)));
		}

		return outputs;
	}

} // namespace vizcast
