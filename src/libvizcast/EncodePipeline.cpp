// Created by block on 2026-10-19.

#include <libvizcast/CoverResolver.hpp>
#include <libvizcast/EncodePipeline.hpp>
#include <libvizcast/EngineRunner.hpp>
#include <libvizcast/Error.hpp>
#include <libvizcast/FilterGraph.hpp>
#include <libvizcast/ScratchFile.hpp>

#include <shared/ImageUtilities.hpp>
#include <shared/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace vizcast {

	namespace {

		std::string LowerExtension(const std::filesystem::path& path) {
			std::string ext = path.extension().string();
			if (!ext.empty() && ext.front() == '.')
				ext.erase(0, 1);

			std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			return ext;
		}

		bool SameFile(const std::filesystem::path& a, const std::filesystem::path& b) {
			std::error_code ec;
			if (std::filesystem::equivalent(a, b, ec))
				return true;
			return a.lexically_normal() == b.lexically_normal();
		}

		void RunStage(const std::vector<std::string>& argv, bool verbose, std::string_view failure) {
			EngineRunner::Result res = EngineRunner::Run(argv, verbose);
			if (!res.Succeeded()) {
				if (res.saw_error_marker)
					LogDebug("{}: first error line was \"{}\" (exit {})", failure, res.first_error, res.exit_code);
				throw Error(ErrorKind::SubprocessExecutionFailed, std::string(failure));
			}
		}

	} // namespace

	std::vector<std::string> EncodePipeline::BuildCompositeCommand(const MediaEngine& engine, const std::filesystem::path& image, const std::filesystem::path& audio,
																   const std::string& graph, double seconds, const std::filesystem::path& output) {
		return {
			engine.ffmpeg,
			"-nostdin", "-y",
			"-i", image.string(),
			"-i", audio.string(),
			"-filter_complex", graph,
			"-c:v", "libx264",
			"-c:a", "aac",
			"-preset", "ultrafast",
			"-tune", "stillimage",
			"-t", std::format("{}", seconds),
			"-pix_fmt", "yuv420p",
			output.string()
		};
	}

	std::vector<std::string> EncodePipeline::BuildRemuxCommand(const MediaEngine& engine, const std::filesystem::path& video, const std::filesystem::path& audio,
															   const std::filesystem::path& output) {
		return {
			engine.ffmpeg,
			"-nostdin", "-y",
			"-i", video.string(),
			"-i", audio.string(),
			"-map", "0:v:0",
			"-map", "1:a:0",
			"-c:v", "copy",
			"-c:a", "aac",
			"-shortest",
			output.string()
		};
	}

	std::filesystem::path EncodePipeline::ThumbnailPath(const std::filesystem::path& background, const std::filesystem::path& audio, const std::filesystem::path& video) {
		std::string want_ext = LowerExtension(background) == "png" ? "png" : "jpg";

		std::filesystem::path dir = video.parent_path();
		if (dir.empty())
			dir = ".";

		return dir / (audio.stem().string() + "." + want_ext);
	}

	std::filesystem::path EncodePipeline::WriteThumbnail(const std::filesystem::path& background, const std::filesystem::path& audio, const std::filesystem::path& video) {
		std::filesystem::path dest = ThumbnailPath(background, audio, video);

		std::string src_ext = LowerExtension(background);
		std::string want_ext = LowerExtension(dest);

		if ((src_ext == "jpg" || src_ext == "jpeg" || src_ext == "png") && (src_ext == want_ext || (src_ext == "jpeg" && want_ext == "jpg"))) {
			if (!SameFile(background, dest)) {
				std::error_code ec;
				std::filesystem::copy_file(background, dest, std::filesystem::copy_options::overwrite_existing, ec);
				if (ec)
					throw Error(ErrorKind::OutputValidationFailed, std::format("Failed to copy thumbnail to {}: {}", dest.string(), ec.message()));
			}
		}
		else {
			SDL_Surface* surf = LoadImage(background);
			if (surf == nullptr)
				throw Error(ErrorKind::OutputValidationFailed, std::format("Failed to read {} for the thumbnail", background.string()));

			bool saved = SaveImage(surf, dest, want_ext == "png" ? ImageFormat::Png : ImageFormat::Jpeg, 90);
			SDL_DestroySurface(surf);

			if (!saved)
				throw Error(ErrorKind::OutputValidationFailed, std::format("Failed to write thumbnail {}", dest.string()));
		}

		LogInfo("Thumbnail saved: {}", dest.string());
		return dest;
	}

	OutputArtifact EncodePipeline::Produce(const ResolvedJob& job) {
		std::error_code ec;
		if (!std::filesystem::exists(job.audio_path, ec))
			throw Error(ErrorKind::InputNotFound, std::format("Audio file not found: {}", job.audio_path.string()));

		CoverArtifact cover = CoverResolver::Resolve({
			.audio = job.audio_path,
			.explicit_image = job.image_path,
			.force_extract = job.cover_from_audio,
			.save_to = job.cover_out,
			.verbose = job.verbose
		}, job.engine);

		ScratchFile cover_guard;
		if (cover.IsTemporary())
			cover_guard = ScratchFile(cover.path);

		double seconds = 0.0;
		if (job.target_duration) {
			seconds = *job.target_duration;
		}
		else {
			std::optional<double> probed = MediaProbe::ProbeDuration(job.engine, job.audio_path);
			if (!probed)
				throw Error(ErrorKind::SubprocessExecutionFailed, std::format("Could not determine the duration of {}", job.audio_path.string()));
			seconds = *probed;
		}

		ScratchFile temp_video(ScratchFile::MakePath("temp_video", "mp4"));
		LogInfo("Creating temporary file at: {}", temp_video.Path().string());

		FilterGraph::Spec graph = FilterGraph::Synthesize(job.visualization);
		LogDebug("Filter graph: {}", graph.graph);

		LogInfo("Step 1: Creating visualization video...");
		RunStage(BuildCompositeCommand(job.engine, cover.path, job.audio_path, graph.graph, seconds, temp_video.Path()), job.verbose,
				 "Step 1: FFmpeg visualization creation failed");

		if (!std::filesystem::exists(temp_video.Path(), ec))
			throw Error(ErrorKind::SubprocessExecutionFailed, std::format("Failed to create temporary file at {}", temp_video.Path().string()));

		LogInfo("Step 2: Combining with audio...");
		try {
			RunStage(BuildRemuxCommand(job.engine, temp_video.Path(), job.audio_path, job.output_path), job.verbose,
					 "Step 2: FFmpeg audio combination failed");
		}
		catch (const Error&) {
			// don't leave a half-written video behind
			if (std::filesystem::remove(job.output_path, ec))
				LogDebug("Removed partial output {}", job.output_path.string());
			throw;
		}

		std::filesystem::path thumbnail = WriteThumbnail(cover.path, job.audio_path, job.output_path);

		temp_video.Remove();
		cover_guard.Remove();

		if (!std::filesystem::exists(job.output_path, ec))
			throw Error(ErrorKind::OutputValidationFailed, "Failed to create output file");

		std::uintmax_t size = std::filesystem::file_size(job.output_path, ec);
		if (ec || size == 0)
			throw Error(ErrorKind::OutputValidationFailed, "Output file was created but has zero size");

		LogInfo("Video created successfully! Output: {} ({} bytes)", job.output_path.string(), size);

		return {
			.video = job.output_path,
			.thumbnail = thumbnail,
			.size = size
		};
	}

} // namespace vizcast
