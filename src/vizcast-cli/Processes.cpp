// Created by block on 2026-10-19.

#include <vizcast-cli/Options.hpp>
#include <vizcast-cli/Processes.hpp>

#include <libvizcast/libvizcast.hpp>

#include <shared/Logger.hpp>

#include <cstdlib>

namespace vizcast::cli {

	Processes& Processes::The() {
		static Processes the;
		return the;
	}

	bool Processes::CheckEngine() {
		if (Subprocess::IsProgramAvailable(Options::options.engine.ffmpeg))
			return true;

		LogError("FFmpeg not found. Please install FFmpeg and make sure it's in your PATH.");
		return false;
	}

	int Processes::ProcessBatch() {
		OptionVariables& opts = Options::options;

		// a single cover path can't be shared by several inputs
		if (opts.inputs.size() > 1 && opts.cover_out) {
			LogWarning("--cover-out is ignored in batch mode (multiple inputs).");
			opts.cover_out.reset();
		}

		if (!CheckEngine())
			return EXIT_FAILURE;

		std::vector<OutputArtifact> outputs = BatchRunner::RunAll(opts.inputs, Options::ToSharedOptions(opts), opts.out_dir);

		if (outputs.size() > 1)
			LogInfo("Finished {} videos", outputs.size());

		return EXIT_SUCCESS;
	}

} // namespace vizcast::cli
