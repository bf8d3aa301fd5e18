// Created by block on 2026-10-19.

#include <libvizcast/EngineRunner.hpp>
#include <libvizcast/Subprocess.hpp>

#include <shared/Logger.hpp>

#include <iostream>

namespace vizcast {

	EngineRunner::LineKind EngineRunner::ClassifyLine(std::string_view line) {
		if (line.find("Error") != std::string_view::npos || line.find("error") != std::string_view::npos)
			return LineKind::Error;

		if (line.find("frame=") != std::string_view::npos || line.find("time=") != std::string_view::npos)
			return LineKind::Progress;

		return LineKind::Other;
	}

	EngineRunner::Result EngineRunner::Run(const std::vector<std::string>& argv, bool verbose) {
		Result result {};

		if (verbose) {
			result.exit_code = Subprocess::Passthrough(argv).exit_code;
			return result;
		}

		bool progress_shown = false;

		Subprocess::Result res = Subprocess::Stream(argv, [&](std::string_view line) {
			switch (ClassifyLine(line)) {
				case LineKind::Error:
					if (progress_shown) {
						std::cout << '\n';
						progress_shown = false;
					}
					LogError("FFmpeg error: {}", line);

					if (!result.saw_error_marker)
						result.first_error = line;
					result.saw_error_marker = true;
					break;
				case LineKind::Progress:
					// status line, overwritten in place
					std::cout << '\r' << line << std::flush;
					progress_shown = true;
					break;
				case LineKind::Other:
					break;
			}
		});

		if (progress_shown)
			std::cout << std::endl;

		result.exit_code = res.exit_code;
		return result;
	}

} // namespace vizcast
