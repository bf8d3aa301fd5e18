// Created by block on 2026-10-19.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vizcast {

	/// Runs ffmpeg invocations and watches their diagnostic output.
	///
	/// ffmpeg does not always exit non-zero when a filter graph fails to build, so an
	/// error marker on stderr counts as a failure even if the exit status is clean.
	/// In verbose mode the output is passed straight through and only the exit status counts.
	class EngineRunner {
	public:
		enum class LineKind : std::uint8_t {
			Error,
			Progress,
			Other
		};

		struct Result {
			int exit_code = -1;
			bool saw_error_marker = false;
			std::string first_error {};

			bool Succeeded() const { return exit_code == 0 && !saw_error_marker; }
		};

		static LineKind ClassifyLine(std::string_view line);

		static Result Run(const std::vector<std::string>& argv, bool verbose);
	};

} // namespace vizcast
