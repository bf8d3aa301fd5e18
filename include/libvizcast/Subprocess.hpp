// Created by block on 2026-10-19.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vizcast {

	/// Blocking child-process helpers. Programs are looked up on PATH and run without a shell.
	/// Stdin is always /dev/null. Throws Error(SubprocessSpawnFailed) if the program can't be run.
	class Subprocess {
	public:
		typedef std::function<void(std::string_view line)> LineCallback;

		struct Result {
			int exit_code = -1;
			std::string output {}; // only filled by Capture()

			bool Succeeded() const { return exit_code == 0; }
		};

		/// Collect stdout as text; stderr is discarded.
		static Result Capture(const std::vector<std::string>& argv);

		/// Hand each stderr line to on_line as it arrives; stdout is discarded.
		static Result Stream(const std::vector<std::string>& argv, const LineCallback& on_line);

		/// Let the child write straight to our own stdout/stderr.
		static Result Passthrough(const std::vector<std::string>& argv);

		/// True if `program -version` can be started at all.
		static bool IsProgramAvailable(const std::string& program);

		/// Quoted, human-readable command line for logs.
		static std::string FormatCommandLine(const std::vector<std::string>& argv);
	};

	/// Splits a byte stream into lines on both '\n' and '\r'. Empty lines are dropped.
	class LineSplitter {
	public:
		void Feed(std::string_view chunk, const Subprocess::LineCallback& on_line);
		void Finish(const Subprocess::LineCallback& on_line);

	private:
		std::string pending {};
	};

} // namespace vizcast
