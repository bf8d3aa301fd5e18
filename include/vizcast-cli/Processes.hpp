// Created by block on 2026-10-19.

#pragma once

namespace vizcast::cli {

	class Processes {
	public:
		static Processes& The();

		/// Renders every input from Options::options. Returns an exit code.
		int ProcessBatch();

	private:
		bool CheckEngine();
	};

} // namespace vizcast::cli
