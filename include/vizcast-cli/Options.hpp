// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/libvizcast.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vizcast::cli {

	struct OptionVariables {
		std::string input_pattern {};
		std::vector<std::filesystem::path> inputs {};

		std::optional<std::filesystem::path> image_path {};
		bool cover_from_audio = false;
		std::optional<std::filesystem::path> cover_out {};
		std::optional<std::filesystem::path> out_dir {};

		VisualizationRequest visualization {};
		std::optional<double> duration {};
		bool verbose = false;

		MediaEngine engine {};
	};

	class Options {
	public:
		static OptionVariables options;

		/// Fills options from argv. Usage errors print help and exit; bad values throw Error(ConfigurationError).
		static int ParseArgs(int argc, char** argv);
		static void PrintArgs();

		/// Glob matches that are regular files, in glob order; falls back to the literal path.
		static std::vector<std::filesystem::path> ExpandInputs(const std::string& pattern);

		static SharedOptions ToSharedOptions(const OptionVariables& vars);
	};

} // namespace vizcast::cli
