// Created by block on 2026-10-19.

#include <vizcast-cli/Options.hpp>

#include <shared/Logger.hpp>

#include <argparse/argparse.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>

#include <glob.h>

#include "gitversion.h"

namespace vizcast::cli {

	namespace {

		std::uint32_t CheckedDimension(int value, std::string_view name, bool allow_zero) {
			if (value < 0 || (!allow_zero && value == 0))
				throw Error(ErrorKind::ConfigurationError, std::format("--{} must be {}, got {}", name, allow_zero ? "non-negative" : "positive", value));
			return static_cast<std::uint32_t>(value);
		}

	} // namespace

	OptionVariables Options::options {};

	int Options::ParseArgs(int argc, char** argv) {
		argparse::ArgumentParser program("vizcast-cli", vizcast::version::fullTag, argparse::default_arguments::help);
		program.add_description("Turn audio files into MP4 videos with a waveform and/or spectrum over a still image.");

		std::string type = "wave";
		std::string position = "bottom";
		std::string color = "viridis";
		int width = 1280;
		int height = 180;
		int margin = 50;

		program.add_argument("input").store_into(options.input_pattern)
		  .help("Audio file or glob pattern (quote it), e.g. \"albums/*.mp3\".");
		program.add_argument("--image")
		  .help("Background image. If missing, the cover embedded in the audio is used.");
		program.add_argument("--cover-from-audio").flag().store_into(options.cover_from_audio)
		  .help("Ignore --image and extract the embedded cover art from the audio.");
		program.add_argument("--cover-out")
		  .help("Also keep the extracted cover at this path (single input only).");
		program.add_argument("--out-dir")
		  .help("Directory for the videos. Defaults to next to each input.");
		program.add_argument("-t", "--type").store_into(type)
		  .help("wave, spectrum or both.");
		program.add_argument("-d", "--duration").scan<'g', double>()
		  .help("Length of the video in seconds. Defaults to the audio's length.");
		program.add_argument("-p", "--position").store_into(position)
		  .help("top, bottom, left, right, center or xy(X,Y).");
		program.add_argument("-c", "--color").store_into(color)
		  .help("Spectrum palette: rainbow, moreland, nebulae, fire, fiery, fruit, cool, magma, green, viridis, plasma, cividis or terrain.");
		program.add_argument("--width").store_into(width)
		  .help("Width of the visualization.");
		program.add_argument("--height").store_into(height)
		  .help("Height of the visualization.");
		program.add_argument("--margin").store_into(margin)
		  .help("Distance from the frame edge.");
		program.add_argument("-v", "--verbose").flag().store_into(options.verbose)
		  .help("Show the full ffmpeg output and debug logging.");
		program.add_argument("--ffmpeg").store_into(options.engine.ffmpeg)
		  .help("ffmpeg executable to use.");
		program.add_argument("--ffprobe").store_into(options.engine.ffprobe)
		  .help("ffprobe executable to use.");

		try {
			program.parse_args(argc, argv);
		}
		catch (const std::exception& err) {
			std::cerr << err.what() << std::endl;
			std::cerr << program;
			std::exit(1);
		}

		if (auto image = program.present("--image"))
			options.image_path = *image;
		if (auto cover_out = program.present("--cover-out"))
			options.cover_out = *cover_out;
		if (auto out_dir = program.present("--out-dir"))
			options.out_dir = *out_dir;
		options.duration = program.present<double>("--duration");

		if (options.duration && !(*options.duration > 0.0))
			throw Error(ErrorKind::ConfigurationError, std::format("--duration must be positive, got {}", *options.duration));

		auto parsedType = ParseVisualizationType(type);
		if (!parsedType)
			throw Error(ErrorKind::ConfigurationError, std::format("Unknown visualization type: {}", type));

		auto parsedPosition = ParsePosition(position);
		if (!parsedPosition)
			throw Error(ErrorKind::ConfigurationError, std::format("Unknown position: {} (use top, bottom, left, right, center or xy(X,Y))", position));

		auto parsedColor = ParseColorScheme(color);
		if (!parsedColor)
			throw Error(ErrorKind::ConfigurationError, std::format("Unknown color scheme: {}", color));

		options.visualization = {
			.type = *parsedType,
			.position = *parsedPosition,
			.color_scheme = *parsedColor,
			.width = CheckedDimension(width, "width", false),
			.height = CheckedDimension(height, "height", false),
			.margin = CheckedDimension(margin, "margin", true)
		};

		options.inputs = ExpandInputs(options.input_pattern);

		return EXIT_SUCCESS;
	}

	std::vector<std::filesystem::path> Options::ExpandInputs(const std::string& pattern) {
		std::vector<std::filesystem::path> inputs;

		glob_t matches {};
		int ret = glob(pattern.c_str(), 0, nullptr, &matches);
		if (ret == 0) {
			for (std::size_t i = 0; i < matches.gl_pathc; i++) {
				std::error_code ec;
				std::filesystem::path match = matches.gl_pathv[i];
				if (std::filesystem::is_regular_file(match, ec))
					inputs.push_back(match);
			}
		}
		else if (ret != GLOB_NOMATCH) {
			LogDebug("glob() failed with {} for {}", ret, pattern);
		}
		globfree(&matches);

		if (inputs.empty()) {
			std::error_code ec;
			if (std::filesystem::is_regular_file(pattern, ec))
				inputs.emplace_back(pattern);
		}

		if (inputs.empty())
			throw Error(ErrorKind::ConfigurationError, std::format("No files matched pattern or file not found: {}", pattern));

		return inputs;
	}

	SharedOptions Options::ToSharedOptions(const OptionVariables& vars) {
		return {
			.image_path = vars.image_path,
			.visualization = vars.visualization,
			.target_duration = vars.duration,
			.verbose = vars.verbose,
			.cover_from_audio = vars.cover_from_audio,
			.cover_out = vars.cover_out,
			.engine = vars.engine
		};
	}

	void Options::PrintArgs() {
		LogInfo("Args:\n");
		LogInfo("Input pattern: {}", options.input_pattern);
		for (const auto& input : options.inputs)
			LogInfo("    {}", input.string());
		LogInfo("Image: {}", options.image_path ? options.image_path->string() : "(none)");
		LogInfo("Cover from audio? {}", options.cover_from_audio);
		LogInfo("Cover out: {}", options.cover_out ? options.cover_out->string() : "(none)");
		LogInfo("Output dir: {}\n", options.out_dir ? options.out_dir->string() : "(beside input)");

		LogInfo("Visualization:");
		LogInfo("    Type: {}", VisualizationTypeName(options.visualization.type));
		LogInfo("    Color: {}", ColorSchemeName(options.visualization.color_scheme));
		LogInfo("    Size: {}x{}, margin {}", options.visualization.width, options.visualization.height, options.visualization.margin);
		LogInfo("    Duration: {}\n", options.duration ? std::format("{}s", *options.duration) : "(audio length)");

		LogInfo("Engine: {} / {}", options.engine.ffmpeg, options.engine.ffprobe);
		LogInfo("Verbose? {}", options.verbose);
	}

} // namespace vizcast::cli
