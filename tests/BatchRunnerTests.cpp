// Created by block on 2026-10-19.

#include <catch2/catch.hpp>

#include <libvizcast/BatchRunner.hpp>
#include <libvizcast/Error.hpp>

#include "TestUtils.hpp"

using namespace vizcast;

TEST_CASE("Output paths", "[batch]") {
	SECTION("beside the input") {
		CHECK(BatchRunner::DeriveOutputPath("music/song.mp3", std::nullopt) == std::filesystem::path("music/song.mp4"));
		CHECK(BatchRunner::DeriveOutputPath("music/live.set.flac", std::nullopt) == std::filesystem::path("music/live.set.mp4"));
		CHECK(BatchRunner::DeriveOutputPath("noext", std::nullopt) == std::filesystem::path("noext.mp4"));
	}

	SECTION("under an output directory, created on demand") {
		test::TempDirectory dir;
		auto out_dir = dir / "out" / "nested";
		REQUIRE_FALSE(std::filesystem::exists(out_dir));

		CHECK(BatchRunner::DeriveOutputPath("music/song.mp3", out_dir) == out_dir / "song.mp4");
		CHECK(std::filesystem::is_directory(out_dir));
	}

	SECTION("an output directory that can't be created is an output failure") {
		test::TempDirectory dir;
		test::WriteText(dir / "blocker", "not a directory");

		try {
			BatchRunner::DeriveOutputPath("music/song.mp3", dir / "blocker" / "out");
			FAIL("expected an error");
		}
		catch (const Error& e) {
			CHECK(e.Kind() == ErrorKind::OutputValidationFailed);
		}
	}
}

TEST_CASE("Jobs inherit the shared options", "[batch]") {
	SharedOptions shared {
		.image_path = "bg.png",
		.visualization = { .type = VisualizationType::Spectrum },
		.target_duration = 12.5,
		.verbose = true,
		.cover_from_audio = true,
		.cover_out = "cover.jpg",
		.engine = { .ffmpeg = "ff", .ffprobe = "fp" }
	};

	ResolvedJob job = BatchRunner::MakeJob("a/b.wav", shared, std::nullopt);
	CHECK(job.audio_path == std::filesystem::path("a/b.wav"));
	CHECK(job.output_path == std::filesystem::path("a/b.mp4"));
	CHECK(job.image_path == std::filesystem::path("bg.png"));
	CHECK(job.visualization.type == VisualizationType::Spectrum);
	CHECK(job.target_duration == 12.5);
	CHECK(job.verbose);
	CHECK(job.cover_from_audio);
	CHECK(job.cover_out == std::filesystem::path("cover.jpg"));
	CHECK(job.engine.ffmpeg == "ff");
	CHECK(job.engine.ffprobe == "fp");
}

TEST_CASE("An empty batch does nothing", "[batch]") {
	CHECK(BatchRunner::RunAll({}, SharedOptions {}, std::nullopt).empty());
}

TEST_CASE("Batches stop at the first failure", "[batch][engine]") {
	if (!test::EngineAvailable()) {
		WARN("ffmpeg not found, skipping");
		return;
	}

	test::TempDirectory dir;
	auto first = dir / "first.wav";
	auto broken = dir / "second.mp3";
	auto third = dir / "third.wav";
	auto image = dir / "bg.png";
	REQUIRE(test::MakeSineWav(first, 1.0));
	test::WriteText(broken, std::string(2048, '\x01'));
	REQUIRE(test::MakeSineWav(third, 1.0));
	REQUIRE(test::MakeSolidImage(image, "gray", 640, 360));

	auto out_dir = dir / "videos";
	SharedOptions shared { .image_path = image };

	CHECK_THROWS_AS(BatchRunner::RunAll({ first, broken, third }, shared, out_dir), Error);

	CHECK(std::filesystem::exists(out_dir / "first.mp4"));
	CHECK(std::filesystem::file_size(out_dir / "first.mp4") > 0);
	CHECK_FALSE(std::filesystem::exists(out_dir / "third.mp4"));
}

TEST_CASE("Batches run every input in order", "[batch][engine]") {
	if (!test::EngineAvailable()) {
		WARN("ffmpeg not found, skipping");
		return;
	}

	test::TempDirectory dir;
	auto a = dir / "a.wav";
	auto b = dir / "b.wav";
	auto image = dir / "bg.png";
	REQUIRE(test::MakeSineWav(a, 1.0));
	REQUIRE(test::MakeSineWav(b, 1.0));
	REQUIRE(test::MakeSolidImage(image, "white", 320, 240));

	auto outputs = BatchRunner::RunAll({ a, b }, SharedOptions { .image_path = image, .target_duration = 1.0 }, std::nullopt);
	REQUIRE(outputs.size() == 2);
	CHECK(outputs[0].video == dir / "a.mp4");
	CHECK(outputs[1].video == dir / "b.mp4");
}
