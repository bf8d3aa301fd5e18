// Created by block on 2026-10-19.

#include <catch2/catch.hpp>

#include <libvizcast/ScratchFile.hpp>

#include "TestUtils.hpp"

#include <set>
#include <string>

#include <unistd.h>

using namespace vizcast;

TEST_CASE("Scratch paths are unique and well formed", "[scratch]") {
	std::set<std::filesystem::path> seen;
	for (int i = 0; i < 64; i++)
		seen.insert(ScratchFile::MakePath("temp_video", "mp4"));
	CHECK(seen.size() == 64);

	auto path = ScratchFile::MakePath("cover", "jpg", true);
	CHECK(path.parent_path() == std::filesystem::temp_directory_path());
	CHECK(path.extension() == ".jpg");

	std::string name = path.filename().string();
	CHECK(name.starts_with("cover_" + std::to_string(::getpid()) + "_"));
}

TEST_CASE("Scratch files are removed with their guard", "[scratch]") {
	std::filesystem::path path = ScratchFile::MakePath("vizcast_guard", "txt");

	{
		ScratchFile guard(path);
		test::WriteText(path, "x");
		REQUIRE(std::filesystem::exists(path));
	}
	CHECK_FALSE(std::filesystem::exists(path));

	SECTION("unless released") {
		std::filesystem::path kept;
		{
			ScratchFile guard(path);
			test::WriteText(path, "x");
			kept = guard.Release();
			CHECK_FALSE(guard.Owns());
		}
		CHECK(kept == path);
		CHECK(std::filesystem::exists(path));
		std::filesystem::remove(path);
	}

	SECTION("moves transfer ownership") {
		ScratchFile outer;
		{
			ScratchFile inner(path);
			test::WriteText(path, "x");
			outer = std::move(inner);
		}
		CHECK(std::filesystem::exists(path));
		outer.Remove();
		CHECK_FALSE(std::filesystem::exists(path));
	}

	SECTION("already gone is fine") {
		ScratchFile guard(path);
		guard.Remove();
		CHECK_FALSE(guard.Owns());
	}
}
