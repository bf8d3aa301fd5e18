// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/MediaProbe.hpp>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace vizcast::test {

	/// Fresh directory under the system temp dir, removed with everything in it.
	class TempDirectory {
	public:
		TempDirectory();
		~TempDirectory();

		TempDirectory(const TempDirectory&) = delete;
		TempDirectory& operator=(const TempDirectory&) = delete;

		const std::filesystem::path& Path() const { return path; }
		std::filesystem::path operator/(const std::string& name) const { return path / name; }

	private:
		std::filesystem::path path;
	};

	/// ffmpeg and ffprobe from PATH, checked once.
	bool EngineAvailable();

	/// Runs ffmpeg quietly with the given arguments. True on a clean exit.
	bool RunFfmpeg(std::initializer_list<std::string> args);

	// fixtures
	bool MakeSineWav(const std::filesystem::path& dest, double seconds);
	bool MakeSineMp3(const std::filesystem::path& dest, double seconds);
	bool MakeSolidImage(const std::filesystem::path& dest, const std::string& color, int width, int height);
	bool EmbedFrontCover(const std::filesystem::path& audio, const std::filesystem::path& cover, const std::filesystem::path& dest);

	/// Temporary covers and intermediate videos this process currently has in the temp dir.
	std::set<std::filesystem::path> ScratchFilesOfThisProcess();

	std::vector<std::uint8_t> ReadBytes(const std::filesystem::path& file);
	void WriteText(const std::filesystem::path& file, const std::string& text);

} // namespace vizcast::test
