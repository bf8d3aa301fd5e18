// Created by block on 2026-10-19.

#include "TestUtils.hpp"

#include <libvizcast/ScratchFile.hpp>
#include <libvizcast/Subprocess.hpp>

#include <format>
#include <fstream>
#include <iterator>

#include <unistd.h>

namespace vizcast::test {

	TempDirectory::TempDirectory()
		: path(ScratchFile::MakePath("vizcast_test", "d")) {
		std::filesystem::create_directories(path);
	}

	TempDirectory::~TempDirectory() {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	bool EngineAvailable() {
		static const bool available = Subprocess::IsProgramAvailable("ffmpeg") && Subprocess::IsProgramAvailable("ffprobe");
		return available;
	}

	bool RunFfmpeg(std::initializer_list<std::string> args) {
		std::vector<std::string> argv { "ffmpeg", "-nostdin", "-hide_banner", "-loglevel", "error", "-y" };
		argv.insert(argv.end(), args);
		return Subprocess::Capture(argv).Succeeded();
	}

	bool MakeSineWav(const std::filesystem::path& dest, double seconds) {
		return RunFfmpeg({ "-f", "lavfi", "-i", std::format("sine=frequency=440:duration={}", seconds), "-c:a", "pcm_s16le", dest.string() });
	}

	bool MakeSineMp3(const std::filesystem::path& dest, double seconds) {
		return RunFfmpeg({ "-f", "lavfi", "-i", std::format("sine=frequency=440:duration={}", seconds), "-c:a", "libmp3lame", dest.string() });
	}

	bool MakeSolidImage(const std::filesystem::path& dest, const std::string& color, int width, int height) {
		return RunFfmpeg({ "-f", "lavfi", "-i", std::format("color=c={}:s={}x{}", color, width, height), "-frames:v", "1", dest.string() });
	}

	bool EmbedFrontCover(const std::filesystem::path& audio, const std::filesystem::path& cover, const std::filesystem::path& dest) {
		return RunFfmpeg({
			"-i", audio.string(),
			"-i", cover.string(),
			"-map", "0", "-map", "1",
			"-c", "copy",
			"-id3v2_version", "3",
			"-metadata:s:v", "comment=Cover (front)",
			"-disposition:v", "attached_pic",
			dest.string()
		});
	}

	std::vector<std::uint8_t> ReadBytes(const std::filesystem::path& file) {
		std::ifstream in(file, std::ios::binary);
		std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
		return bytes;
	}

	void WriteText(const std::filesystem::path& file, const std::string& text) {
		std::ofstream out(file, std::ios::binary | std::ios::trunc);
		out << text;
	}

	std::set<std::filesystem::path> ScratchFilesOfThisProcess() {
		const std::string pid = std::to_string(::getpid());
		const std::string cover_prefix = "cover_" + pid + "_";
		const std::string video_prefix = "temp_video_" + pid + "_";

		std::set<std::filesystem::path> found;
		std::error_code ec;
		for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::temp_directory_path(), ec)) {
			std::string name = entry.path().filename().string();
			if (name.starts_with(cover_prefix) || name.starts_with(video_prefix))
				found.insert(entry.path());
		}
		return found;
	}

} // namespace vizcast::test
