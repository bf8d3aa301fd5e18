// Created by block on 2026-10-19.

#include <libvizcast/ScratchFile.hpp>

#include <shared/Logger.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <random>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace vizcast {

	ScratchFile::ScratchFile(std::filesystem::path path)
		: path(std::move(path)) {}

	ScratchFile::~ScratchFile() {
		Remove();
	}

	ScratchFile::ScratchFile(ScratchFile&& other) noexcept
		: path(std::exchange(other.path, {})) {}

	ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
		if (this != &other) {
			Remove();
			path = std::exchange(other.path, {});
		}
		return *this;
	}

	std::filesystem::path ScratchFile::Release() {
		return std::exchange(path, {});
	}

	void ScratchFile::Remove() {
		if (path.empty())
			return;

		std::error_code ec;
		if (std::filesystem::remove(path, ec))
			LogDebug("Removed scratch file {}", path.string());
		else if (ec)
			LogWarning("Couldn't remove scratch file {}: {}", path.string(), ec.message());

		path.clear();
	}

	std::filesystem::path ScratchFile::MakePath(std::string_view prefix, std::string_view extension, bool with_timestamp /*= false*/) {
		// pid alone isn't enough once pids get reused, so add some randomness
		static std::mt19937 rng { std::random_device {}() };
		std::uint32_t salt = rng();

		std::string name;
		if (with_timestamp) {
			auto seconds = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
			name = std::format("{}_{}_{}_{:08x}.{}", prefix, ::getpid(), seconds, salt, extension);
		}
		else {
			name = std::format("{}_{}_{:08x}.{}", prefix, ::getpid(), salt, extension);
		}

		return std::filesystem::temp_directory_path() / name;
	}

} // namespace vizcast
