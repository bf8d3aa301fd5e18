// Created by block on 2026-10-19.

#pragma once

#include <filesystem>
#include <string_view>

namespace vizcast {

	/// A file in the system temp directory that is deleted when the guard goes away,
	/// unless Release() was called first.
	class ScratchFile {
	public:
		ScratchFile() = default;
		explicit ScratchFile(std::filesystem::path path);
		~ScratchFile();

		ScratchFile(const ScratchFile&) = delete;
		ScratchFile& operator=(const ScratchFile&) = delete;
		ScratchFile(ScratchFile&& other) noexcept;
		ScratchFile& operator=(ScratchFile&& other) noexcept;

		const std::filesystem::path& Path() const { return path; }
		bool Owns() const { return !path.empty(); }

		/// Stop owning the file; it will be left on disk.
		std::filesystem::path Release();

		/// Delete now. Failures are logged, never thrown.
		void Remove();

		/// "<prefix>_<pid>[_<unix seconds>]_<random hex>.<extension>" under the temp directory.
		static std::filesystem::path MakePath(std::string_view prefix, std::string_view extension, bool with_timestamp = false);

	private:
		std::filesystem::path path {};
	};

} // namespace vizcast
