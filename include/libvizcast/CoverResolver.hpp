// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/MediaProbe.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace vizcast {

	/// A background image ready to be fed to the encoder.
	struct CoverArtifact {
		enum class Ownership : std::uint8_t {
			Temporary,    // we made it, we delete it
			UserSpecified // never touched after use
		};

		std::filesystem::path path;
		Ownership ownership;

		bool IsTemporary() const { return ownership == Ownership::Temporary; }
	};

	class CoverResolver {
	public:
		struct Request {
			std::filesystem::path audio;
			std::optional<std::filesystem::path> explicit_image {};
			bool force_extract = false;
			std::optional<std::filesystem::path> save_to {};
			bool verbose = false;
		};

		/// Picks the background for a job. Uses the explicit image if it exists and extraction wasn't forced,
		/// otherwise pulls the cover out of the audio file. Throws Error(CoverNotFound) when both tiers fail.
		static CoverArtifact Resolve(const Request& req, const MediaEngine& engine);

		/// True if a cover has to be extracted for this request.
		static bool NeedsExtraction(const Request& req);

		/// Tier 1: copy the embedded picture bytes out of the tag container. Returns the written path.
		static std::filesystem::path ExtractEmbedded(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& save_to);

		/// Tier 2: have the engine decode one frame of the attached picture (or first video stream).
		static std::filesystem::path ExtractWithEngine(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& save_to, const MediaEngine& engine, bool verbose);

		/// "image/jpeg" -> "jpg" and so on; unknown types get "bin".
		static std::string_view MimeToExtension(std::string_view mime);

		/// Engine codec name -> image extension. png and webp keep theirs, everything else becomes jpg.
		static std::string_view CodecToExtension(std::string_view codec);
	};

} // namespace vizcast
