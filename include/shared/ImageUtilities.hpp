// Created by block on 2024-11-14.

#pragma once

#include <SDL3/SDL_surface.h>

#include <cstdint>
#include <filesystem>

namespace vizcast {

	enum class ImageFormat : std::uint8_t {
		Jpeg,
		Png
	};

	SDL_Surface* LoadImage(const std::filesystem::path& inputPath);

	/// Writes the surface as a single image. Quality only matters for JPEG.
	bool SaveImage(SDL_Surface* surface, const std::filesystem::path& outputPath, ImageFormat format, int quality = 90);

} // namespace vizcast
