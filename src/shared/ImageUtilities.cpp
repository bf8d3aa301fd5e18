// Created by block on 2024-11-14.

#include <shared/ImageUtilities.hpp>

#include <shared/Logger.hpp>
#include <SDL3/SDL_error.h>
#include <SDL3_image/SDL_image.h>

namespace vizcast {

	SDL_Surface* LoadImage(const std::filesystem::path& inputPath) {
		if (inputPath.empty()) {
			LogError("Need a file to load!");
			return nullptr;
		}

		SDL_Surface* surf = IMG_Load(inputPath.c_str());
		if (!surf) {
			LogError("SDL3_image failed to load image {}: {}", inputPath.string(), SDL_GetError());
			return nullptr;
		}

		return surf;
	}

	bool SaveImage(SDL_Surface* surface, const std::filesystem::path& outputPath, ImageFormat format, int quality /*= 90*/) {
		if (surface == nullptr)
			return false;

		bool ok = false;
		switch (format) {
			case ImageFormat::Jpeg:
				// JPEG has no alpha, flatten to RGB first
				if (SDL_Surface* rgb = SDL_ConvertSurface(surface, SDL_PIXELFORMAT_RGB24); rgb != nullptr) {
					ok = IMG_SaveJPG(rgb, outputPath.c_str(), quality);
					SDL_DestroySurface(rgb);
				}
				break;
			case ImageFormat::Png:
				ok = IMG_SavePNG(surface, outputPath.c_str());
				break;
		}

		if (!ok)
			LogError("SDL3_image failed to save image {}: {}", outputPath.string(), SDL_GetError());

		return ok;
	}

} // namespace vizcast
