// Created by block on 2026-10-19.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace vizcast {

	enum class VisualizationType : std::uint8_t {
		Waveform,
		Spectrum,
		Both
	};

	enum class SpectrumColorScheme : std::uint8_t {
		Rainbow,
		Moreland,
		Nebulae,
		Fire,
		Fiery,
		Fruit,
		Cool,
		Magma,
		Green,
		Viridis,
		Plasma,
		Cividis,
		Terrain
	};

	struct VisualizationPosition {
		enum class Anchor : std::uint8_t {
			Top,
			Bottom,
			Left,
			Right,
			Center,
			Custom
		};

		Anchor anchor = Anchor::Bottom;

		// only meaningful for Anchor::Custom
		std::uint32_t x = 0;
		std::uint32_t y = 0;

		static constexpr VisualizationPosition Custom(std::uint32_t x, std::uint32_t y) {
			return { .anchor = Anchor::Custom, .x = x, .y = y };
		}

		// left/right placements run the spectrum vertically
		constexpr bool IsVertical() const { return anchor == Anchor::Left || anchor == Anchor::Right; }

		bool operator==(const VisualizationPosition&) const = default;
	};

	struct VisualizationRequest {
		VisualizationType type = VisualizationType::Waveform;
		VisualizationPosition position {};
		SpectrumColorScheme color_scheme = SpectrumColorScheme::Viridis;
		std::uint32_t width = 1280;
		std::uint32_t height = 180;
		std::uint32_t margin = 50;

		bool operator==(const VisualizationRequest&) const = default;
	};

	// Case-insensitive, nullopt for anything unknown.
	std::optional<VisualizationType> ParseVisualizationType(std::string_view str);
	std::optional<SpectrumColorScheme> ParseColorScheme(std::string_view str);
	std::optional<VisualizationPosition> ParsePosition(std::string_view str);

	std::string_view ColorSchemeName(SpectrumColorScheme scheme);
	std::string_view VisualizationTypeName(VisualizationType type);

} // namespace vizcast
