// Created by block on 2026-10-19.

#include <libvizcast/Visualization.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace vizcast {

	namespace {

		struct ColorSchemeEntry {
			std::string_view name;
			SpectrumColorScheme scheme;
		};

		// names are what showspectrum expects for color=
		constexpr ColorSchemeEntry ColorSchemes[] = {
			{"rainbow", SpectrumColorScheme::Rainbow},
			{"moreland", SpectrumColorScheme::Moreland},
			{"nebulae", SpectrumColorScheme::Nebulae},
			{"fire", SpectrumColorScheme::Fire},
			{"fiery", SpectrumColorScheme::Fiery},
			{"fruit", SpectrumColorScheme::Fruit},
			{"cool", SpectrumColorScheme::Cool},
			{"magma", SpectrumColorScheme::Magma},
			{"green", SpectrumColorScheme::Green},
			{"viridis", SpectrumColorScheme::Viridis},
			{"plasma", SpectrumColorScheme::Plasma},
			{"cividis", SpectrumColorScheme::Cividis},
			{"terrain", SpectrumColorScheme::Terrain},
		};

		struct VisualizationTypeEntry {
			std::string_view name;
			VisualizationType type;
		};

		constexpr VisualizationTypeEntry VisualizationTypes[] = {
			{"wave", VisualizationType::Waveform},
			{"waveform", VisualizationType::Waveform},
			{"spectrum", VisualizationType::Spectrum},
			{"spec", VisualizationType::Spectrum},
			{"both", VisualizationType::Both},
		};

		struct AnchorEntry {
			std::string_view name;
			VisualizationPosition::Anchor anchor;
		};

		constexpr AnchorEntry Anchors[] = {
			{"top", VisualizationPosition::Anchor::Top},
			{"bottom", VisualizationPosition::Anchor::Bottom},
			{"left", VisualizationPosition::Anchor::Left},
			{"right", VisualizationPosition::Anchor::Right},
			{"center", VisualizationPosition::Anchor::Center},
		};

		// https://stackoverflow.com/a/4119881
		bool ichar_equals(char a, char b) {
			return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
		}

		bool iequals(std::string_view a, std::string_view b) {
			return std::ranges::equal(a, b, ichar_equals);
		}

		std::string_view Trim(std::string_view str) {
			while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
				str.remove_prefix(1);
			while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
				str.remove_suffix(1);
			return str;
		}

		std::optional<std::uint32_t> ParseCoordinate(std::string_view str) {
			str = Trim(str);
			if (str.empty())
				return std::nullopt;

			std::uint32_t value = 0;
			auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
			if (ec != std::errc {} || ptr != str.data() + str.size())
				return std::nullopt;

			return value;
		}

	} // namespace

	std::optional<VisualizationType> ParseVisualizationType(std::string_view str) {
		for (const auto& vt : VisualizationTypes) {
			if (iequals(vt.name, str))
				return vt.type;
		}

		return std::nullopt;
	}

	std::optional<SpectrumColorScheme> ParseColorScheme(std::string_view str) {
		for (const auto& cs : ColorSchemes) {
			if (iequals(cs.name, str))
				return cs.scheme;
		}

		return std::nullopt;
	}

	std::optional<VisualizationPosition> ParsePosition(std::string_view str) {
		for (const auto& an : Anchors) {
			if (iequals(an.name, str))
				return VisualizationPosition { .anchor = an.anchor };
		}

		// xy(x,y)
		if (str.size() < 4 || !iequals(str.substr(0, 3), "xy(") || str.back() != ')')
			return std::nullopt;

		std::string_view coords = str.substr(3, str.size() - 4);
		std::size_t comma = coords.find(',');
		if (comma == std::string_view::npos || coords.find(',', comma + 1) != std::string_view::npos)
			return std::nullopt;

		std::optional<std::uint32_t> x = ParseCoordinate(coords.substr(0, comma));
		std::optional<std::uint32_t> y = ParseCoordinate(coords.substr(comma + 1));
		if (!x || !y)
			return std::nullopt;

		return VisualizationPosition::Custom(*x, *y);
	}

	std::string_view ColorSchemeName(SpectrumColorScheme scheme) {
		for (const auto& cs : ColorSchemes) {
			if (cs.scheme == scheme)
				return cs.name;
		}

		return "viridis";
	}

	std::string_view VisualizationTypeName(VisualizationType type) {
		switch (type) {
			case VisualizationType::Waveform: return "waveform";
			case VisualizationType::Spectrum: return "spectrum";
			case VisualizationType::Both: return "both";
		}
		return "???";
	}

} // namespace vizcast
