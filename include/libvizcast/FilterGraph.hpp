// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/Visualization.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace vizcast {

	class FilterGraph {
	public:
		// Every background is letterboxed into this frame before compositing.
		static constexpr std::uint32_t FrameWidth = 1280;
		static constexpr std::uint32_t FrameHeight = 720;

		// Fixed analysis band for the spectrogram, in Hz.
		static constexpr std::uint32_t SpectrumStartHz = 100;
		static constexpr std::uint32_t SpectrumStopHz = 10000;

		enum class Orientation : std::uint8_t {
			Horizontal,
			Vertical
		};

		struct SpectrumParams {
			std::uint32_t width;
			std::uint32_t height;
			Orientation orientation;

			bool operator==(const SpectrumParams&) const = default;
		};

		/// One composited element: its size as rendered and where the overlay filter puts it.
		struct Pane {
			std::uint32_t width;
			std::uint32_t height;
			std::string overlay;

			bool operator==(const Pane&) const = default;
		};

		/// Output of Synthesize(). graph is handed to -filter_complex as-is.
		struct Spec {
			std::string graph;
			std::optional<Pane> waveform;
			std::optional<Pane> spectrum;
			std::optional<SpectrumParams> spectrum_params;

			bool operator==(const Spec&) const = default;
		};

		static Spec Synthesize(const VisualizationRequest& req);

		/// Left/right swap width and height and run vertically; everything else is horizontal.
		static SpectrumParams GetSpectrumParams(VisualizationPosition pos, std::uint32_t width, std::uint32_t height);

		/// Single-element overlay expression, e.g. "x=(W-w)/2:y=H-h-50" for bottom.
		static std::string GetPositionOverlay(VisualizationPosition pos, std::uint32_t margin);

		/// showspectrum option string for the given size and palette.
		static std::string GetSpectrumArgs(SpectrumColorScheme scheme, const SpectrumParams& params);

		static std::string GetWaveformArgs(std::uint32_t width, std::uint32_t height);
		static std::string GetBackgroundChain();
	};

} // namespace vizcast
