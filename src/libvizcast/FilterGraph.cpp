// Created by block on 2026-10-19.

#include <libvizcast/FilterGraph.hpp>

#include <format>
#include <utility>

namespace vizcast {

	using Anchor = VisualizationPosition::Anchor;

	std::string FilterGraph::GetBackgroundChain() {
		// scale down to fit, then pad out to the full frame with the image centered
		return std::format("[0:v]scale={0}:{1}:force_original_aspect_ratio=decrease,pad={0}:{1}:(ow-iw)/2:(oh-ih)/2[bg]",
						   FrameWidth, FrameHeight);
	}

	std::string FilterGraph::GetWaveformArgs(std::uint32_t width, std::uint32_t height) {
		return std::format("s={}x{}:mode=line:rate=25:colors=white", width, height);
	}

	FilterGraph::SpectrumParams FilterGraph::GetSpectrumParams(VisualizationPosition pos, std::uint32_t width, std::uint32_t height) {
		if (pos.IsVertical())
			return { height, width, Orientation::Vertical };

		return { width, height, Orientation::Horizontal };
	}

	std::string FilterGraph::GetSpectrumArgs(SpectrumColorScheme scheme, const SpectrumParams& params) {
		return std::format("s={}x{}:mode=combined:scale=cbrt:slide=scroll:fscale=lin:"
						   "win_func=hamming:overlap=0:fps=auto:start={}:stop={}:orientation={}:color={}",
						   params.width, params.height,
						   SpectrumStartHz, SpectrumStopHz,
						   params.orientation == Orientation::Vertical ? 1 : 0,
						   ColorSchemeName(scheme));
	}

	std::string FilterGraph::GetPositionOverlay(VisualizationPosition pos, std::uint32_t margin) {
		switch (pos.anchor) {
			case Anchor::Top: return std::format("x=(W-w)/2:y={}", margin);
			case Anchor::Bottom: return std::format("x=(W-w)/2:y=H-h-{}", margin);
			case Anchor::Left: return std::format("x={}:y=(H-h)/2", margin);
			case Anchor::Right: return std::format("x=W-w-{}:y=(H-h)/2", margin);
			case Anchor::Center: return "x=(W-w)/2:y=(H-h)/2";
			case Anchor::Custom: return std::format("x={}:y={}", pos.x, pos.y);
		}

		return "x=0:y=0";
	}

	FilterGraph::Spec FilterGraph::Synthesize(const VisualizationRequest& req) {
		Spec spec {};
		const std::string background = GetBackgroundChain();

		switch (req.type) {
			case VisualizationType::Waveform: {
				spec.waveform = Pane { req.width, req.height, GetPositionOverlay(req.position, req.margin) };

				spec.graph = std::format("{}; [1:a]aformat=channel_layouts=mono,showwaves={}[wave]; [bg][wave]overlay={}",
										 background,
										 GetWaveformArgs(req.width, req.height),
										 spec.waveform->overlay);
				break;
			}
			case VisualizationType::Spectrum: {
				SpectrumParams params = GetSpectrumParams(req.position, req.width, req.height);
				spec.spectrum_params = params;
				spec.spectrum = Pane { params.width, params.height, GetPositionOverlay(req.position, req.margin) };

				spec.graph = std::format("{}; [1:a]aformat=channel_layouts=mono,showspectrum={}[spec]; [bg][spec]overlay={}",
										 background,
										 GetSpectrumArgs(req.color_scheme, params),
										 spec.spectrum->overlay);
				break;
			}
			case VisualizationType::Both: {
				const std::uint32_t margin = req.margin;
				const std::uint32_t gap = margin / 2;

				// split the strip's thickness evenly between the two panes.
				// vertical strips are swapped, so their on-screen width is req.height too
				const std::uint32_t pane = req.height / 2;

				SpectrumParams params = GetSpectrumParams(req.position, req.width, pane);
				spec.spectrum_params = params;

				Pane wave = req.position.IsVertical() ? Pane { pane, params.height, {} } : Pane { req.width, pane, {} };
				Pane spectrum { params.width, params.height, {} };

				switch (req.position.anchor) {
					case Anchor::Bottom:
						wave.overlay = std::format("x=(W-w)/2:y=H-h-{}-{}", spectrum.height + gap, margin);
						spectrum.overlay = std::format("x=(W-w)/2:y=H-h-{}", margin);
						break;
					case Anchor::Top:
						wave.overlay = std::format("x=(W-w)/2:y={}", margin);
						spectrum.overlay = std::format("x=(W-w)/2:y={}", margin + wave.height + gap);
						break;
					case Anchor::Left:
						wave.overlay = std::format("x={}:y=(H-h)/2", margin);
						spectrum.overlay = std::format("x={}:y=(H-h)/2", margin + wave.width + gap);
						break;
					case Anchor::Right:
						wave.overlay = std::format("x=W-w-{}-{}:y=(H-h)/2", spectrum.width + gap, margin);
						spectrum.overlay = std::format("x=W-w-{}:y=(H-h)/2", margin);
						break;
					case Anchor::Center:
						// pair straddles the midpoint; rounding up on the wave side keeps odd sizes apart
						wave.overlay = std::format("x=(W-w)/2:y=(H-h)/2-{}", (wave.height + 1) / 2 + (gap + 1) / 2);
						spectrum.overlay = std::format("x=(W-w)/2:y=(H-h)/2+{}", spectrum.height / 2 + gap / 2);
						break;
					case Anchor::Custom:
						wave.overlay = std::format("x={}:y={}", req.position.x, req.position.y);
						spectrum.overlay = std::format("x={}:y={}+{}", req.position.x, req.position.y + wave.height, gap);
						break;
				}

				spec.graph = std::format("{}; "
										 "[1:a]aformat=channel_layouts=mono,showwaves={}[wave]; "
										 "[1:a]aformat=channel_layouts=mono,showspectrum={}[spec]; "
										 "[bg][wave]overlay={}[tmp]; "
										 "[tmp][spec]overlay={}",
										 background,
										 GetWaveformArgs(wave.width, wave.height),
										 GetSpectrumArgs(req.color_scheme, params),
										 wave.overlay,
										 spectrum.overlay);

				spec.waveform = std::move(wave);
				spec.spectrum = std::move(spectrum);
				break;
			}
		}

		return spec;
	}

} // namespace vizcast
