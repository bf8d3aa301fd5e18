// Created by block on 2026-10-19.

#include <libvizcast/CoverResolver.hpp>
#include <libvizcast/EngineRunner.hpp>
#include <libvizcast/Error.hpp>
#include <libvizcast/ScratchFile.hpp>
#include <libvizcast/Subprocess.hpp>

#include <shared/Logger.hpp>

#include <fstream>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

namespace vizcast {

	namespace {

		constexpr std::string_view FrontCoverComment = "Cover (front)";

		struct EmbeddedPicture {
			std::vector<std::uint8_t> data;
			std::string mime;
		};

		std::string StreamTag(const AVStream* st, const char* key) {
			const AVDictionaryEntry* entry = av_dict_get(st->metadata, key, nullptr, 0);
			return entry != nullptr && entry->value != nullptr ? entry->value : "";
		}

		std::string PictureMime(const AVStream* st) {
			std::string mime = StreamTag(st, "mimetype");
			if (!mime.empty())
				return mime;

			const AVCodecDescriptor* desc = avcodec_descriptor_get(st->codecpar->codec_id);
			if (desc != nullptr && desc->mime_types != nullptr && desc->mime_types[0] != nullptr)
				return desc->mime_types[0];

			return "";
		}

		std::optional<EmbeddedPicture> ReadEmbeddedPicture(const std::filesystem::path& audio, std::string& why) {
			AVFormatContext* fmt_ctx = nullptr;

			int ret = avformat_open_input(&fmt_ctx, audio.c_str(), nullptr, nullptr);
			if (ret < 0) {
				why = "could not read tags: " + MediaProbe::AVErrorToString(ret);
				return std::nullopt;
			}

			const AVStream* chosen = nullptr;
			for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
				const AVStream* st = fmt_ctx->streams[i];
				if ((st->disposition & AV_DISPOSITION_ATTACHED_PIC) == 0 || st->attached_pic.size <= 0)
					continue;

				if (StreamTag(st, "comment") == FrontCoverComment) {
					chosen = st;
					break;
				}

				if (chosen == nullptr)
					chosen = st;
			}

			std::optional<EmbeddedPicture> picture;
			if (chosen != nullptr) {
				picture = EmbeddedPicture {
					.data = std::vector<std::uint8_t>(chosen->attached_pic.data, chosen->attached_pic.data + chosen->attached_pic.size),
					.mime = PictureMime(chosen)
				};
			}
			else {
				why = "no embedded picture found";
			}

			avformat_close_input(&fmt_ctx);
			return picture;
		}

		void WriteBytes(const std::filesystem::path& dest, const std::vector<std::uint8_t>& data) {
			std::ofstream file(dest, std::ios::binary | std::ios::trunc);
			if (!file)
				throw Error(ErrorKind::CoverNotFound, "could not open " + dest.string() + " for writing");

			file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
			if (!file)
				throw Error(ErrorKind::CoverNotFound, "could not write " + dest.string());
		}

	} // namespace

	bool CoverResolver::NeedsExtraction(const Request& req) {
		if (req.force_extract || !req.explicit_image)
			return true;

		std::error_code ec;
		return !std::filesystem::exists(*req.explicit_image, ec);
	}

	CoverArtifact CoverResolver::Resolve(const Request& req, const MediaEngine& engine) {
		if (!NeedsExtraction(req))
			return { .path = *req.explicit_image, .ownership = CoverArtifact::Ownership::UserSpecified };

		if (req.explicit_image && !req.force_extract)
			LogWarning("Image {} not found, using the cover embedded in the audio", req.explicit_image->string());

		auto ownership = req.save_to ? CoverArtifact::Ownership::UserSpecified : CoverArtifact::Ownership::Temporary;

		std::string first_failure;
		try {
			return { .path = ExtractEmbedded(req.audio, req.save_to), .ownership = ownership };
		}
		catch (const Error& e) {
			first_failure = e.what();
			LogDebug("Embedded cover unavailable: {}", first_failure);
		}

		if (!Subprocess::IsProgramAvailable(engine.ffmpeg))
			throw Error(ErrorKind::CoverNotFound, "Cover not found via embedded tags (" + first_failure + ") and ffmpeg not available for fallback");

		try {
			return { .path = ExtractWithEngine(req.audio, req.save_to, engine, req.verbose), .ownership = ownership };
		}
		catch (const Error& e) {
			throw Error(ErrorKind::CoverNotFound, "Cover not found via embedded tags (" + first_failure + "); ffmpeg fallback also failed: " + e.what());
		}
	}

	std::filesystem::path CoverResolver::ExtractEmbedded(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& save_to) {
		std::string why;
		std::optional<EmbeddedPicture> picture = ReadEmbeddedPicture(audio, why);
		if (!picture)
			throw Error(ErrorKind::CoverNotFound, why);

		if (save_to) {
			WriteBytes(*save_to, picture->data);
			LogDebug("Embedded cover ({}, {} bytes) written to {}", picture->mime, picture->data.size(), save_to->string());
			return *save_to;
		}

		ScratchFile scratch(ScratchFile::MakePath("cover", MimeToExtension(picture->mime), true));
		WriteBytes(scratch.Path(), picture->data);
		LogDebug("Embedded cover ({}, {} bytes) written to {}", picture->mime, picture->data.size(), scratch.Path().string());
		return scratch.Release();
	}

	std::filesystem::path CoverResolver::ExtractWithEngine(const std::filesystem::path& audio, const std::optional<std::filesystem::path>& save_to, const MediaEngine& engine, bool verbose) {
		std::optional<std::string> codec = MediaProbe::ProbeVideoCodec(engine, audio, "v:attached_pic");
		if (!codec)
			codec = MediaProbe::ProbeVideoCodec(engine, audio, "v:0");

		if (!codec)
			throw Error(ErrorKind::CoverNotFound, "No attached picture or video stream found");

		ScratchFile scratch;
		std::filesystem::path dest;
		if (save_to) {
			dest = *save_to;
		}
		else {
			scratch = ScratchFile(ScratchFile::MakePath("cover", CodecToExtension(*codec), true));
			dest = scratch.Path();
		}

		// re-encode instead of stream copy, the source may be a real video codec
		EngineRunner::Result res = EngineRunner::Run({
			engine.ffmpeg,
			"-nostdin", "-y",
			"-i", audio.string(),
			"-an",
			"-map", "0:v:0",
			"-frames:v", "1",
			dest.string()
		}, verbose);

		std::error_code ec;
		if (!res.Succeeded() || !std::filesystem::exists(dest, ec))
			throw Error(ErrorKind::CoverNotFound, "ffmpeg failed to extract attached picture or video frame");

		LogDebug("Extracted {} cover frame to {}", *codec, dest.string());

		if (scratch.Owns())
			return scratch.Release();
		return dest;
	}

	std::string_view CoverResolver::MimeToExtension(std::string_view mime) {
		if (mime == "image/jpeg" || mime == "image/jpg")
			return "jpg";
		if (mime == "image/png")
			return "png";
		if (mime == "image/webp")
			return "webp";
		return "bin";
	}

	std::string_view CoverResolver::CodecToExtension(std::string_view codec) {
		if (codec == "png")
			return "png";
		if (codec == "webp")
			return "webp";
		return "jpg";
	}

} // namespace vizcast
