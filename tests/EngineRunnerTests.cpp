// Created by block on 2026-10-19.

#include <catch2/catch.hpp>

#include <libvizcast/EngineRunner.hpp>

#include <shared/Logger.hpp>

#include <vector>

using namespace vizcast;
using LineKind = EngineRunner::LineKind;

TEST_CASE("Diagnostic lines are classified", "[engine]") {
	CHECK(EngineRunner::ClassifyLine("Error initializing filter 'showwaves'") == LineKind::Error);
	CHECK(EngineRunner::ClassifyLine("[in#0] error while decoding") == LineKind::Error);
	CHECK(EngineRunner::ClassifyLine("frame=  120 fps=60 q=-1.0 size=  256KiB time=00:00:04.80") == LineKind::Progress);
	CHECK(EngineRunner::ClassifyLine("size=  10KiB time=00:00:01.00 bitrate=") == LineKind::Progress);
	CHECK(EngineRunner::ClassifyLine("Stream mapping:") == LineKind::Other);

	// an error marker wins over progress
	CHECK(EngineRunner::ClassifyLine("frame=1 Error") == LineKind::Error);
	// case sensitive on purpose, "ERROR" is not a marker
	CHECK(EngineRunner::ClassifyLine("ERROR") == LineKind::Other);
}

TEST_CASE("An error marker fails a clean exit", "[engine]") {
	auto res = EngineRunner::Run({ "sh", "-c", "printf 'frame=1\\rframe=2\\r' >&2; echo 'Error opening output file' >&2; exit 0" }, false);

	CHECK(res.exit_code == 0);
	CHECK(res.saw_error_marker);
	CHECK(res.first_error == "Error opening output file");
	CHECK_FALSE(res.Succeeded());
}

TEST_CASE("Progress alone is a success", "[engine]") {
	auto res = EngineRunner::Run({ "sh", "-c", "printf 'frame=1\\rtime=00:00:01\\n' >&2" }, false);
	CHECK(res.Succeeded());
	CHECK_FALSE(res.saw_error_marker);
}

TEST_CASE("Non-zero exit fails even without markers", "[engine]") {
	CHECK_FALSE(EngineRunner::Run({ "sh", "-c", "exit 1" }, false).Succeeded());
}

TEST_CASE("Verbose mode only trusts the exit status", "[engine]") {
	auto res = EngineRunner::Run({ "sh", "-c", "echo 'Error but fine' >&2; exit 0" }, true);
	CHECK(res.Succeeded());
	CHECK_FALSE(res.saw_error_marker);
}

namespace {

	struct CapturingSink : Logger::Sink {
		std::vector<Logger::MessageData> messages;

		void OutputMessage(const Logger::MessageData& data) override { messages.push_back(data); }
	};

} // namespace

TEST_CASE("Engine error lines go through the logger", "[engine]") {
	CapturingSink sink;
	Logger::The().AttachSink(sink);
	auto res = EngineRunner::Run({ "sh", "-c", "printf 'frame=1\\r' >&2; echo 'Error opening output file' >&2" }, false);
	Logger::The().DetachSink(sink);

	CHECK(res.saw_error_marker);

	std::vector<std::string> errors;
	for (const auto& msg : sink.messages) {
		if (msg.severity == Logger::MessageSeverity::Error)
			errors.push_back(msg.message);
	}

	REQUIRE(errors.size() == 1);
	CHECK(errors[0] == "FFmpeg error: Error opening output file");
}
