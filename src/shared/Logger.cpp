// Created by block on 2026-10-19.

#include <shared/Logger.hpp>

#include <algorithm>

namespace vizcast {

	Logger& Logger::The() {
		static Logger the;
		return the;
	}

	void Logger::AttachSink(Sink& sink) {
		if (std::ranges::find(sinks, &sink) != sinks.end())
			return;

		sinks.push_back(&sink);
	}

	void Logger::DetachSink(Sink& sink) {
		std::erase(sinks, &sink);
	}

	void Logger::VOut(MessageSeverity severity, std::string_view format, std::format_args args) {
		if (severity < min_severity)
			return;

		MessageData data {
			.time = std::chrono::system_clock::now(),
			.severity = severity,
			.message = std::vformat(format, args)
		};

		for (Sink* sink : sinks)
			sink->OutputMessage(data);
	}

} // namespace vizcast
