// Created by block on 2026-10-19.

#include <shared/StdoutSink.hpp>

#include <iostream>

namespace vizcast {

	StdoutSink& StdoutSink::The() {
		static StdoutSink the;
		return the;
	}

	void StdoutSink::OutputMessage(const Logger::MessageData& data) {
		switch (data.severity) {
			case Logger::MessageSeverity::Info:
				std::cout << data.message << '\n';
				break;
			case Logger::MessageSeverity::Debug:
				std::cout << "[Debug] " << data.message << '\n';
				break;
			case Logger::MessageSeverity::Warning:
			case Logger::MessageSeverity::Error:
				// keep stdout clean for progress lines
				std::cout.flush();
				std::cerr << '[' << Logger::SeverityToString(data.severity) << "] " << data.message << std::endl;
				break;
		}
	}

	void LoggerAttachStdout() {
		Logger::The().AttachSink(StdoutSink::The());
	}

} // namespace vizcast
