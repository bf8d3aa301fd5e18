// Created by block on 2026-10-19.

#pragma once

#include <shared/Logger.hpp>

namespace vizcast {

	/// A logger sink implementation that prints to standard output.
	/// Warnings and errors go to standard error instead.
	struct StdoutSink : public Logger::Sink {
		static StdoutSink& The();

		virtual void OutputMessage(const Logger::MessageData& data) override;
	};

	/// Attach the stdout logger sink to the global logger.
	void LoggerAttachStdout();

} // namespace vizcast
