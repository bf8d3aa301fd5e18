// Created by block on 2026-10-19.

#include <vizcast-cli/Options.hpp>
#include <vizcast-cli/Processes.hpp>

#include <libvizcast/libvizcast.hpp>

#include <shared/Logger.hpp>
#include <shared/StdoutSink.hpp>

#include <cstdlib>
#include <exception>

#include "gitversion.h"

int main(int argc, char** argv) {
	vizcast::LoggerAttachStdout();

	try {
		int ret = vizcast::cli::Options::ParseArgs(argc, argv);
		if (ret != EXIT_SUCCESS)
			return ret;

		if (vizcast::cli::Options::options.verbose)
			vizcast::Logger::The().SetMinimumSeverity(vizcast::Logger::MessageSeverity::Debug);
		vizcast::MediaProbe::SetLibavVerbose(vizcast::cli::Options::options.verbose);

		vizcast::LogDebug("vizcast-cli {}", vizcast::version::fullTag);
		vizcast::LogDebug("Built {} {}", __DATE__, __TIME__);

#ifdef VIZCAST_DEBUG
		vizcast::cli::Options::PrintArgs();
#endif

		return vizcast::cli::Processes::The().ProcessBatch();
	}
	catch (const std::exception& err) {
		vizcast::LogError("{}", err.what());
		return EXIT_FAILURE;
	}
}
