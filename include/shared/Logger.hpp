// Created by block on 2026-10-19.

#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vizcast {

	/// Process-global logger. Messages are formatted once and handed to every attached sink.
	struct Logger {
		enum class MessageSeverity : std::uint8_t {
			Debug,
			Info,
			Warning,
			Error
		};

		static constexpr std::string_view SeverityToString(MessageSeverity sev) {
			switch (sev) {
				case MessageSeverity::Debug: return "Debug";
				case MessageSeverity::Info: return "Info";
				case MessageSeverity::Warning: return "Warning";
				case MessageSeverity::Error: return "Error";
			}
			return "???";
		}

		struct MessageData {
			std::chrono::system_clock::time_point time;
			MessageSeverity severity;
			std::string message;
		};

		/// Anything that wants to receive log messages.
		struct Sink {
			virtual ~Sink() = default;
			virtual void OutputMessage(const MessageData& data) = 0;
		};

		static Logger& The();

		void AttachSink(Sink& sink);
		void DetachSink(Sink& sink);

		void SetMinimumSeverity(MessageSeverity sev) { min_severity = sev; }
		MessageSeverity GetMinimumSeverity() const { return min_severity; }

		template <class... Args>
		void Debug(std::format_string<Args...> fmt, Args&&... args) {
			VOut(MessageSeverity::Debug, fmt.get(), std::make_format_args(args...));
		}

		template <class... Args>
		void Info(std::format_string<Args...> fmt, Args&&... args) {
			VOut(MessageSeverity::Info, fmt.get(), std::make_format_args(args...));
		}

		template <class... Args>
		void Warning(std::format_string<Args...> fmt, Args&&... args) {
			VOut(MessageSeverity::Warning, fmt.get(), std::make_format_args(args...));
		}

		template <class... Args>
		void Error(std::format_string<Args...> fmt, Args&&... args) {
			VOut(MessageSeverity::Error, fmt.get(), std::make_format_args(args...));
		}

	   private:
		void VOut(MessageSeverity severity, std::string_view format, std::format_args args);

		std::vector<Sink*> sinks {};
		MessageSeverity min_severity = MessageSeverity::Info;
	};

	template <class... Args>
	inline void LogDebug(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Debug(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogInfo(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Info(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogWarning(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Warning(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogError(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Error(fmt, std::forward<Args>(args)...);
	}

} // namespace vizcast
