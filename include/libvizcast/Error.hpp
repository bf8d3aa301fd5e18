// Created by block on 2026-10-19.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vizcast {

	enum class ErrorKind : std::uint8_t {
		InputNotFound,
		CoverNotFound,
		SubprocessSpawnFailed,
		SubprocessExecutionFailed,
		OutputValidationFailed,
		ConfigurationError
	};

	constexpr std::string_view ErrorKindToString(ErrorKind kind) {
		switch (kind) {
			case ErrorKind::InputNotFound: return "InputNotFound";
			case ErrorKind::CoverNotFound: return "CoverNotFound";
			case ErrorKind::SubprocessSpawnFailed: return "SubprocessSpawnFailed";
			case ErrorKind::SubprocessExecutionFailed: return "SubprocessExecutionFailed";
			case ErrorKind::OutputValidationFailed: return "OutputValidationFailed";
			case ErrorKind::ConfigurationError: return "ConfigurationError";
		}
		return "???";
	}

	/// Thrown for every library failure. what() is the message shown to the user.
	class Error : public std::runtime_error {
	public:
		Error(ErrorKind kind, const std::string& message)
			: std::runtime_error(message), kind(kind) {}

		ErrorKind Kind() const { return kind; }

	private:
		ErrorKind kind;
	};

} // namespace vizcast
