// Created by block on 2026-10-19.

#include <libvizcast/Subprocess.hpp>
#include <libvizcast/Error.hpp>

#include <shared/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vizcast {

	namespace {

		enum class Redirect {
			Inherit,
			Null,
			Pipe
		};

		struct Fd {
			int fd = -1;

			Fd() = default;
			explicit Fd(int fd) : fd(fd) {}
			Fd(const Fd&) = delete;
			Fd& operator=(const Fd&) = delete;
			~Fd() { Close(); }

			void Close() {
				if (fd >= 0)
					::close(fd);
				fd = -1;
			}
		};

		void MakePipe(Fd& read_end, Fd& write_end) {
			int fds[2];
			if (::pipe2(fds, O_CLOEXEC) != 0)
				throw Error(ErrorKind::SubprocessSpawnFailed, std::format("Could not create pipe: {}", std::strerror(errno)));

			read_end.fd = fds[0];
			write_end.fd = fds[1];
		}

		ssize_t ReadRetrying(int fd, void* buf, std::size_t len) {
			ssize_t n;
			do {
				n = ::read(fd, buf, len);
			} while (n < 0 && errno == EINTR);
			return n;
		}

		int WaitForExit(pid_t pid) {
			int status = 0;
			while (::waitpid(pid, &status, 0) < 0) {
				if (errno != EINTR)
					return -1;
			}

			if (WIFEXITED(status))
				return WEXITSTATUS(status);
			if (WIFSIGNALED(status))
				return 128 + WTERMSIG(status);

			return -1;
		}

		// Only async-signal-safe calls between fork() and exec().
		[[noreturn]] void ChildExec(char* const* args, Redirect out, Redirect err, int pipe_fd, int null_fd, int status_fd) {
			::dup2(null_fd, STDIN_FILENO);

			auto apply = [&](Redirect r, int target) {
				if (r == Redirect::Null)
					::dup2(null_fd, target);
				else if (r == Redirect::Pipe)
					::dup2(pipe_fd, target);
			};
			apply(out, STDOUT_FILENO);
			apply(err, STDERR_FILENO);

			::execvp(args[0], args);

			int exec_errno = errno;
			(void)!::write(status_fd, &exec_errno, sizeof(exec_errno));
			::_exit(127);
		}

		Subprocess::Result Run(const std::vector<std::string>& argv, Redirect out, Redirect err,
							   const std::function<void(std::string_view chunk)>& on_chunk) {
			if (argv.empty())
				throw Error(ErrorKind::SubprocessSpawnFailed, "No program given to run");

			std::vector<char*> args;
			args.reserve(argv.size() + 1);
			for (const std::string& arg : argv)
				args.push_back(const_cast<char*>(arg.c_str()));
			args.push_back(nullptr);

			Fd null_fd(::open("/dev/null", O_RDWR | O_CLOEXEC));
			if (null_fd.fd < 0)
				throw Error(ErrorKind::SubprocessSpawnFailed, std::format("Could not open /dev/null: {}", std::strerror(errno)));

			// exec failures come back through this pipe; a clean exec just closes it
			Fd status_read, status_write;
			MakePipe(status_read, status_write);

			Fd data_read, data_write;
			const bool piped = out == Redirect::Pipe || err == Redirect::Pipe;
			if (piped)
				MakePipe(data_read, data_write);

			LogDebug("Running: {}", Subprocess::FormatCommandLine(argv));

			pid_t pid = ::fork();
			if (pid < 0)
				throw Error(ErrorKind::SubprocessSpawnFailed, std::format("Could not fork for {}: {}", argv[0], std::strerror(errno)));

			if (pid == 0)
				ChildExec(args.data(), out, err, data_write.fd, null_fd.fd, status_write.fd);

			status_write.Close();
			data_write.Close();

			int exec_errno = 0;
			if (ReadRetrying(status_read.fd, &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno)) {
				WaitForExit(pid);
				throw Error(ErrorKind::SubprocessSpawnFailed, std::format("Could not run {}: {}", argv[0], std::strerror(exec_errno)));
			}

			if (piped) {
				char buffer[4096];
				ssize_t n;
				while ((n = ReadRetrying(data_read.fd, buffer, sizeof(buffer))) > 0)
					on_chunk(std::string_view(buffer, static_cast<std::size_t>(n)));
			}

			return { .exit_code = WaitForExit(pid) };
		}

	} // namespace

	void LineSplitter::Feed(std::string_view chunk, const Subprocess::LineCallback& on_line) {
		for (char c : chunk) {
			if (c == '\n' || c == '\r') {
				if (!pending.empty())
					on_line(pending);
				pending.clear();
				continue;
			}

			pending.push_back(c);
		}
	}

	void LineSplitter::Finish(const Subprocess::LineCallback& on_line) {
		if (!pending.empty())
			on_line(pending);
		pending.clear();
	}

	Subprocess::Result Subprocess::Capture(const std::vector<std::string>& argv) {
		std::string output;
		Result result = Run(argv, Redirect::Pipe, Redirect::Null, [&](std::string_view chunk) {
			output.append(chunk);
		});

		result.output = std::move(output);
		return result;
	}

	Subprocess::Result Subprocess::Stream(const std::vector<std::string>& argv, const LineCallback& on_line) {
		LineSplitter splitter;
		Result result = Run(argv, Redirect::Null, Redirect::Pipe, [&](std::string_view chunk) {
			splitter.Feed(chunk, on_line);
		});

		splitter.Finish(on_line);
		return result;
	}

	Subprocess::Result Subprocess::Passthrough(const std::vector<std::string>& argv) {
		return Run(argv, Redirect::Inherit, Redirect::Inherit, {});
	}

	bool Subprocess::IsProgramAvailable(const std::string& program) {
		try {
			Run({ program, "-version" }, Redirect::Null, Redirect::Null, {});
			return true;
		}
		catch (const Error& err) {
			LogDebug("{} is not available: {}", program, err.what());
			return false;
		}
	}

	std::string Subprocess::FormatCommandLine(const std::vector<std::string>& argv) {
		std::string line;
		for (const std::string& arg : argv) {
			if (!line.empty())
				line += ' ';

			if (arg.find_first_of(" \t\"';[]") != std::string::npos)
				line += std::format("\"{}\"", arg);
			else
				line += arg;
		}
		return line;
	}

} // namespace vizcast
