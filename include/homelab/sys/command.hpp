/* SPDX-License-Identifier: MIT */
/*
 * Homelab Command Runner
 * External program execution capability (fork/exec) and a scripted double
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <csignal>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace homelab {

    using namespace dp;

    namespace sys {

        // =============================================================================
        // Command Output
        // =============================================================================

        struct CommandOutput {
            i32 exit_status = 0;
            String output; // stdout and stderr combined

            CommandOutput() = default;
            CommandOutput(i32 status, String out) : exit_status(status), output(std::move(out)) {}

            [[nodiscard]] auto success() const -> boolean { return exit_status == 0; }

            auto members() noexcept { return std::tie(exit_status, output); }
            auto members() const noexcept { return std::tie(exit_status, output); }
        };

        // =============================================================================
        // Command Runner Interface
        // =============================================================================

        class CommandRunner {
          public:
            virtual ~CommandRunner() = default;

            // Run a program with arguments, feeding stdin_data. Fails only when the
            // program could not be started; a non-zero exit is reported in the output.
            virtual auto run(const String &program, const Vector<String> &args, const String &stdin_data)
                -> Res<CommandOutput> = 0;

            auto run(const String &program, const Vector<String> &args) -> Res<CommandOutput> {
                return run(program, args, String());
            }
        };

        // Run and require exit status 0. Output is trimmed.
        [[nodiscard]] inline auto run_checked(CommandRunner &runner, const String &program, const Vector<String> &args,
                                              const String &stdin_data = String()) -> Res<String> {
            auto out = runner.run(program, args, stdin_data);
            if (out.is_err()) {
                return result::err(out.error());
            }
            if (!out.value().success()) {
                return result::err(err::command(program, str::trim(out.value().output)));
            }
            return result::ok(str::trim(out.value().output));
        }

        // =============================================================================
        // Exec Runner
        // =============================================================================

        class ExecCommandRunner : public CommandRunner {
          public:
            ExecCommandRunner() = default;

            using CommandRunner::run;

            auto run(const String &program, const Vector<String> &args, const String &stdin_data)
                -> Res<CommandOutput> override {
                int in_pipe[2];
                int out_pipe[2];
                if (::pipe(in_pipe) != 0) {
                    return result::err(err::io("Failed to create stdin pipe"));
                }
                if (::pipe(out_pipe) != 0) {
                    ::close(in_pipe[0]);
                    ::close(in_pipe[1]);
                    return result::err(err::io("Failed to create stdout pipe"));
                }

                Vector<char *> argv;
                argv.push_back(const_cast<char *>(program.c_str()));
                for (const auto &a : args) {
                    argv.push_back(const_cast<char *>(a.c_str()));
                }
                argv.push_back(nullptr);

                echo::debug("exec: ", program.c_str());

                pid_t pid = ::fork();
                if (pid < 0) {
                    ::close(in_pipe[0]);
                    ::close(in_pipe[1]);
                    ::close(out_pipe[0]);
                    ::close(out_pipe[1]);
                    return result::err(err::io("fork failed"));
                }

                if (pid == 0) {
                    ::dup2(in_pipe[0], STDIN_FILENO);
                    ::dup2(out_pipe[1], STDOUT_FILENO);
                    ::dup2(out_pipe[1], STDERR_FILENO);
                    ::close(in_pipe[0]);
                    ::close(in_pipe[1]);
                    ::close(out_pipe[0]);
                    ::close(out_pipe[1]);
                    ::execvp(program.c_str(), argv.data());
                    ::_exit(127);
                }

                ::close(in_pipe[0]);
                ::close(out_pipe[1]);

                // Interleave writing stdin and draining stdout so neither side blocks
                auto *old_handler = std::signal(SIGPIPE, SIG_IGN);
                usize written = 0;
                int in_fd = in_pipe[1];
                if (stdin_data.empty()) {
                    ::close(in_fd);
                    in_fd = -1;
                }

                String output;
                char buf[4096];
                boolean out_open = true;
                while (out_open) {
                    struct pollfd fds[2];
                    nfds_t nfds = 0;
                    fds[nfds++] = {out_pipe[0], POLLIN, 0};
                    if (in_fd >= 0) {
                        fds[nfds++] = {in_fd, POLLOUT, 0};
                    }
                    if (::poll(fds, nfds, -1) < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        break;
                    }

                    if (in_fd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
                        ssize_t n = ::write(in_fd, stdin_data.c_str() + written, stdin_data.size() - written);
                        if (n > 0) {
                            written += static_cast<usize>(n);
                        }
                        if (n < 0 || written >= stdin_data.size()) {
                            ::close(in_fd);
                            in_fd = -1;
                        }
                    }

                    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
                        if (n > 0) {
                            output += String(buf, static_cast<usize>(n));
                        } else if (n == 0 || errno != EINTR) {
                            out_open = false;
                        }
                    }
                }
                if (in_fd >= 0) {
                    ::close(in_fd);
                }
                ::close(out_pipe[0]);
                std::signal(SIGPIPE, old_handler);

                int status = 0;
                while (::waitpid(pid, &status, 0) < 0) {
                    if (errno != EINTR) {
                        return result::err(err::io("waitpid failed"));
                    }
                }

                i32 exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
                if (exit_status == 127 && output.empty()) {
                    return result::err(err::not_found(String("command not found: ") + program));
                }
                return result::ok(CommandOutput(exit_status, output));
            }
        };

        // =============================================================================
        // Fake Runner (deterministic double)
        // =============================================================================

        struct RecordedCall {
            String program;
            Vector<String> args;
            String stdin_data;

            // Program and args joined by spaces
            [[nodiscard]] auto command_line() const -> String {
                String line = program;
                for (const auto &a : args) {
                    line += " ";
                    line += a;
                }
                return line;
            }
        };

        // Responses are matched by command-line prefix, latest first; unmatched
        // commands succeed with empty output.
        class FakeCommandRunner : public CommandRunner {
          private:
            Vector<Pair<String, CommandOutput>> responses_;
            Vector<String> missing_;
            Vector<RecordedCall> calls_;

          public:
            FakeCommandRunner() = default;

            using CommandRunner::run;

            auto respond(const String &prefix, i32 exit_status, const String &output) -> void {
                responses_.push_back({prefix, CommandOutput(exit_status, output)});
            }

            // Program fails to start
            auto make_missing(const String &program) -> void { missing_.push_back(program); }

            [[nodiscard]] auto calls() const -> const Vector<RecordedCall> & { return calls_; }

            [[nodiscard]] auto was_called(const String &prefix) const -> boolean {
                for (const auto &call : calls_) {
                    if (str::starts_with(call.command_line(), prefix.c_str())) {
                        return true;
                    }
                }
                return false;
            }

            auto run(const String &program, const Vector<String> &args, const String &stdin_data)
                -> Res<CommandOutput> override {
                RecordedCall call{program, args, stdin_data};
                calls_.push_back(call);

                for (const auto &name : missing_) {
                    if (name == program) {
                        return result::err(err::not_found(String("command not found: ") + program));
                    }
                }

                String line = call.command_line();
                for (usize i = responses_.size(); i > 0; --i) {
                    const auto &entry = responses_[i - 1];
                    if (str::starts_with(line, entry.first.c_str())) {
                        return result::ok(entry.second);
                    }
                }
                return result::ok(CommandOutput(0, String()));
            }
        };

    } // namespace sys

} // namespace homelab
