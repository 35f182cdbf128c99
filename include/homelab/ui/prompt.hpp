/* SPDX-License-Identifier: MIT */
/*
 * Homelab Prompter
 * Interactive prompt capability: terminal implementation and scripted double
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace homelab {

    using namespace dp;

    namespace ui {

        // =============================================================================
        // Prompter Interface
        // =============================================================================

        class Prompter {
          public:
            virtual ~Prompter() = default;

            virtual auto confirm(const String &question, boolean default_val) -> Res<boolean> = 0;

            // Free text. An empty answer yields the default.
            virtual auto input(const String &prompt, const String &default_val) -> Res<String> = 0;

            virtual auto password(const String &prompt) -> Res<String> = 0;

            // Index into options
            virtual auto select(const String &prompt, const Vector<String> &options, usize default_idx)
                -> Res<usize> = 0;

            // Indices into options, in option order
            virtual auto multi_select(const String &prompt, const Vector<String> &options) -> Res<Vector<usize>> = 0;

            [[nodiscard]] virtual auto is_non_interactive() const -> boolean = 0;
        };

        // =============================================================================
        // Terminal Prompter
        // =============================================================================

        class TerminalPrompter : public Prompter {
          private:
            boolean non_interactive_ = false;

            auto read_line(std::string &line) -> VoidRes {
                if (!std::getline(std::cin, line)) {
                    return result::err(err::io("stdin closed while waiting for input"));
                }
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return result::ok();
            }

          public:
            explicit TerminalPrompter(boolean non_interactive = false) : non_interactive_(non_interactive) {}

            [[nodiscard]] auto is_non_interactive() const -> boolean override { return non_interactive_; }

            auto confirm(const String &question, boolean default_val) -> Res<boolean> override {
                if (non_interactive_) {
                    return result::ok(default_val);
                }

                while (true) {
                    std::cout << question.c_str() << " [" << (default_val ? "Y/n" : "y/N") << "]: " << std::flush;
                    std::string line;
                    auto res = read_line(line);
                    if (res.is_err()) {
                        return result::err(res.error());
                    }
                    String answer = str::to_lower(str::trim(String(line.c_str())));
                    if (answer.empty()) {
                        return result::ok(default_val);
                    }
                    if (answer == "y" || answer == "yes") {
                        return result::ok(true);
                    }
                    if (answer == "n" || answer == "no") {
                        return result::ok(false);
                    }
                    std::cout << "Please answer y or n.\n";
                }
            }

            auto input(const String &prompt, const String &default_val) -> Res<String> override {
                if (non_interactive_) {
                    if (default_val.empty()) {
                        return result::err(err::invalid(String("No value for '") + prompt + "' in non-interactive mode"));
                    }
                    return result::ok(default_val);
                }

                std::cout << prompt.c_str();
                if (!default_val.empty()) {
                    std::cout << " [" << default_val.c_str() << "]";
                }
                std::cout << ": " << std::flush;

                std::string line;
                auto res = read_line(line);
                if (res.is_err()) {
                    return result::err(res.error());
                }
                String answer = str::trim(String(line.c_str()));
                if (answer.empty()) {
                    return result::ok(default_val);
                }
                return result::ok(answer);
            }

            auto password(const String &prompt) -> Res<String> override {
                if (non_interactive_) {
                    return result::err(err::invalid("Password prompt in non-interactive mode"));
                }

                std::cout << prompt.c_str() << ": " << std::flush;

                termios old_term{};
                boolean restore = ::tcgetattr(STDIN_FILENO, &old_term) == 0;
                if (restore) {
                    termios silent = old_term;
                    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
                    ::tcsetattr(STDIN_FILENO, TCSANOW, &silent);
                }

                std::string line;
                auto res = read_line(line);

                if (restore) {
                    ::tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
                }
                std::cout << "\n";

                if (res.is_err()) {
                    return result::err(res.error());
                }
                return result::ok(String(line.c_str()));
            }

            auto select(const String &prompt, const Vector<String> &options, usize default_idx)
                -> Res<usize> override {
                if (options.empty()) {
                    return result::err(err::invalid("select called with no options"));
                }
                if (default_idx >= options.size()) {
                    default_idx = 0;
                }
                if (non_interactive_) {
                    return result::ok(default_idx);
                }

                std::cout << prompt.c_str() << ":\n";
                for (usize i = 0; i < options.size(); ++i) {
                    std::cout << "  " << (i + 1) << ") " << options[i].c_str();
                    if (i == default_idx) {
                        std::cout << " (default)";
                    }
                    std::cout << "\n";
                }

                while (true) {
                    std::cout << "Choice [" << (default_idx + 1) << "]: " << std::flush;
                    std::string line;
                    auto res = read_line(line);
                    if (res.is_err()) {
                        return result::err(res.error());
                    }
                    String answer = str::trim(String(line.c_str()));
                    if (answer.empty()) {
                        return result::ok(default_idx);
                    }
                    auto choice = parse_uint(answer, options.size());
                    if (choice.is_ok() && choice.value() >= 1) {
                        return result::ok(static_cast<usize>(choice.value() - 1));
                    }
                    std::cout << "Enter a number between 1 and " << options.size() << ".\n";
                }
            }

            auto multi_select(const String &prompt, const Vector<String> &options) -> Res<Vector<usize>> override {
                Vector<usize> chosen;
                if (non_interactive_ || options.empty()) {
                    return result::ok(chosen);
                }

                std::cout << prompt.c_str() << " (space-separated numbers, empty for none):\n";
                for (usize i = 0; i < options.size(); ++i) {
                    std::cout << "  " << (i + 1) << ") " << options[i].c_str() << "\n";
                }
                std::cout << "Choices: " << std::flush;

                std::string line;
                auto res = read_line(line);
                if (res.is_err()) {
                    return result::err(res.error());
                }

                Vector<boolean> picked;
                for (usize i = 0; i < options.size(); ++i) {
                    picked.push_back(false);
                }
                for (const auto &token : str::split(String(line.c_str()), ' ')) {
                    auto n = parse_uint(token, options.size());
                    if (n.is_err() || n.value() == 0) {
                        return result::err(err::invalid(String("Invalid selection: ") + token));
                    }
                    picked[static_cast<usize>(n.value() - 1)] = true;
                }
                for (usize i = 0; i < options.size(); ++i) {
                    if (picked[i]) {
                        chosen.push_back(i);
                    }
                }
                return result::ok(chosen);
            }
        };

        // =============================================================================
        // Scripted Prompter (deterministic double)
        // =============================================================================

        // Answers are consumed in order. An empty answer, or running out of answers,
        // takes the default (possibly empty). Every prompt text is recorded.
        class ScriptedPrompter : public Prompter {
          private:
            Vector<String> answers_;
            usize next_ = 0;
            Vector<String> asked_;
            boolean non_interactive_ = false;

            auto next_answer(const String &prompt) -> Optional<String> {
                asked_.push_back(prompt);
                if (next_ >= answers_.size()) {
                    return nullopt;
                }
                String answer = answers_[next_++];
                if (answer.empty()) {
                    return nullopt;
                }
                return answer;
            }

          public:
            ScriptedPrompter() = default;
            explicit ScriptedPrompter(Vector<String> answers) : answers_(std::move(answers)) {}

            auto push(const String &answer) -> void { answers_.push_back(answer); }
            auto set_non_interactive(boolean v) -> void { non_interactive_ = v; }

            [[nodiscard]] auto asked() const -> const Vector<String> & { return asked_; }
            [[nodiscard]] auto remaining() const -> usize { return answers_.size() - next_; }

            [[nodiscard]] auto was_asked(const char *fragment) const -> boolean {
                for (const auto &p : asked_) {
                    if (p.find(fragment) != String::npos) {
                        return true;
                    }
                }
                return false;
            }

            [[nodiscard]] auto is_non_interactive() const -> boolean override { return non_interactive_; }

            auto confirm(const String &question, boolean default_val) -> Res<boolean> override {
                auto answer = next_answer(question);
                if (!answer.has_value()) {
                    return result::ok(default_val);
                }
                String a = str::to_lower(answer.value());
                return result::ok(a == "y" || a == "yes" || a == "true");
            }

            auto input(const String &prompt, const String &default_val) -> Res<String> override {
                auto answer = next_answer(prompt);
                if (answer.has_value()) {
                    return result::ok(answer.value());
                }
                return result::ok(default_val);
            }

            auto password(const String &prompt) -> Res<String> override {
                auto answer = next_answer(prompt);
                if (!answer.has_value()) {
                    return result::err(err::invalid(String("No scripted answer for '") + prompt + "'"));
                }
                return result::ok(answer.value());
            }

            // Answer is the option text
            auto select(const String &prompt, const Vector<String> &options, usize default_idx)
                -> Res<usize> override {
                auto answer = next_answer(prompt);
                if (!answer.has_value()) {
                    return result::ok(default_idx < options.size() ? default_idx : 0);
                }
                for (usize i = 0; i < options.size(); ++i) {
                    if (options[i] == answer.value()) {
                        return result::ok(i);
                    }
                }
                return result::err(err::invalid(String("Scripted answer is not an option: ") + answer.value()));
            }

            // Answer is space-separated option texts
            auto multi_select(const String &prompt, const Vector<String> &options) -> Res<Vector<usize>> override {
                Vector<usize> chosen;
                auto answer = next_answer(prompt);
                if (!answer.has_value()) {
                    return result::ok(chosen);
                }
                auto wanted = str::split(answer.value(), ' ');
                for (usize i = 0; i < options.size(); ++i) {
                    for (const auto &w : wanted) {
                        if (options[i] == w) {
                            chosen.push_back(i);
                            break;
                        }
                    }
                }
                return result::ok(chosen);
            }
        };

    } // namespace ui

} // namespace homelab
