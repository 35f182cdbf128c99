/* SPDX-License-Identifier: MIT */
/*
 * Homelab Core Types
 * String helpers, constants and step states on datapod primitives
 */

#pragma once

#include <homelab/core/result.hpp>

#include <datapod/datapod.hpp>

#include <type_traits>

namespace homelab {

    using namespace dp;

    // =============================================================================
    // Number to String Helpers (avoid std::to_string)
    // =============================================================================

    namespace detail {
        template <typename T> inline auto num_to_string(T value) -> String {
            if (value == 0) {
                return String("0");
            }

            boolean negative = false;
            if constexpr (std::is_signed_v<T>) {
                if (value < 0) {
                    negative = true;
                    value = -value;
                }
            }

            char buf[32];
            usize idx = 31;
            buf[idx] = '\0';

            while (value > 0 && idx > 0) {
                --idx;
                buf[idx] = '0' + static_cast<char>(value % 10);
                value /= 10;
            }

            if (negative && idx > 0) {
                --idx;
                buf[idx] = '-';
            }

            return String(&buf[idx]);
        }
    } // namespace detail

    inline auto to_str(u16 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u32 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(u64 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(i32 v) -> String { return detail::num_to_string(v); }
    inline auto to_str(i64 v) -> String { return detail::num_to_string(v); }

    // Strict decimal parse: digits only, no sign, bounded by max
    [[nodiscard]] inline auto parse_uint(const String &s, u64 max) -> Res<u64> {
        if (s.empty()) {
            return result::err(err::invalid("Empty number"));
        }
        if (s.size() > 20) {
            return result::err(err::invalid("Number too long"));
        }
        u64 value = 0;
        for (usize i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (c < '0' || c > '9') {
                return result::err(err::invalid(String("Invalid number: ") + s));
            }
            value = value * 10 + static_cast<u64>(c - '0');
            if (value > max) {
                return result::err(err::invalid(String("Number out of range: ") + s));
            }
        }
        return result::ok(value);
    }

    // =============================================================================
    // String Helpers
    // =============================================================================

    namespace str {

        inline auto is_space(char c) -> boolean { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

        [[nodiscard]] inline auto trim(const String &s) -> String {
            usize start = 0;
            while (start < s.size() && is_space(s[start])) {
                ++start;
            }
            usize end = s.size();
            while (end > start && is_space(s[end - 1])) {
                --end;
            }
            return s.substr(start, end - start);
        }

        [[nodiscard]] inline auto to_lower(const String &s) -> String {
            String out;
            out.reserve(s.size());
            for (usize i = 0; i < s.size(); ++i) {
                char c = s[i];
                if (c >= 'A' && c <= 'Z') {
                    c = static_cast<char>(c - 'A' + 'a');
                }
                out.push_back(c);
            }
            return out;
        }

        [[nodiscard]] inline auto starts_with(const String &s, const char *prefix) -> boolean {
            usize i = 0;
            for (; prefix[i] != '\0'; ++i) {
                if (i >= s.size() || s[i] != prefix[i]) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] inline auto contains_any(const String &s, const char *chars) -> boolean {
            for (usize i = 0; i < s.size(); ++i) {
                for (usize j = 0; chars[j] != '\0'; ++j) {
                    if (s[i] == chars[j]) {
                        return true;
                    }
                }
            }
            return false;
        }

        // Split on a separator, trimming each part and dropping empty ones
        [[nodiscard]] inline auto split(const String &s, char sep) -> Vector<String> {
            Vector<String> parts;
            usize start = 0;
            for (usize i = 0; i <= s.size(); ++i) {
                if (i == s.size() || s[i] == sep) {
                    String part = trim(s.substr(start, i - start));
                    if (!part.empty()) {
                        parts.push_back(part);
                    }
                    start = i + 1;
                }
            }
            return parts;
        }

        [[nodiscard]] inline auto join(const Vector<String> &parts, const char *sep) -> String {
            String out;
            for (usize i = 0; i < parts.size(); ++i) {
                if (i > 0) {
                    out += sep;
                }
                out += parts[i];
            }
            return out;
        }

    } // namespace str

    // =============================================================================
    // Constants
    // =============================================================================

    inline constexpr u16 DEFAULT_LISTEN_PORT = 51820;
    inline constexpr i32 DEFAULT_KEEPALIVE = 25;
    inline constexpr const char *DEFAULT_WG_INTERFACE = "wg0";
    inline constexpr const char *DEFAULT_WG_ADDRESS = "10.253.0.1/24";
    inline constexpr const char *FALLBACK_HOME = "/var/home/core";

    // =============================================================================
    // Step State
    // =============================================================================

    enum class StepState : u8 {
        Pending = 0,
        Running = 1,
        Completed = 2,
        Failed = 3,
    };

    [[nodiscard]] inline auto step_state_to_string(StepState state) -> const char * {
        switch (state) {
        case StepState::Pending:
            return "pending";
        case StepState::Running:
            return "running";
        case StepState::Completed:
            return "completed";
        case StepState::Failed:
            return "failed";
        default:
            return "unknown";
        }
    }

} // namespace homelab
