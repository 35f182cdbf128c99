/* SPDX-License-Identifier: MIT */
/*
 * Homelab Time Utilities
 * Wall-clock helpers for config headers and export file names
 */

#pragma once

#include <datapod/datapod.hpp>

#include <ctime>

namespace homelab {

    using namespace dp;

    namespace time {

        // Get current timestamp in nanoseconds
        inline auto now_ns() -> i64 { return dp::Stamp<u8>::now(); }

        // Seconds since the Unix epoch
        inline auto now_unix() -> i64 { return now_ns() / 1'000'000'000; }

        // Format seconds since epoch as RFC3339 in UTC (2024-01-02T03:04:05Z)
        inline auto format_rfc3339(i64 unix_secs) -> String {
            std::time_t t = static_cast<std::time_t>(unix_secs);
            std::tm tm_utc{};
            if (gmtime_r(&t, &tm_utc) == nullptr) {
                return String("1970-01-01T00:00:00Z");
            }
            char buf[32];
            usize n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
            return String(buf, n);
        }

        inline auto now_rfc3339() -> String { return format_rfc3339(now_unix()); }

    } // namespace time

} // namespace homelab
