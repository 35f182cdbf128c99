/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Sanitization
 * Strip characters that carry syntax in the config format from user input
 */

#pragma once

#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace wg {

        // Characters removed from any config value: line breaks, section brackets,
        // comment marker, key separator and shell metacharacters.
        inline constexpr const char *CONFIG_VALUE_DENY = "\n\r[]#=;|&`$\\";

        // Keys keep their '=' padding
        inline constexpr const char *KEY_DENY = "\n\r[]#;|&`$\\ \t";

        namespace detail {
            inline auto strip(const String &value, const char *deny) -> String {
                String out;
                out.reserve(value.size());
                for (usize i = 0; i < value.size(); ++i) {
                    char c = value[i];
                    boolean denied = false;
                    for (usize j = 0; deny[j] != '\0'; ++j) {
                        if (c == deny[j]) {
                            denied = true;
                            break;
                        }
                    }
                    if (denied) {
                        continue;
                    }
                    out.push_back(c == '\t' ? ' ' : c);
                }
                return str::trim(out);
            }
        } // namespace detail

        [[nodiscard]] inline auto sanitize_config_value(const String &value) -> String {
            return detail::strip(value, CONFIG_VALUE_DENY);
        }

        // Peer names land in a "# Peer:" comment, so they get the same treatment
        [[nodiscard]] inline auto sanitize_peer_name(const String &name) -> String {
            return detail::strip(name, CONFIG_VALUE_DENY);
        }

        [[nodiscard]] inline auto sanitize_key(const String &key) -> String { return detail::strip(key, KEY_DENY); }

        // Lowercase [a-z0-9-_] with spaces turned into '-'; "peer" if nothing survives
        [[nodiscard]] inline auto safe_peer_filename(const String &name) -> String {
            String lowered = str::to_lower(sanitize_peer_name(name));
            String out;
            for (usize i = 0; i < lowered.size(); ++i) {
                char c = lowered[i];
                if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
                    out.push_back(c);
                } else if (c == ' ') {
                    out.push_back('-');
                }
            }
            if (out.empty()) {
                return String("peer");
            }
            return out;
        }

    } // namespace wg

} // namespace homelab
