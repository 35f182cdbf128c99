/* SPDX-License-Identifier: MIT */
/*
 * Homelab Input Validation
 * Checks shared by the setup steps
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>
#include <homelab/net/ipv4.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        [[nodiscard]] inline auto validate_username(const String &name) -> VoidRes {
            if (name.empty()) {
                return result::err(err::invalid("username cannot be empty"));
            }
            if (name.size() > 32) {
                return result::err(err::invalid(String("username too long (max 32 characters): ") + name));
            }
            char first = name[0];
            if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z') || first == '_')) {
                return result::err(err::invalid(String("username must start with a letter or underscore: ") + name));
            }
            for (usize i = 0; i < name.size(); ++i) {
                char c = name[i];
                if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                      c == '-')) {
                    return result::err(err::invalid(String("username contains invalid character: ") + name));
                }
            }
            return result::ok();
        }

        [[nodiscard]] inline auto validate_absolute_path(const String &path) -> VoidRes {
            if (path.empty()) {
                return result::err(err::invalid("path cannot be empty"));
            }
            if (path[0] != '/') {
                return result::err(err::invalid(String("path must be absolute: ") + path));
            }
            if (str::contains_any(path, "\n\r") || path.find("/../") != String::npos ||
                (path.size() >= 3 && path.substr(path.size() - 3) == "/..")) {
                return result::err(err::invalid(String("unsafe path: ") + path));
            }
            return result::ok();
        }

        // IPv4 address or DNS hostname
        [[nodiscard]] inline auto validate_host(const String &host) -> VoidRes {
            if (net::is_ipv4(host) || net::is_valid_hostname(host)) {
                return result::ok();
            }
            return result::err(err::invalid(String("invalid host: ") + host));
        }

    } // namespace steps

} // namespace homelab
