/* SPDX-License-Identifier: MIT */
/*
 * Homelab IPv4
 * Strict IPv4 address, CIDR, port and endpoint parsing
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace net {

        // =============================================================================
        // Port Parsing
        // =============================================================================

        [[nodiscard]] inline auto parse_port(const String &port_str) -> Res<u16> {
            if (port_str.empty()) {
                return result::err(err::invalid("Empty port string"));
            }

            u32 port = 0;
            for (usize i = 0; i < port_str.size(); ++i) {
                char c = port_str[i];
                if (c < '0' || c > '9') {
                    return result::err(err::invalid(String("Invalid port number: ") + port_str));
                }
                port = port * 10 + static_cast<u32>(c - '0');
                if (port > 65535) {
                    return result::err(err::invalid(String("Port number out of range (1-65535): ") + port_str));
                }
            }

            if (port == 0) {
                return result::err(err::invalid("Port 0 is not allowed"));
            }

            return result::ok(static_cast<u16>(port));
        }

        // =============================================================================
        // IPv4 Address
        // =============================================================================

        // Dotted quad, each octet 0-255 without leading zeros, so that parse and
        // format round-trip exactly.
        [[nodiscard]] inline auto parse_ipv4(const String &text) -> Res<u32> {
            u32 addr = 0;
            usize octets = 0;
            usize i = 0;

            while (octets < 4) {
                usize start = i;
                u32 value = 0;
                while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
                    value = value * 10 + static_cast<u32>(text[i] - '0');
                    ++i;
                    if (i - start > 3) {
                        return result::err(err::invalid(String("Invalid IPv4 address: ") + text));
                    }
                }
                usize len = i - start;
                if (len == 0 || value > 255 || (len > 1 && text[start] == '0')) {
                    return result::err(err::invalid(String("Invalid IPv4 address: ") + text));
                }
                addr = (addr << 8) | value;
                ++octets;

                if (octets < 4) {
                    if (i >= text.size() || text[i] != '.') {
                        return result::err(err::invalid(String("Invalid IPv4 address: ") + text));
                    }
                    ++i;
                }
            }

            if (i != text.size()) {
                return result::err(err::invalid(String("Invalid IPv4 address: ") + text));
            }
            return result::ok(addr);
        }

        [[nodiscard]] inline auto format_ipv4(u32 addr) -> String {
            String out;
            for (i32 shift = 24; shift >= 0; shift -= 8) {
                out += to_str(static_cast<u32>((addr >> shift) & 0xFF));
                if (shift > 0) {
                    out.push_back('.');
                }
            }
            return out;
        }

        [[nodiscard]] inline auto is_ipv4(const String &text) -> boolean { return parse_ipv4(text).is_ok(); }

        // =============================================================================
        // CIDR
        // =============================================================================

        struct Cidr {
            u32 address = 0; // host address as written, not masked
            u8 prefix = 0;

            Cidr() = default;
            Cidr(u32 addr, u8 len) : address(addr), prefix(len) {}

            [[nodiscard]] auto mask() const -> u32 { return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix)); }
            [[nodiscard]] auto network() const -> u32 { return address & mask(); }
            [[nodiscard]] auto broadcast() const -> u32 { return network() | ~mask(); }

            [[nodiscard]] auto contains(u32 addr) const -> boolean { return (addr & mask()) == network(); }

            // Offset of the written address from the network address
            [[nodiscard]] auto host_offset() const -> u64 { return static_cast<u64>(address - network()); }

            // Number of addresses in the block (2^(32-prefix))
            [[nodiscard]] auto size() const -> u64 { return static_cast<u64>(1) << (32 - prefix); }

            [[nodiscard]] auto to_string() const -> String { return format_ipv4(address) + "/" + to_str(static_cast<u32>(prefix)); }

            // Canonical network form, e.g. 10.253.0.0/24
            [[nodiscard]] auto network_string() const -> String {
                return format_ipv4(network()) + "/" + to_str(static_cast<u32>(prefix));
            }

            auto members() noexcept { return std::tie(address, prefix); }
            auto members() const noexcept { return std::tie(address, prefix); }
        };

        [[nodiscard]] inline auto parse_cidr(const String &text) -> Res<Cidr> {
            usize slash = text.find('/');
            if (slash == String::npos) {
                return result::err(err::invalid(String("Invalid IPv4 CIDR notation (missing prefix): ") + text));
            }

            auto addr = parse_ipv4(text.substr(0, slash));
            if (addr.is_err()) {
                return result::err(err::invalid(String("Invalid IPv4 CIDR notation: ") + text));
            }

            String prefix_str = text.substr(slash + 1);
            if (prefix_str.empty() || prefix_str.size() > 2 || (prefix_str.size() > 1 && prefix_str[0] == '0')) {
                return result::err(err::invalid(String("Invalid IPv4 CIDR prefix: ") + text));
            }
            auto prefix = parse_uint(prefix_str, 32);
            if (prefix.is_err()) {
                return result::err(err::invalid(String("Invalid IPv4 CIDR prefix: ") + text));
            }

            return result::ok(Cidr(addr.value(), static_cast<u8>(prefix.value())));
        }

        // A bare address (treated as /32) or a CIDR
        [[nodiscard]] inline auto parse_address_or_cidr(const String &text) -> Res<Cidr> {
            if (text.find('/') == String::npos) {
                auto addr = parse_ipv4(text);
                if (addr.is_err()) {
                    return result::err(addr.error());
                }
                return result::ok(Cidr(addr.value(), 32));
            }
            return parse_cidr(text);
        }

        // Comma-separated list where every entry must be a strict IPv4 address or CIDR
        [[nodiscard]] inline auto validate_address_list(const String &list) -> VoidRes {
            auto entries = str::split(list, ',');
            if (entries.empty()) {
                return result::err(err::invalid("Address list is empty"));
            }
            for (const auto &entry : entries) {
                auto res = parse_address_or_cidr(entry);
                if (res.is_err()) {
                    return result::err(res.error());
                }
            }
            return result::ok();
        }

        // =============================================================================
        // Endpoint (host:port)
        // =============================================================================

        [[nodiscard]] inline auto is_valid_hostname(const String &host) -> boolean {
            if (host.empty() || host.size() > 253) {
                return false;
            }
            usize label_len = 0;
            for (usize i = 0; i < host.size(); ++i) {
                char c = host[i];
                if (c == '.') {
                    if (label_len == 0) {
                        return false;
                    }
                    label_len = 0;
                    continue;
                }
                boolean ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
                if (!ok || ++label_len > 63) {
                    return false;
                }
                if (c == '-' && (label_len == 1 || i + 1 == host.size() || host[i + 1] == '.')) {
                    return false;
                }
            }
            return label_len > 0;
        }

        // Server endpoint as clients dial it: hostname or IPv4, then a port
        [[nodiscard]] inline auto validate_endpoint(const String &endpoint) -> VoidRes {
            if (endpoint.empty()) {
                return result::err(err::invalid("Endpoint cannot be empty"));
            }
            usize colon = endpoint.rfind(':');
            if (colon == String::npos || colon == 0) {
                return result::err(err::invalid(String("Endpoint must be host:port: ") + endpoint));
            }
            String host = endpoint.substr(0, colon);
            auto port = parse_port(endpoint.substr(colon + 1));
            if (port.is_err()) {
                return result::err(err::invalid(String("Invalid endpoint port: ") + endpoint));
            }

            boolean digits_and_dots = true;
            for (usize i = 0; i < host.size(); ++i) {
                if (!((host[i] >= '0' && host[i] <= '9') || host[i] == '.')) {
                    digits_and_dots = false;
                    break;
                }
            }
            if (digits_and_dots) {
                if (!is_ipv4(host)) {
                    return result::err(err::invalid(String("Invalid endpoint address: ") + host));
                }
            } else if (!is_valid_hostname(host)) {
                return result::err(err::invalid(String("Invalid endpoint host: ") + host));
            }
            return result::ok();
        }

    } // namespace net

} // namespace homelab
