/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Config
 * Interface and peer records, rendering to wg-quick format and parsing back
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>
#include <homelab/net/ipv4.hpp>
#include <homelab/wg/sanitize.hpp>

#include <datapod/datapod.hpp>

#include <cstring>

namespace homelab {

    using namespace dp;

    namespace wg {

        inline constexpr const char *PEER_COMMENT_PREFIX = "# Peer:";
        inline constexpr const char *ROUTE_ALL_ALLOWED_IPS = "0.0.0.0/0, ::/0";

        // =============================================================================
        // Records
        // =============================================================================

        struct Peer {
            String name;
            String public_key;
            String preshared_key; // empty when not used
            String allowed_ips;   // server side: the peer's tunnel address
            i32 keepalive = 0;    // 0 omits PersistentKeepalive
            String address;       // allocated a.b.c.d/32

            auto members() noexcept { return std::tie(name, public_key, preshared_key, allowed_ips, keepalive, address); }
            auto members() const noexcept {
                return std::tie(name, public_key, preshared_key, allowed_ips, keepalive, address);
            }
        };

        struct WireGuardInterface {
            String name = DEFAULT_WG_INTERFACE;
            String address = DEFAULT_WG_ADDRESS;
            u16 listen_port = DEFAULT_LISTEN_PORT;
            String private_key;
            String public_key;
            Vector<Peer> peers;

            auto members() noexcept { return std::tie(name, address, listen_port, private_key, public_key, peers); }
            auto members() const noexcept {
                return std::tie(name, address, listen_port, private_key, public_key, peers);
            }
        };

        // Client-importable config for one peer
        struct ClientConfig {
            String private_key;
            String address;
            String dns;
            String server_public_key;
            String preshared_key;
            String endpoint;
            String allowed_ips;
            i32 keepalive = 0;

            auto members() noexcept {
                return std::tie(private_key, address, dns, server_public_key, preshared_key, endpoint, allowed_ips,
                                keepalive);
            }
            auto members() const noexcept {
                return std::tie(private_key, address, dns, server_public_key, preshared_key, endpoint, allowed_ips,
                                keepalive);
            }
        };

        // Interface name becomes a file name and a systemd instance
        [[nodiscard]] inline auto validate_interface_name(const String &name) -> VoidRes {
            if (name.empty() || name.size() > 15) {
                return result::err(err::invalid(String("Interface name must be 1-15 characters: ") + name));
            }
            for (usize i = 0; i < name.size(); ++i) {
                char c = name[i];
                boolean ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                             c == '-' || c == '.';
                if (!ok) {
                    return result::err(err::invalid(String("Invalid interface name: ") + name));
                }
            }
            if (name == "." || name == "..") {
                return result::err(err::invalid(String("Invalid interface name: ") + name));
            }
            return result::ok();
        }

        [[nodiscard]] inline auto validate_interface(const WireGuardInterface &iface) -> VoidRes {
            auto name_res = validate_interface_name(iface.name);
            if (name_res.is_err()) {
                return name_res;
            }
            auto cidr = net::parse_cidr(iface.address);
            if (cidr.is_err()) {
                return result::err(cidr.error());
            }
            if (iface.listen_port == 0) {
                return result::err(err::invalid("Listen port must be in 1-65535"));
            }
            return result::ok();
        }

        // =============================================================================
        // Rendering
        // =============================================================================

        [[nodiscard]] inline auto render_peer_block(const Peer &peer) -> String {
            String out;
            out += PEER_COMMENT_PREFIX;
            out += " ";
            out += sanitize_peer_name(peer.name);
            out += "\n[Peer]\nPublicKey = ";
            out += sanitize_key(peer.public_key);
            out += "\n";
            if (!peer.preshared_key.empty()) {
                out += "PresharedKey = ";
                out += sanitize_key(peer.preshared_key);
                out += "\n";
            }
            out += "AllowedIPs = ";
            out += sanitize_config_value(peer.allowed_ips);
            out += "\n";
            if (peer.keepalive > 0) {
                out += "PersistentKeepalive = ";
                out += to_str(peer.keepalive);
                out += "\n";
            }
            return out;
        }

        // Existing content, one blank line, then the block
        [[nodiscard]] inline auto append_peer_block(const String &existing, const String &block) -> String {
            usize end = existing.size();
            while (end > 0 && (existing[end - 1] == '\n' || existing[end - 1] == '\r')) {
                --end;
            }
            if (end == 0) {
                return block;
            }
            return existing.substr(0, end) + "\n\n" + block;
        }

        [[nodiscard]] inline auto render_interface(const WireGuardInterface &iface) -> String {
            String out;
            out += "[Interface]\n";
            out += "# Generated by homelab-setup\n";
            out += "Address = ";
            out += sanitize_config_value(iface.address);
            out += "\nListenPort = ";
            out += to_str(iface.listen_port);
            out += "\nPrivateKey = ";
            out += sanitize_key(iface.private_key);
            out += "\n";
            for (const auto &peer : iface.peers) {
                out = append_peer_block(out, render_peer_block(peer));
            }
            return out;
        }

        [[nodiscard]] inline auto render_client_config(const ClientConfig &cfg) -> String {
            String out;
            out += "[Interface]\nPrivateKey = ";
            out += sanitize_key(cfg.private_key);
            out += "\nAddress = ";
            out += sanitize_config_value(cfg.address);
            out += "\n";
            String dns = sanitize_config_value(cfg.dns);
            if (!dns.empty()) {
                out += "DNS = ";
                out += dns;
                out += "\n";
            }
            out += "\n[Peer]\nPublicKey = ";
            out += sanitize_key(cfg.server_public_key);
            out += "\n";
            if (!cfg.preshared_key.empty()) {
                out += "PresharedKey = ";
                out += sanitize_key(cfg.preshared_key);
                out += "\n";
            }
            String endpoint = sanitize_config_value(cfg.endpoint);
            if (!endpoint.empty()) {
                out += "Endpoint = ";
                out += endpoint;
                out += "\n";
            }
            out += "AllowedIPs = ";
            out += sanitize_config_value(cfg.allowed_ips);
            out += "\n";
            if (cfg.keepalive > 0) {
                out += "PersistentKeepalive = ";
                out += to_str(cfg.keepalive);
                out += "\n";
            }
            return out;
        }

        // =============================================================================
        // Parsing
        // =============================================================================

        struct ParsedPeer {
            String name; // from the preceding "# Peer:" comment
            String public_key;
            String allowed_ips;

            auto members() noexcept { return std::tie(name, public_key, allowed_ips); }
            auto members() const noexcept { return std::tie(name, public_key, allowed_ips); }
        };

        struct ParsedConfig {
            String address;
            String private_key;
            String listen_port;
            Vector<ParsedPeer> peers;

            auto members() noexcept { return std::tie(address, private_key, listen_port, peers); }
            auto members() const noexcept { return std::tie(address, private_key, listen_port, peers); }
        };

        namespace detail {
            // Drop an inline '#' or ';' comment
            inline auto strip_inline_comment(const String &value) -> String {
                for (usize i = 0; i < value.size(); ++i) {
                    if (value[i] == '#' || value[i] == ';') {
                        return str::trim(value.substr(0, i));
                    }
                }
                return str::trim(value);
            }
        } // namespace detail

        // Lenient parse of an existing server config. Keys match case-insensitively.
        [[nodiscard]] inline auto parse_config(const String &content) -> ParsedConfig {
            enum class Section { None, Interface, Peer, Other };

            ParsedConfig cfg;
            Section section = Section::None;
            String pending_name;

            usize start = 0;
            while (start <= content.size()) {
                usize nl = content.find('\n', start);
                usize end = nl == String::npos ? content.size() : nl;
                String line = str::trim(content.substr(start, end - start));
                start = end + 1;

                if (str::starts_with(line, PEER_COMMENT_PREFIX)) {
                    pending_name = str::trim(line.substr(std::strlen(PEER_COMMENT_PREFIX)));
                } else if (line.empty() || line[0] == '#' || line[0] == ';') {
                    // comment
                } else if (line[0] == '[' && line[line.size() - 1] == ']') {
                    String name = str::to_lower(line.substr(1, line.size() - 2));
                    if (name == "interface") {
                        section = Section::Interface;
                    } else if (name == "peer") {
                        section = Section::Peer;
                        ParsedPeer peer;
                        peer.name = pending_name;
                        cfg.peers.push_back(peer);
                        pending_name = String();
                    } else {
                        section = Section::Other;
                    }
                } else {
                    usize eq = line.find('=');
                    if (eq != String::npos) {
                        String key = str::to_lower(str::trim(line.substr(0, eq)));
                        String value = str::trim(line.substr(eq + 1));
                        if (section == Section::Interface) {
                            if (key == "address") {
                                cfg.address = detail::strip_inline_comment(value);
                            } else if (key == "privatekey") {
                                cfg.private_key = detail::strip_inline_comment(value);
                            } else if (key == "listenport") {
                                cfg.listen_port = detail::strip_inline_comment(value);
                            }
                        } else if (section == Section::Peer && !cfg.peers.empty()) {
                            ParsedPeer &peer = cfg.peers[cfg.peers.size() - 1];
                            if (key == "publickey") {
                                peer.public_key = detail::strip_inline_comment(value);
                            } else if (key == "allowedips") {
                                peer.allowed_ips = detail::strip_inline_comment(value);
                            }
                        }
                    }
                }

                if (nl == String::npos) {
                    break;
                }
            }
            return cfg;
        }

        // First entry of the interface Address, which must be an IPv4 CIDR
        [[nodiscard]] inline auto first_interface_address(const ParsedConfig &cfg) -> Res<net::Cidr> {
            auto entries = str::split(cfg.address, ',');
            if (entries.empty()) {
                return result::err(err::invalid("Interface section missing Address"));
            }
            auto cidr = net::parse_cidr(entries[0]);
            if (cidr.is_err()) {
                return result::err(err::wrap("failed to parse interface address", cidr.error()));
            }
            return cidr;
        }

        // IPv4 host addresses already claimed by peers. Unparseable and IPv6 entries are skipped.
        [[nodiscard]] inline auto collect_used_addresses(const ParsedConfig &cfg) -> Vector<u32> {
            Vector<u32> used;
            for (const auto &peer : cfg.peers) {
                for (const auto &entry : str::split(peer.allowed_ips, ',')) {
                    auto parsed = net::parse_address_or_cidr(entry);
                    if (parsed.is_ok()) {
                        used.push_back(parsed.value().address);
                    }
                }
            }
            return used;
        }

    } // namespace wg

} // namespace homelab
