/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Step
 * Optional VPN interface setup: keys, server config, service, first peers
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/crypto/keygen.hpp>
#include <homelab/net/ipv4.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/preflight.hpp>
#include <homelab/sys/command.hpp>
#include <homelab/sys/fs.hpp>
#include <homelab/wg/config.hpp>
#include <homelab/wg/peer_workflow.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace homelab {

    using namespace dp;

    namespace steps {

        inline constexpr u32 WIREGUARD_DIR_MODE = 0750;
        inline constexpr u32 WIREGUARD_FILE_MODE = 0600;

        // Prompt for interface name, CIDR and port. Nothing is written.
        [[nodiscard]] inline auto prompt_interface(StepContext &ctx) -> Res<wg::WireGuardInterface> {
            wg::WireGuardInterface iface;

            // The interface written last time wins over the configured default
            String default_name = ctx.store.get_or_default(
                cfg::keys::WIREGUARD_INTERFACE, ctx.store.get_or_default(cfg::keys::WG_INTERFACE, DEFAULT_WG_INTERFACE));
            auto name = ctx.prompter.input("Interface name", default_name);
            if (name.is_err()) {
                return result::err(name.error());
            }
            iface.name = str::trim(name.value());

            auto address = ctx.prompter.input(
                "Interface IP address (CIDR notation)",
                ctx.store.get_or_default(cfg::keys::WIREGUARD_INTERFACE_IP, DEFAULT_WG_ADDRESS));
            if (address.is_err()) {
                return result::err(address.error());
            }
            iface.address = str::trim(address.value());

            auto port = ctx.prompter.input("Listen port",
                                           ctx.store.get_or_default(cfg::keys::WIREGUARD_LISTEN_PORT, "51820"));
            if (port.is_err()) {
                return result::err(port.error());
            }
            auto parsed_port = net::parse_port(str::trim(port.value()));
            if (parsed_port.is_err()) {
                return result::err(parsed_port.error());
            }
            iface.listen_port = parsed_port.value();

            auto valid = wg::validate_interface(iface);
            if (valid.is_err()) {
                return result::err(valid.error());
            }
            return result::ok(iface);
        }

        // Enable and start wg-quick@<iface>. Failures are warnings.
        inline auto enable_wireguard_service(StepContext &ctx, const String &interface_name) -> void {
            String service = wg::service_name(interface_name);
            auto enable = ctx.prompter.confirm(String("Enable and start ") + service + " now?", true);
            if (enable.is_err()) {
                ctx.out.warning(String("Skipping ") + service + ": " + enable.error().message);
                return;
            }
            if (!enable.value()) {
                ctx.out.info(String("Enable it later with: sudo systemctl enable --now ") + service);
                return;
            }

            const char *actions[] = {"enable", "start"};
            for (const char *action : actions) {
                Vector<String> args;
                args.push_back("-n");
                args.push_back("systemctl");
                args.push_back(action);
                args.push_back(service);
                auto ran = sys::run_checked(ctx.runner, "sudo", args);
                if (ran.is_err()) {
                    ctx.out.warning(String("Failed to ") + action + " " + service + ": " + ran.error().message);
                    return;
                }
            }
            ctx.out.success(String("Service ") + service + " enabled and started");
        }

        // Offer to add peers right after the interface exists. Returns how many were added.
        inline auto add_initial_peers(StepContext &ctx, const String &interface_name) -> usize {
            auto wanted = ctx.prompter.confirm("Add a peer now?", false);
            if (wanted.is_err() || !wanted.value()) {
                ctx.out.info("Add peers later with: homelab_setup wireguard add-peer");
                return 0;
            }

            usize added = 0;
            for (;;) {
                wg::PeerOptions opts;
                opts.interface_name = interface_name;
                opts.non_interactive = ctx.prompter.is_non_interactive();
                opts.skip_service_restart = true;
                opts.mark_step = false;

                auto res = wg::add_peer(ctx, opts);
                const char *question = "Add another peer?";
                if (res.is_err()) {
                    ctx.out.warning(String("Failed to add peer: ") + res.error().message);
                    question = "Try adding the peer again?";
                } else {
                    ++added;
                }

                auto more = ctx.prompter.confirm(question, false);
                if (more.is_err() || !more.value()) {
                    break;
                }
            }

            if (added > 0) {
                ctx.out.success(String("Added ") + to_str(static_cast<u64>(added)) + " peer(s)");
                wg::offer_service_restart(ctx, interface_name);
            }
            return added;
        }

        inline auto run_wireguard_setup(StepContext &ctx) -> VoidRes {
            ctx.out.header("WireGuard VPN Setup");

            auto wanted = ctx.prompter.confirm("Configure WireGuard VPN?", true);
            if (wanted.is_err()) {
                return result::err(wanted.error());
            }
            if (!wanted.value()) {
                ctx.out.info("Skipping WireGuard configuration");
                return ctx.store.set(cfg::keys::WIREGUARD_ENABLED, "false");
            }

            auto tool = check_tool(ctx.runner, "wg");
            if (tool.is_err()) {
                ctx.out.info("Install wireguard-tools (sudo rpm-ostree install wireguard-tools) and reboot");
                return result::err(err::wrap("wireguard-tools is not installed", tool.error()));
            }

            auto iface = prompt_interface(ctx);
            if (iface.is_err()) {
                return result::err(iface.error());
            }
            wg::WireGuardInterface cfg_iface = iface.value();

            auto keys = crypto::generate_keypair(ctx.keygen);
            if (keys.is_err()) {
                return result::err(keys.error());
            }
            cfg_iface.private_key = keys.value().private_key;
            cfg_iface.public_key = keys.value().public_key;

            String dir = ctx.store.get_or_default(cfg::keys::WIREGUARD_CONFIG_DIR, "/etc/wireguard");
            String path = sys::join_path(dir, cfg_iface.name + ".conf");
            if (sys::path_exists(path)) {
                auto overwrite = ctx.prompter.confirm(path + " already exists. Overwrite it?", false);
                if (overwrite.is_err()) {
                    return result::err(overwrite.error());
                }
                if (!overwrite.value()) {
                    return result::err(err::invalid(String("refusing to overwrite ") + path));
                }
            }

            auto dir_res = sys::ensure_dir(dir, WIREGUARD_DIR_MODE);
            if (dir_res.is_err()) {
                return dir_res;
            }
            auto written = sys::write_file_atomic(path, wg::render_interface(cfg_iface), WIREGUARD_FILE_MODE);
            if (written.is_err()) {
                return result::err(err::wrap("failed to write WireGuard config", written.error()));
            }

            auto mode = sys::file_mode(path);
            if (mode.is_err()) {
                return result::err(mode.error());
            }
            if (mode.value() != WIREGUARD_FILE_MODE) {
                return result::err(err::permission("WireGuard config must have 0600 permissions"));
            }
            ctx.out.success(String("Configuration file created at ") + path);

            auto res = ctx.store.set(cfg::keys::WIREGUARD_ENABLED, "true");
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::WIREGUARD_INTERFACE, cfg_iface.name);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::WIREGUARD_INTERFACE_IP, cfg_iface.address);
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::WIREGUARD_LISTEN_PORT, to_str(cfg_iface.listen_port));
            if (res.is_ok())
                res = ctx.store.set(cfg::keys::WIREGUARD_PUBLIC_KEY, cfg_iface.public_key);
            if (res.is_err()) {
                return res;
            }
            // A fresh interface restarts peer allocation
            auto cleared = ctx.store.remove(cfg::keys::WIREGUARD_LAST_PEER_OFFSET);
            if (cleared.is_err()) {
                return cleared;
            }

            ctx.out.info(String("Interface: ") + cfg_iface.name);
            ctx.out.info(String("Address: ") + cfg_iface.address);
            ctx.out.info(String("Port: ") + to_str(cfg_iface.listen_port));
            ctx.out.info(String("Public key (share with peers): ") + cfg_iface.public_key);

            enable_wireguard_service(ctx, cfg_iface.name);
            add_initial_peers(ctx, cfg_iface.name);
            return result::ok();
        }

    } // namespace steps

} // namespace homelab
