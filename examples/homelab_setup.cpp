/* SPDX-License-Identifier: MIT */
/*
 * Homelab Setup CLI
 * Run setup steps, show progress, reset state and add WireGuard peers
 *
 * Usage:
 *   ./homelab_setup run <step|all|quick> [--non-interactive] [--skip-wireguard]
 *   ./homelab_setup status
 *   ./homelab_setup reset [--force] [--config]
 *   ./homelab_setup wireguard add-peer [options]
 */

#include <homelab/homelab.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>

using namespace homelab;
using namespace dp;

void print_usage(const char *prog) {
    std::cout << "Homelab Setup\n\n";
    std::cout << "Usage: " << prog << " <command> [OPTIONS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run <step|all|quick>     Run one step, every step, or every required step\n";
    std::cout << "  status                   Show step completion\n";
    std::cout << "  reset                    Clear completion markers\n";
    std::cout << "  wireguard add-peer       Add a WireGuard client peer\n";
    std::cout << "\nrun options:\n";
    std::cout << "  --non-interactive        Accept defaults for every prompt\n";
    std::cout << "  --skip-wireguard         Skip the optional WireGuard step with 'all'\n";
    std::cout << "\nreset options:\n";
    std::cout << "  --force                  Do not ask for confirmation\n";
    std::cout << "  --config                 Also delete the configuration file\n";
    std::cout << "\nwireguard add-peer options:\n";
    std::cout << "  --interface NAME         WireGuard interface (default from config or wg0)\n";
    std::cout << "  --name NAME              Peer name\n";
    std::cout << "  --endpoint HOST:PORT     Server endpoint clients connect to\n";
    std::cout << "  --dns ADDRS              DNS servers for the client\n";
    std::cout << "  --client-allowed-ips IPS Client AllowedIPs override\n";
    std::cout << "  --route-all              Route all client traffic through the VPN\n";
    std::cout << "  --export-dir DIR         Where to write the client config\n";
    std::cout << "  --keepalive SECONDS      PersistentKeepalive (0 disables)\n";
    std::cout << "  --no-psk                 Do not use a preshared key\n";
    std::cout << "  --preshared-key KEY      Use this preshared key\n";
    std::cout << "  --non-interactive        Fail instead of prompting\n";
    std::cout << "  --no-qr                  Skip the QR code\n";
}

auto resolve_home() -> String {
    const char *home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return String(FALLBACK_HOME);
    }
    return String(home);
}

auto report(const VoidRes &res) -> int {
    if (res.is_err()) {
        echo::error(res.error().message.c_str());
        return 1;
    }
    return 0;
}

auto cmd_run(steps::StepContext &ctx, int argc, char *argv[]) -> int {
    String target;
    boolean skip_wireguard = false;
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--skip-wireguard") == 0) {
            skip_wireguard = true;
        } else if (std::strcmp(argv[i], "--non-interactive") == 0) {
            continue;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        } else if (target.empty()) {
            target = argv[i];
        }
    }
    if (target.empty()) {
        std::cerr << "run requires a step name, 'all' or 'quick'\n";
        return 1;
    }

    runtime::Orchestrator orch(ctx);
    if (target == "all") {
        return report(orch.run_all(skip_wireguard));
    }
    if (target == "quick") {
        return report(orch.run_all(true));
    }
    return report(orch.run_step(target));
}

auto cmd_status(steps::StepContext &ctx) -> int {
    runtime::Orchestrator orch(ctx);
    ctx.out.header("Homelab Setup Status");
    for (const auto &s : orch.status()) {
        const char *mark = s.state == StepState::Completed ? "✓" : " ";
        String line = String("[") + mark + "] " + s.descriptor.name;
        if (s.descriptor.optional) {
            line += " (optional)";
        }
        if (s.state == StepState::Completed) {
            echo::info(line.c_str()).green();
        } else {
            echo::info(line.c_str());
        }
    }
    auto progress = orch.progress();
    ctx.out.separator();
    echo::info("Progress: ", progress.first, "/", progress.second, " steps completed");
    return 0;
}

auto cmd_reset(steps::StepContext &ctx, int argc, char *argv[]) -> int {
    boolean force = false;
    boolean include_config = false;
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--force") == 0) {
            force = true;
        } else if (std::strcmp(argv[i], "--config") == 0) {
            include_config = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (!force) {
        String question = include_config ? "Clear all completion markers and delete the configuration file?"
                                         : "Clear all completion markers?";
        auto confirmed = ctx.prompter.confirm(question, false);
        if (confirmed.is_err()) {
            echo::error(confirmed.error().message.c_str());
            return 1;
        }
        if (!confirmed.value()) {
            ctx.out.info("Reset cancelled");
            return 0;
        }
    }

    runtime::Orchestrator orch(ctx);
    int rc = report(orch.reset(include_config));
    if (rc == 0) {
        ctx.out.success("Setup state reset");
    }
    return rc;
}

auto cmd_add_peer(steps::StepContext &ctx, int argc, char *argv[]) -> int {
    wg::PeerOptions opts;

    for (int i = 0; i < argc; ++i) {
        String arg(argv[i]);
        auto value = [&](const char *flag) -> const char * {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--interface" || arg == "--name" || arg == "--endpoint" || arg == "--dns" ||
            arg == "--client-allowed-ips" || arg == "--export-dir" || arg == "--keepalive" ||
            arg == "--preshared-key") {
            const char *v = value(arg.c_str());
            if (v == nullptr) {
                return 1;
            }
            if (arg == "--interface") {
                opts.interface_name = v;
            } else if (arg == "--name") {
                opts.peer_name = v;
            } else if (arg == "--endpoint") {
                opts.endpoint = v;
            } else if (arg == "--dns") {
                opts.dns = v;
            } else if (arg == "--client-allowed-ips") {
                opts.client_allowed_ips = v;
            } else if (arg == "--export-dir") {
                opts.output_dir = v;
            } else if (arg == "--preshared-key") {
                opts.provided_preshared_key = v;
            } else {
                auto secs = parse_uint(String(v), 65535);
                if (secs.is_err()) {
                    std::cerr << "Invalid --keepalive value: " << v << "\n";
                    return 1;
                }
                opts.keepalive = static_cast<i32>(secs.value());
            }
        } else if (arg == "--route-all") {
            opts.route_all = true;
        } else if (arg == "--no-psk") {
            opts.generate_preshared_key = false;
        } else if (arg == "--non-interactive") {
            opts.non_interactive = true;
        } else if (arg == "--no-qr") {
            opts.skip_qr = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    auto added = wg::add_peer(ctx, opts);
    if (added.is_err()) {
        echo::error(added.error().message.c_str());
        return 1;
    }
    ctx.out.info("Client configuration:");
    std::cout << added.value().client_config.c_str() << "\n";
    return 0;
}

auto main(int argc, char *argv[]) -> int {
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    boolean non_interactive = false;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--non-interactive") == 0) {
            non_interactive = true;
        }
    }

    auto init_result = homelab::init();
    if (init_result.is_err()) {
        std::cerr << "Failed to initialize: " << init_result.error().message.c_str() << "\n";
        return 1;
    }

    String home = resolve_home();
    cfg::ConfigStore store(cfg::default_paths(home));
    ui::TerminalPrompter prompter(non_interactive);
    sys::ExecCommandRunner runner;
    crypto::KeylockKeyGenerator keygen;
    steps::StepContext ctx(store, prompter, runner, keygen, home);

    String level_name = store.get_or_default(cfg::keys::LOG_LEVEL, "info");
    echo::debug("Log level from config: ", level_name.c_str(), " (",
                static_cast<int>(cfg::log_level_from_string(level_name)), ")");

    String command(argv[1]);
    if (command == "run") {
        return cmd_run(ctx, argc - 2, argv + 2);
    }
    if (command == "status") {
        return cmd_status(ctx);
    }
    if (command == "reset") {
        return cmd_reset(ctx, argc - 2, argv + 2);
    }
    if (command == "wireguard") {
        if (argc < 3 || std::strcmp(argv[2], "add-peer") != 0) {
            std::cerr << "Usage: " << argv[0] << " wireguard add-peer [options]\n";
            return 1;
        }
        return cmd_add_peer(ctx, argc - 3, argv + 3);
    }

    std::cerr << "Unknown command: " << argv[1] << "\n";
    print_usage(argv[0]);
    return 1;
}
