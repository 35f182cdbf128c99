/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Export
 * Client config export to disk and QR rendering via qrencode
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/time.hpp>
#include <homelab/core/types.hpp>
#include <homelab/sys/command.hpp>
#include <homelab/sys/fs.hpp>
#include <homelab/wg/sanitize.hpp>

#include <datapod/datapod.hpp>

#include <sys/stat.h>

namespace homelab {

    using namespace dp;

    namespace wg {

        inline constexpr u32 EXPORT_DIR_MODE = 0700;
        inline constexpr u32 EXPORT_FILE_MODE = 0600;

        [[nodiscard]] inline auto default_export_dir(const String &home) -> String {
            String base = home.empty() ? String(FALLBACK_HOME) : home;
            return sys::join_path(base, "setup/export/wireguard-peers");
        }

        // Writes <dir>/<safe-name>.conf, or <safe-name>-<unix>.conf if that exists.
        // Returns the path written.
        [[nodiscard]] inline auto write_client_export(const String &peer_name, const String &export_dir,
                                                      const String &content) -> Res<String> {
            auto dir_res = sys::ensure_dir(export_dir, EXPORT_DIR_MODE);
            if (dir_res.is_err()) {
                return result::err(err::wrap("failed to create export directory", dir_res.error()));
            }
            if (::chmod(export_dir.c_str(), EXPORT_DIR_MODE) != 0) {
                return result::err(err::io_at("Failed to set permissions on", export_dir));
            }

            String base = safe_peer_filename(peer_name);
            String path = sys::join_path(export_dir, base + ".conf");
            if (sys::path_exists(path)) {
                path = sys::join_path(export_dir, base + "-" + to_str(time::now_unix()) + ".conf");
            }

            auto write_res = sys::write_file_atomic(path, content, EXPORT_FILE_MODE);
            if (write_res.is_err()) {
                return result::err(err::wrap("failed to write client config", write_res.error()));
            }
            return result::ok(path);
        }

        // Terminal QR code of the client config
        [[nodiscard]] inline auto render_qr_code(sys::CommandRunner &runner, const String &content) -> Res<String> {
            Vector<String> args;
            args.push_back("-t");
            args.push_back("ASCIIi");
            args.push_back("-o");
            args.push_back("-");
            args.push_back("-m");
            args.push_back("2");

            auto out = runner.run("qrencode", args, content);
            if (out.is_err()) {
                return result::err(err::wrap("qrencode unavailable; install qrencode to enable QR output", out.error()));
            }
            if (!out.value().success()) {
                return result::err(err::command("qrencode", str::trim(out.value().output)));
            }
            return result::ok(out.value().output);
        }

    } // namespace wg

} // namespace homelab
