/* SPDX-License-Identifier: MIT */
/*
 * Homelab Config Keys
 * Well-known configuration keys and their default values
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cstring>

namespace homelab {

    using namespace dp;

    namespace cfg {

        namespace keys {

            // User and layout
            inline constexpr const char *HOMELAB_USER = "HOMELAB_USER";
            inline constexpr const char *PUID = "PUID";
            inline constexpr const char *PGID = "PGID";
            inline constexpr const char *CONTAINERS_BASE = "CONTAINERS_BASE";

            // NFS
            inline constexpr const char *NFS_SERVER = "NFS_SERVER";
            inline constexpr const char *NFS_EXPORT = "NFS_EXPORT";
            inline constexpr const char *NFS_MOUNT_POINT = "NFS_MOUNT_POINT";
            inline constexpr const char *NFS_ENABLED = "NFS_ENABLED";

            // Containers
            inline constexpr const char *CONTAINER_RUNTIME = "CONTAINER_RUNTIME";
            inline constexpr const char *COMPOSE_COMMAND = "COMPOSE_COMMAND";
            inline constexpr const char *SELECTED_SERVICES = "SELECTED_SERVICES";

            // WireGuard
            inline constexpr const char *WG_INTERFACE = "WG_INTERFACE";
            inline constexpr const char *WIREGUARD_ENABLED = "WIREGUARD_ENABLED";
            inline constexpr const char *WIREGUARD_INTERFACE = "WIREGUARD_INTERFACE";
            inline constexpr const char *WIREGUARD_INTERFACE_IP = "WIREGUARD_INTERFACE_IP";
            inline constexpr const char *WIREGUARD_LISTEN_PORT = "WIREGUARD_LISTEN_PORT";
            inline constexpr const char *WIREGUARD_PUBLIC_KEY = "WIREGUARD_PUBLIC_KEY";
            inline constexpr const char *WIREGUARD_CONFIG_DIR = "WIREGUARD_CONFIG_DIR";
            inline constexpr const char *WIREGUARD_ENDPOINT = "WIREGUARD_ENDPOINT";
            inline constexpr const char *WIREGUARD_PEER_DNS = "WIREGUARD_PEER_DNS";
            inline constexpr const char *WIREGUARD_LAST_PEER_OFFSET = "WIREGUARD_LAST_PEER_OFFSET";

            // Tool behaviour
            inline constexpr const char *NETWORK_TEST_RETRIES = "NETWORK_TEST_RETRIES";
            inline constexpr const char *NETWORK_TEST_TIMEOUT = "NETWORK_TEST_TIMEOUT";
            inline constexpr const char *CONFIG_VERSION = "CONFIG_VERSION";
            inline constexpr const char *LOG_LEVEL = "LOG_LEVEL";

        } // namespace keys

        // =============================================================================
        // Defaults Table
        // =============================================================================

        struct DefaultEntry {
            const char *key;
            const char *value;
        };

        inline constexpr DefaultEntry DEFAULTS[] = {
            {keys::CONTAINERS_BASE, "/srv/containers"},
            {keys::CONTAINER_RUNTIME, "docker"},
            {keys::NFS_MOUNT_POINT, "/mnt/nas"},
            {keys::NETWORK_TEST_RETRIES, "5"},
            {keys::NETWORK_TEST_TIMEOUT, "10"},
            {keys::CONFIG_VERSION, "1"},
            {keys::WG_INTERFACE, "wg0"},
            {keys::WIREGUARD_LISTEN_PORT, "51820"},
            {keys::WIREGUARD_INTERFACE_IP, "10.253.0.1/24"},
            {keys::WIREGUARD_CONFIG_DIR, "/etc/wireguard"},
            {keys::LOG_LEVEL, "info"},
        };

        // Look up a key in the defaults table
        [[nodiscard]] inline auto default_for(const char *key) -> Optional<String> {
            for (const auto &entry : DEFAULTS) {
                if (std::strcmp(entry.key, key) == 0) {
                    return String(entry.value);
                }
            }
            return nullopt;
        }

        // Map the LOG_LEVEL value to an echo level (unknown values fall back to Info)
        [[nodiscard]] inline auto log_level_from_string(const String &level) -> echo::Level {
            if (level == "trace") {
                return echo::Level::Trace;
            }
            if (level == "debug") {
                return echo::Level::Debug;
            }
            if (level == "warn" || level == "warning") {
                return echo::Level::Warn;
            }
            if (level == "error") {
                return echo::Level::Error;
            }
            if (level == "critical") {
                return echo::Level::Critical;
            }
            return echo::Level::Info;
        }

    } // namespace cfg

} // namespace homelab
