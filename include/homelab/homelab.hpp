/* SPDX-License-Identifier: MIT */
/*
 * Homelab - Provisioning Core
 *
 * Main umbrella header - includes all homelab modules
 *
 * Features:
 * - Persistent key=value configuration with atomic save
 * - Race-safe completion markers and legacy marker migration
 * - Ordered setup steps with resume and re-run
 * - WireGuard key generation, peer address allocation and config rendering
 *
 * Dependencies:
 * - datapod: POD-compatible data structures and Result types
 * - keylock: Cryptographic primitives (libsodium)
 * - echo: Logging
 */

#pragma once

// Core modules
#include <homelab/core/result.hpp>
#include <homelab/core/time.hpp>
#include <homelab/core/types.hpp>

// Configuration
#include <homelab/cfg/config_store.hpp>
#include <homelab/cfg/keys.hpp>
#include <homelab/cfg/migrate.hpp>

// System capabilities
#include <homelab/sys/command.hpp>
#include <homelab/sys/fs.hpp>
#include <homelab/ui/output.hpp>
#include <homelab/ui/prompt.hpp>

// Cryptography
#include <homelab/crypto/keygen.hpp>
#include <homelab/crypto/wg_key.hpp>

// Networking
#include <homelab/net/ipv4.hpp>

// WireGuard
#include <homelab/wg/allocator.hpp>
#include <homelab/wg/config.hpp>
#include <homelab/wg/export.hpp>
#include <homelab/wg/peer_workflow.hpp>
#include <homelab/wg/sanitize.hpp>

// Setup steps
#include <homelab/steps/container.hpp>
#include <homelab/steps/context.hpp>
#include <homelab/steps/deployment.hpp>
#include <homelab/steps/directory.hpp>
#include <homelab/steps/nfs.hpp>
#include <homelab/steps/preflight.hpp>
#include <homelab/steps/user.hpp>
#include <homelab/steps/validation.hpp>
#include <homelab/steps/wireguard.hpp>

// Runtime
#include <homelab/runtime/orchestrator.hpp>

#include <sodium.h>

namespace homelab {

    // Library version
    inline constexpr u32 VERSION_MAJOR = 0;
    inline constexpr u32 VERSION_MINOR = 1;
    inline constexpr u32 VERSION_PATCH = 0;
    inline constexpr const char *VERSION_STRING = "0.1.0";

    // Initialize libsodium (call once at startup)
    inline auto init() -> VoidRes {
        if (sodium_init() < 0) {
            return result::err(err::io("Failed to initialize libsodium"));
        }
        return result::ok();
    }

} // namespace homelab
