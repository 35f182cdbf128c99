/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard IP Allocator
 * Monotonic peer address allocation within the interface subnet
 */

#pragma once

#include <homelab/cfg/config_store.hpp>
#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>
#include <homelab/net/ipv4.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace homelab {

    using namespace dp;

    namespace wg {

        struct Allocation {
            u32 address = 0;
            u64 offset = 0; // host offset from the network address

            // Peer tunnel address as a /32
            [[nodiscard]] auto to_string() const -> String { return net::format_ipv4(address) + "/32"; }

            auto members() noexcept { return std::tie(address, offset); }
            auto members() const noexcept { return std::tie(address, offset); }
        };

        // The last handed-out host offset lives in the config store. Allocation only
        // ever moves forward: addresses of removed peers are not reclaimed.
        class IpAllocator {
          private:
            cfg::ConfigStore &store_;
            net::Cidr subnet_;

            [[nodiscard]] auto is_taken(u32 addr, const Vector<u32> &used) const -> boolean {
                if (addr == subnet_.address) {
                    return true;
                }
                for (u32 u : used) {
                    if (u == addr) {
                        return true;
                    }
                }
                return false;
            }

          public:
            IpAllocator(cfg::ConfigStore &store, const net::Cidr &subnet) : store_(store), subnet_(subnet) {}

            [[nodiscard]] auto subnet() const -> const net::Cidr & { return subnet_; }

            // Offset of the last allocation; 0 (the network address) before the first one
            [[nodiscard]] auto last_offset() -> Res<u64> {
                auto stored = store_.get(cfg::keys::WIREGUARD_LAST_PEER_OFFSET);
                if (stored.is_err()) {
                    if (err::is_not_found(stored.error())) {
                        return result::ok(static_cast<u64>(0));
                    }
                    return result::err(stored.error());
                }
                auto parsed = parse_uint(stored.value(), subnet_.size());
                if (parsed.is_err()) {
                    return result::err(err::wrap("invalid stored peer offset", parsed.error()));
                }
                return parsed;
            }

            // Next free address after the stored offset, without recording it
            [[nodiscard]] auto peek_next_address(const Vector<u32> &used) -> Res<Allocation> {
                auto last = last_offset();
                if (last.is_err()) {
                    return result::err(last.error());
                }

                u64 broadcast_offset = subnet_.size() - 1;
                u64 offset = last.value() + 1;
                while (offset < broadcast_offset) {
                    u32 candidate = subnet_.network() + static_cast<u32>(offset);
                    if (!is_taken(candidate, used)) {
                        Allocation a;
                        a.address = candidate;
                        a.offset = offset;
                        return result::ok(a);
                    }
                    ++offset;
                }
                return result::err(err::exhausted(
                    (String("no available IPs remaining in ") + subnet_.network_string()).c_str()));
            }

            // Record an allocation so later calls continue after it
            auto commit(const Allocation &allocation) -> VoidRes {
                auto res = store_.set(cfg::keys::WIREGUARD_LAST_PEER_OFFSET, to_str(allocation.offset));
                if (res.is_err()) {
                    return result::err(err::wrap("failed to persist peer offset", res.error()));
                }
                echo::debug("Allocated peer address ", allocation.to_string().c_str());
                return result::ok();
            }

            auto allocate_next_address(const Vector<u32> &used) -> Res<Allocation> {
                auto next = peek_next_address(used);
                if (next.is_err()) {
                    return next;
                }
                auto committed = commit(next.value());
                if (committed.is_err()) {
                    return result::err(committed.error());
                }
                return next;
            }

            auto allocate_next_address() -> Res<Allocation> { return allocate_next_address(Vector<u32>()); }
        };

    } // namespace wg

} // namespace homelab
