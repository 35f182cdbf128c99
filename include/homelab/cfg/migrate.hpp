/* SPDX-License-Identifier: MIT */
/*
 * Homelab Marker Migration
 * Race-safe migration of legacy completion markers to a canonical name
 */

#pragma once

#include <homelab/cfg/config_store.hpp>
#include <homelab/core/result.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <initializer_list>

namespace homelab {

    using namespace dp;

    namespace cfg {

        // Returns whether the step is complete under the canonical marker, migrating
        // the first legacy marker found. Only the caller whose exclusive create wins
        // clears the legacy marker, so racing processes never both clean up.
        [[nodiscard]] inline auto ensure_canonical_marker(ConfigStore &store, const String &canonical,
                                                          const Vector<String> &legacy) -> Res<boolean> {
            if (store.is_complete(canonical)) {
                return result::ok(true);
            }

            for (const auto &old_name : legacy) {
                if (old_name.empty() || old_name == canonical) {
                    continue;
                }
                if (!store.is_complete(old_name)) {
                    continue;
                }

                auto created = store.mark_complete_if_not_exists(canonical);
                if (created.is_err()) {
                    return result::err(err::wrap(String("failed to migrate marker ") + old_name, created.error()));
                }
                if (created.value()) {
                    auto cleared = store.clear_marker(old_name);
                    if (cleared.is_err()) {
                        echo::warn("Could not remove legacy marker ", old_name.c_str(), ": ",
                                   cleared.error().message.c_str());
                    } else {
                        echo::debug("Migrated marker ", old_name.c_str(), " -> ", canonical.c_str());
                    }
                }
                return result::ok(true);
            }

            return result::ok(false);
        }

        [[nodiscard]] inline auto ensure_canonical_marker(ConfigStore &store, const String &canonical,
                                                          std::initializer_list<const char *> legacy) -> Res<boolean> {
            Vector<String> names;
            for (const char *name : legacy) {
                names.push_back(String(name));
            }
            return ensure_canonical_marker(store, canonical, names);
        }

    } // namespace cfg

} // namespace homelab
