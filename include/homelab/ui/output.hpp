/* SPDX-License-Identifier: MIT */
/*
 * Homelab Output
 * User-facing status lines on top of echo
 */

#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace homelab {

    using namespace dp;

    namespace ui {

        struct Output {
            auto info(const String &msg) const -> void { echo::info(msg.c_str()); }

            auto success(const String &msg) const -> void { echo::info("✓ ", msg.c_str()).green(); }

            auto warning(const String &msg) const -> void { echo::warn(msg.c_str()); }

            auto error(const String &msg) const -> void { echo::error(msg.c_str()); }

            auto step(usize index, usize total, const String &name) const -> void {
                echo::info("[", index, "/", total, "] ", name.c_str()).cyan();
            }

            auto header(const String &title) const -> void {
                separator();
                echo::info(title.c_str()).cyan();
                separator();
            }

            auto separator() const -> void { echo::info("--------------------------------------------------"); }
        };

    } // namespace ui

} // namespace homelab
