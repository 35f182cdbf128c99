/* SPDX-License-Identifier: MIT */
/*
 * Homelab Result Types
 * Convenience aliases for datapod Result types and the error taxonomy
 */

#pragma once

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    // =============================================================================
    // Result Type Aliases
    // =============================================================================

    // Generic result with custom error type
    template <typename T, typename E = Error> using Result = dp::Result<T, E>;

    // Result with default Error type
    template <typename T> using Res = dp::Res<T>;

    // Void result (operations that don't return a value)
    using VoidRes = dp::VoidRes;

    // =============================================================================
    // Result Factory Functions
    // =============================================================================

    namespace result {

        using dp::result::err;
        using dp::result::Err;
        using dp::result::ok;
        using dp::result::Ok;

    } // namespace result

    // =============================================================================
    // Error Creation Helpers
    // =============================================================================

    namespace err {

        // Bad user input (CIDR, port, key format, marker name). Never retried.
        inline auto invalid(const char *msg) -> Error { return Error::invalid_argument(msg); }
        inline auto invalid(const String &msg) -> Error { return Error::invalid_argument(msg.c_str()); }

        inline auto io(const char *msg) -> Error { return Error::io_error(msg); }

        // I/O failure carrying the failing path
        inline auto io_at(const char *what, const String &path) -> Error {
            String msg = String(what) + ": " + path;
            return Error::io_error(msg.c_str());
        }

        inline auto not_found(const char *msg) -> Error { return Error::not_found(msg); }
        inline auto not_found(const String &msg) -> Error { return Error::not_found(msg.c_str()); }

        inline auto permission(const char *msg) -> Error { return Error::permission_denied(msg); }

        // Subnet has no host addresses left
        inline auto exhausted(const char *msg) -> Error { return Error::out_of_range(msg); }

        // Failed external program, with its captured output
        inline auto command(const String &program, const String &output) -> Error {
            String msg = String("command '") + program + "' failed";
            if (!output.empty()) {
                msg += ": ";
                msg += output;
            }
            return Error::io_error(msg.c_str());
        }

        // Prefix an error with context, keeping its code
        inline auto wrap(const String &context, const Error &inner) -> Error {
            Error e = inner;
            e.message = context + ": " + inner.message;
            return e;
        }

        [[nodiscard]] inline auto is_validation(const Error &e) -> boolean {
            return e.code == Error::INVALID_ARGUMENT;
        }
        [[nodiscard]] inline auto is_io(const Error &e) -> boolean { return e.code == Error::IO_ERROR; }
        [[nodiscard]] inline auto is_not_found(const Error &e) -> boolean {
            return e.code == Error::NOT_FOUND;
        }
        [[nodiscard]] inline auto is_exhausted(const Error &e) -> boolean {
            return e.code == Error::out_of_range("").code;
        }

    } // namespace err

} // namespace homelab
