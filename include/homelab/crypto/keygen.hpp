/* SPDX-License-Identifier: MIT */
/*
 * Homelab Key Generation
 * WireGuard key generation capability: keylock, wg tool and a deterministic double
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>
#include <homelab/crypto/wg_key.hpp>
#include <homelab/sys/command.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <keylock/crypto/box_seal_x25519/x25519.hpp>
#include <keylock/keylock.hpp>

namespace homelab {

    using namespace dp;

    namespace crypto {

        // =============================================================================
        // Key Generator Interface
        // =============================================================================

        // All keys travel as base64 text, the form written into config files.
        class KeyGenerator {
          public:
            virtual ~KeyGenerator() = default;

            virtual auto generate_private_key() -> Res<String> = 0;

            virtual auto derive_public_key(const String &private_key) -> Res<String> = 0;

            virtual auto generate_preshared_key() -> Res<String> = 0;
        };

        // Private key plus the public key derived from it
        struct KeyPair {
            String private_key;
            String public_key;

            auto members() noexcept { return std::tie(private_key, public_key); }
            auto members() const noexcept { return std::tie(private_key, public_key); }
        };

        [[nodiscard]] inline auto generate_keypair(KeyGenerator &gen) -> Res<KeyPair> {
            auto priv = gen.generate_private_key();
            if (priv.is_err()) {
                return result::err(err::wrap("failed to generate private key", priv.error()));
            }
            auto pub = gen.derive_public_key(priv.value());
            if (pub.is_err()) {
                return result::err(err::wrap("failed to derive public key", pub.error()));
            }
            KeyPair pair;
            pair.private_key = priv.value();
            pair.public_key = pub.value();
            return result::ok(pair);
        }

        // =============================================================================
        // Keylock Generator (native, libsodium backed)
        // =============================================================================

        class KeylockKeyGenerator : public KeyGenerator {
          private:
            static auto random_key() -> Key {
                Key key;
                auto random = keylock::crypto::Common::generate_random_bytes(KEY_SIZE);
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    key.data[i] = random[i];
                }
                keylock::crypto::Common::secure_clear(random.data(), random.size());
                return key;
            }

          public:
            KeylockKeyGenerator() = default;

            auto generate_private_key() -> Res<String> override {
                Key key = random_key();
                clamp_private(key);
                return result::ok(key_to_base64(key));
            }

            auto derive_public_key(const String &private_key) -> Res<String> override {
                auto priv = key_from_base64(private_key);
                if (priv.is_err()) {
                    return result::err(priv.error());
                }
                Key pub;
                keylock::crypto::x25519::public_key(pub.raw(), priv.value().raw());
                return result::ok(key_to_base64(pub));
            }

            auto generate_preshared_key() -> Res<String> override { return result::ok(key_to_base64(random_key())); }
        };

        // =============================================================================
        // wg Tool Generator
        // =============================================================================

        // Shells out to `wg genkey`, `wg pubkey` and `wg genpsk`
        class WgToolKeyGenerator : public KeyGenerator {
          private:
            sys::CommandRunner &runner_;

            auto run_wg(const char *subcommand, const String &stdin_data) -> Res<String> {
                Vector<String> args;
                args.push_back(String(subcommand));
                auto out = sys::run_checked(runner_, "wg", args, stdin_data);
                if (out.is_err()) {
                    return result::err(out.error());
                }
                if (!is_valid_key(out.value())) {
                    return result::err(err::command(String("wg ") + subcommand, "unexpected key output"));
                }
                return out;
            }

          public:
            explicit WgToolKeyGenerator(sys::CommandRunner &runner) : runner_(runner) {}

            auto generate_private_key() -> Res<String> override { return run_wg("genkey", String()); }

            auto derive_public_key(const String &private_key) -> Res<String> override {
                return run_wg("pubkey", private_key + "\n");
            }

            auto generate_preshared_key() -> Res<String> override { return run_wg("genpsk", String()); }
        };

        // =============================================================================
        // Fake Generator (deterministic double)
        // =============================================================================

        // Produces priv-N, pub-<private> and psk-N. Counts calls and can be told to fail.
        class FakeKeyGenerator : public KeyGenerator {
          private:
            u32 private_count_ = 0;
            u32 preshared_count_ = 0;
            u32 derive_count_ = 0;
            boolean fail_ = false;

          public:
            FakeKeyGenerator() = default;

            auto set_failing(boolean fail) -> void { fail_ = fail; }

            [[nodiscard]] auto private_count() const -> u32 { return private_count_; }
            [[nodiscard]] auto preshared_count() const -> u32 { return preshared_count_; }
            [[nodiscard]] auto derive_count() const -> u32 { return derive_count_; }
            [[nodiscard]] auto total_calls() const -> u32 { return private_count_ + preshared_count_ + derive_count_; }

            auto generate_private_key() -> Res<String> override {
                ++private_count_;
                if (fail_) {
                    return result::err(err::command("wg genkey", "simulated failure"));
                }
                return result::ok(String("priv-") + to_str(private_count_));
            }

            auto derive_public_key(const String &private_key) -> Res<String> override {
                ++derive_count_;
                if (fail_) {
                    return result::err(err::command("wg pubkey", "simulated failure"));
                }
                return result::ok(String("pub-") + private_key);
            }

            auto generate_preshared_key() -> Res<String> override {
                ++preshared_count_;
                if (fail_) {
                    return result::err(err::command("wg genpsk", "simulated failure"));
                }
                return result::ok(String("psk-") + to_str(preshared_count_));
            }
        };

    } // namespace crypto

} // namespace homelab
