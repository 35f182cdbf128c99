/* SPDX-License-Identifier: MIT */
/*
 * Homelab WireGuard Keys
 * Curve25519 key material and its base64 text form
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>

namespace homelab {

    using namespace dp;

    namespace crypto {

        inline constexpr usize KEY_SIZE = 32;
        inline constexpr usize KEY_B64_LEN = 44;

        // =============================================================================
        // Key - 32 bytes, zeroed on destruction
        // =============================================================================

        struct Key {
            Array<u8, KEY_SIZE> data{};

            Key() = default;

            Key(const Key &other) {
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    data[i] = other.data[i];
                }
            }

            auto operator=(const Key &other) -> Key & {
                if (this != &other) {
                    for (usize i = 0; i < KEY_SIZE; ++i) {
                        data[i] = other.data[i];
                    }
                }
                return *this;
            }

            ~Key() { secure_clear(); }

            // Secure clear using volatile to prevent optimization
            auto secure_clear() -> void {
                volatile u8 *p = data.data();
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    p[i] = 0;
                }
            }

            [[nodiscard]] auto is_zero() const -> boolean {
                u8 acc = 0;
                for (usize i = 0; i < KEY_SIZE; ++i) {
                    acc |= data[i];
                }
                return acc == 0;
            }

            [[nodiscard]] auto raw() -> u8 * { return data.data(); }
            [[nodiscard]] auto raw() const -> const u8 * { return data.data(); }

            auto members() noexcept { return std::tie(data); }
            auto members() const noexcept { return std::tie(data); }
        };

        // Curve25519 clamping as WireGuard applies it to private keys
        inline auto clamp_private(Key &key) -> void {
            key.data[0] &= 248;
            key.data[31] = (key.data[31] & 127) | 64;
        }

        // =============================================================================
        // Base64
        // =============================================================================

        namespace detail {

            inline constexpr char B64_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

            inline auto b64_decode_char(char c) -> i32 {
                if (c >= 'A' && c <= 'Z')
                    return c - 'A';
                if (c >= 'a' && c <= 'z')
                    return c - 'a' + 26;
                if (c >= '0' && c <= '9')
                    return c - '0' + 52;
                if (c == '+')
                    return 62;
                if (c == '/')
                    return 63;
                return -1;
            }

        } // namespace detail

        [[nodiscard]] inline auto key_to_base64(const Key &key) -> String {
            String out;
            out.reserve(KEY_B64_LEN);
            for (usize i = 0; i < KEY_SIZE; i += 3) {
                u32 n = static_cast<u32>(key.data[i]) << 16;
                if (i + 1 < KEY_SIZE)
                    n |= static_cast<u32>(key.data[i + 1]) << 8;
                if (i + 2 < KEY_SIZE)
                    n |= static_cast<u32>(key.data[i + 2]);

                out.push_back(detail::B64_CHARS[(n >> 18) & 0x3F]);
                out.push_back(detail::B64_CHARS[(n >> 12) & 0x3F]);
                out.push_back(i + 1 < KEY_SIZE ? detail::B64_CHARS[(n >> 6) & 0x3F] : '=');
                out.push_back(i + 2 < KEY_SIZE ? detail::B64_CHARS[n & 0x3F] : '=');
            }
            return out;
        }

        // Decode a 44-character key (one '=' pad) into 32 bytes
        [[nodiscard]] inline auto key_from_base64(const String &text) -> Res<Key> {
            if (text.size() != KEY_B64_LEN || text[KEY_B64_LEN - 1] != '=' || text[KEY_B64_LEN - 2] == '=') {
                return result::err(err::invalid("Invalid key: expected 44 base64 characters"));
            }

            Key key;
            usize out = 0;
            for (usize i = 0; i < KEY_B64_LEN; i += 4) {
                i32 v[4];
                for (usize j = 0; j < 4; ++j) {
                    v[j] = text[i + j] == '=' ? 0 : detail::b64_decode_char(text[i + j]);
                    if (v[j] < 0) {
                        return result::err(err::invalid("Invalid key: bad base64 character"));
                    }
                }
                u32 n = (static_cast<u32>(v[0]) << 18) | (static_cast<u32>(v[1]) << 12) |
                        (static_cast<u32>(v[2]) << 6) | static_cast<u32>(v[3]);
                key.data[out++] = static_cast<u8>((n >> 16) & 0xFF);
                key.data[out++] = static_cast<u8>((n >> 8) & 0xFF);
                if (out < KEY_SIZE) {
                    key.data[out++] = static_cast<u8>(n & 0xFF);
                } else if ((n & 0xFF) != 0) {
                    return result::err(err::invalid("Invalid key: non-canonical padding"));
                }
            }
            return result::ok(key);
        }

        [[nodiscard]] inline auto is_valid_key(const String &text) -> boolean { return key_from_base64(text).is_ok(); }

    } // namespace crypto

} // namespace homelab
