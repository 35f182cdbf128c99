/* SPDX-License-Identifier: MIT */
/*
 * Homelab Config Store
 * Persistent key=value configuration with atomic save and completion markers
 */

#pragma once

#include <homelab/cfg/keys.hpp>
#include <homelab/core/result.hpp>
#include <homelab/core/time.hpp>
#include <homelab/core/types.hpp>
#include <homelab/sys/fs.hpp>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <unistd.h>

namespace homelab {

    using namespace dp;

    namespace cfg {

        inline constexpr u32 CONFIG_FILE_MODE = 0600;
        inline constexpr u32 MARKER_DIR_MODE = 0755;
        inline constexpr u32 MARKER_FILE_MODE = 0644;
        inline constexpr const char *CONFIG_HEADER = "# UBlue uCore Homelab Setup Configuration";

        // =============================================================================
        // Store Paths
        // =============================================================================

        struct StorePaths {
            String config_file;
            String marker_dir;

            StorePaths() = default;
            StorePaths(String file, String markers) : config_file(std::move(file)), marker_dir(std::move(markers)) {}

            auto members() noexcept { return std::tie(config_file, marker_dir); }
            auto members() const noexcept { return std::tie(config_file, marker_dir); }
        };

        // Per-user locations under the given home directory
        [[nodiscard]] inline auto default_paths(const String &home) -> StorePaths {
            String base = home.empty() ? String(FALLBACK_HOME) : home;
            return StorePaths(sys::join_path(base, ".homelab-setup.conf"),
                              sys::join_path(base, ".local/homelab-setup"));
        }

        // =============================================================================
        // Validation
        // =============================================================================

        // Marker names become file names: no separators, no dot entries
        [[nodiscard]] inline auto validate_marker_name(const String &name) -> VoidRes {
            if (name.empty()) {
                return result::err(err::invalid("Marker name cannot be empty"));
            }
            if (str::contains_any(name, "/\\")) {
                return result::err(err::invalid(String("Marker name contains a path separator: ") + name));
            }
            if (name == "." || name == "..") {
                return result::err(err::invalid(String("Invalid marker name: ") + name));
            }
            if (name.find('\0') != String::npos) {
                return result::err(err::invalid("Marker name contains NUL"));
            }
            return result::ok();
        }

        [[nodiscard]] inline auto validate_key(const String &key) -> VoidRes {
            if (key.empty()) {
                return result::err(err::invalid("Config key cannot be empty"));
            }
            if (key[0] == '#') {
                return result::err(err::invalid(String("Config key cannot start with '#': ") + key));
            }
            if (str::contains_any(key, "=\n\r") || key.find('\0') != String::npos) {
                return result::err(err::invalid(String("Config key contains invalid characters: ") + key));
            }
            if (str::trim(key) != key) {
                return result::err(err::invalid(String("Config key has surrounding whitespace: ") + key));
            }
            return result::ok();
        }

        [[nodiscard]] inline auto validate_value(const String &value) -> VoidRes {
            if (str::contains_any(value, "\n\r") || value.find('\0') != String::npos) {
                return result::err(err::invalid("Config value cannot contain line breaks or NUL"));
            }
            return result::ok();
        }

        // =============================================================================
        // Config Store
        // =============================================================================

        class ConfigStore {
          private:
            StorePaths paths_;
            Map<String, String> data_;
            boolean loaded_ = false;

          public:
            explicit ConfigStore(StorePaths paths) : paths_(std::move(paths)) {}

            [[nodiscard]] auto path() const -> const String & { return paths_.config_file; }
            [[nodiscard]] auto marker_dir() const -> const String & { return paths_.marker_dir; }

            // =============================================================================
            // Loading and Saving
            // =============================================================================

            // Load from disk. A missing file is an empty store.
            auto reload() -> VoidRes {
                data_.clear();
                loaded_ = false;

                auto content = sys::read_file(paths_.config_file);
                if (content.is_err()) {
                    if (err::is_not_found(content.error())) {
                        loaded_ = true;
                        return result::ok();
                    }
                    return result::err(err::wrap("failed to load config", content.error()));
                }

                std::istringstream stream(std::string(content.value().c_str(), content.value().size()));
                std::string line;
                while (std::getline(stream, line)) {
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    String raw(line.c_str(), line.size());
                    String trimmed = str::trim(raw);
                    if (trimmed.empty() || trimmed[0] == '#') {
                        continue;
                    }
                    usize eq = raw.find('=');
                    if (eq == String::npos) {
                        echo::warn("Ignoring malformed config line in ", paths_.config_file.c_str());
                        continue;
                    }
                    // Values are kept verbatim so they round-trip through save
                    String key = str::trim(raw.substr(0, eq));
                    String value = raw.substr(eq + 1);
                    if (key.empty()) {
                        continue;
                    }
                    data_[key] = value;
                }

                loaded_ = true;
                return result::ok();
            }

            // Serialized file content: header, blank line, sorted key=value lines
            [[nodiscard]] auto serialize() const -> String {
                Vector<String> sorted_keys;
                for (const auto &[key, _] : data_) {
                    sorted_keys.push_back(key);
                }
                std::sort(sorted_keys.begin(), sorted_keys.end(),
                          [](const String &a, const String &b) { return std::strcmp(a.c_str(), b.c_str()) < 0; });

                String out;
                out += CONFIG_HEADER;
                out += "\n# Generated: ";
                out += time::now_rfc3339();
                out += "\n\n";
                for (const auto &key : sorted_keys) {
                    auto it = data_.find(key);
                    out += key;
                    out += "=";
                    out += it->second;
                    out += "\n";
                }
                return out;
            }

            auto save() -> VoidRes {
                auto dir_res = sys::ensure_dir(sys::dirname(paths_.config_file), 0755);
                if (dir_res.is_err()) {
                    return dir_res;
                }
                return sys::write_file_atomic(paths_.config_file, serialize(), CONFIG_FILE_MODE);
            }

            // =============================================================================
            // Key/Value Access
            // =============================================================================

            [[nodiscard]] auto get(const String &key) -> Res<String> {
                auto load_res = ensure_loaded();
                if (load_res.is_err()) {
                    return result::err(load_res.error());
                }
                auto it = data_.find(key);
                if (it == data_.end()) {
                    return result::err(err::not_found(String("config key not found: ") + key));
                }
                return result::ok(it->second);
            }

            // Stored value, then the defaults table, then the fallback. Never fails.
            [[nodiscard]] auto get_or_default(const String &key, const String &fallback) -> String {
                auto value = get(key);
                if (value.is_ok()) {
                    return value.value();
                }
                if (!err::is_not_found(value.error())) {
                    echo::warn("Config read failed, using default for ", key.c_str(), ": ",
                               value.error().message.c_str());
                }
                auto def = default_for(key.c_str());
                if (def.has_value()) {
                    return def.value();
                }
                return fallback;
            }

            [[nodiscard]] auto exists(const String &key) -> boolean {
                if (ensure_loaded().is_err()) {
                    return false;
                }
                return data_.find(key) != data_.end();
            }

            auto set(const String &key, const String &value) -> VoidRes {
                auto key_res = validate_key(key);
                if (key_res.is_err()) {
                    return key_res;
                }
                auto value_res = validate_value(value);
                if (value_res.is_err()) {
                    return value_res;
                }
                auto load_res = ensure_loaded();
                if (load_res.is_err()) {
                    return load_res;
                }

                data_[key] = value;
                return save();
            }

            auto remove(const String &key) -> VoidRes {
                auto load_res = ensure_loaded();
                if (load_res.is_err()) {
                    return load_res;
                }
                auto it = data_.find(key);
                if (it == data_.end()) {
                    return result::ok();
                }
                data_.erase(it);
                return save();
            }

            [[nodiscard]] auto get_all() -> Map<String, String> {
                if (ensure_loaded().is_err()) {
                    return {};
                }
                return data_;
            }

            // Delete the config file and forget cached values
            auto remove_config_file() -> VoidRes {
                data_.clear();
                loaded_ = false;
                return sys::remove_file(paths_.config_file);
            }

            // =============================================================================
            // Completion Markers
            // =============================================================================

            auto mark_complete(const String &name) -> VoidRes {
                auto valid = validate_marker_name(name);
                if (valid.is_err()) {
                    return valid;
                }
                auto dir_res = sys::ensure_dir(paths_.marker_dir, MARKER_DIR_MODE);
                if (dir_res.is_err()) {
                    return dir_res;
                }

                String marker = sys::join_path(paths_.marker_dir, name);
                int fd = ::open(marker.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, MARKER_FILE_MODE);
                if (fd < 0) {
                    return result::err(err::io_at("Failed to create marker", marker));
                }
                ::close(fd);
                return result::ok();
            }

            // Exclusive create. Returns false (not an error) when the marker already exists.
            auto mark_complete_if_not_exists(const String &name) -> Res<boolean> {
                auto valid = validate_marker_name(name);
                if (valid.is_err()) {
                    return result::err(valid.error());
                }
                auto dir_res = sys::ensure_dir(paths_.marker_dir, MARKER_DIR_MODE);
                if (dir_res.is_err()) {
                    return result::err(dir_res.error());
                }

                String marker = sys::join_path(paths_.marker_dir, name);
                int fd = ::open(marker.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, MARKER_FILE_MODE);
                if (fd < 0) {
                    if (errno == EEXIST) {
                        return result::ok(false);
                    }
                    return result::err(err::io_at("Failed to create marker", marker));
                }
                ::close(fd);
                return result::ok(true);
            }

            [[nodiscard]] auto is_complete(const String &name) const -> boolean {
                if (validate_marker_name(name).is_err()) {
                    return false;
                }
                return sys::path_exists(sys::join_path(paths_.marker_dir, name));
            }

            auto clear_marker(const String &name) -> VoidRes {
                auto valid = validate_marker_name(name);
                if (valid.is_err()) {
                    return valid;
                }
                return sys::remove_file(sys::join_path(paths_.marker_dir, name));
            }

            auto clear_all_markers() -> VoidRes { return sys::remove_flat_dir(paths_.marker_dir); }

            [[nodiscard]] auto list_markers() const -> Res<Vector<String>> {
                auto files = sys::list_files(paths_.marker_dir);
                if (files.is_err()) {
                    return files;
                }
                Vector<String> names = files.value();
                std::sort(names.begin(), names.end(),
                          [](const String &a, const String &b) { return std::strcmp(a.c_str(), b.c_str()) < 0; });
                return result::ok(names);
            }

          private:
            auto ensure_loaded() -> VoidRes {
                if (loaded_) {
                    return result::ok();
                }
                return reload();
            }
        };

    } // namespace cfg

} // namespace homelab
