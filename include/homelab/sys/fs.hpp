/* SPDX-License-Identifier: MIT */
/*
 * Homelab Filesystem Helpers
 * Atomic rewrite, directory creation and small-file IO on POSIX
 */

#pragma once

#include <homelab/core/result.hpp>
#include <homelab/core/types.hpp>

#include <datapod/datapod.hpp>

#include <cerrno>
#include <cstdio>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace homelab {

    using namespace dp;

    namespace sys {

        // =============================================================================
        // Path Helpers
        // =============================================================================

        [[nodiscard]] inline auto dirname(const String &path) -> String {
            usize pos = path.rfind('/');
            if (pos == String::npos) {
                return String(".");
            }
            if (pos == 0) {
                return String("/");
            }
            return path.substr(0, pos);
        }

        [[nodiscard]] inline auto basename(const String &path) -> String {
            usize pos = path.rfind('/');
            if (pos == String::npos) {
                return path;
            }
            return path.substr(pos + 1);
        }

        [[nodiscard]] inline auto join_path(const String &dir, const String &name) -> String {
            if (dir.empty()) {
                return name;
            }
            if (dir[dir.size() - 1] == '/') {
                return dir + name;
            }
            return dir + "/" + name;
        }

        [[nodiscard]] inline auto path_exists(const String &path) -> boolean {
            struct stat st {};
            return ::stat(path.c_str(), &st) == 0;
        }

        [[nodiscard]] inline auto is_directory(const String &path) -> boolean {
            struct stat st {};
            return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        }

        // Permission bits of an existing path
        [[nodiscard]] inline auto file_mode(const String &path) -> Res<u32> {
            struct stat st {};
            if (::stat(path.c_str(), &st) != 0) {
                return result::err(err::io_at("Failed to stat", path));
            }
            return result::ok(static_cast<u32>(st.st_mode & 07777));
        }

        // =============================================================================
        // Directories
        // =============================================================================

        // mkdir -p with the given mode for each created component
        [[nodiscard]] inline auto ensure_dir(const String &path, u32 mode) -> VoidRes {
            if (path.empty()) {
                return result::err(err::invalid("Empty directory path"));
            }
            if (is_directory(path)) {
                return result::ok();
            }

            String parent = dirname(path);
            if (parent != path && !is_directory(parent)) {
                auto res = ensure_dir(parent, mode);
                if (res.is_err()) {
                    return res;
                }
            }

            if (::mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0) {
                if (errno != EEXIST || !is_directory(path)) {
                    return result::err(err::io_at("Failed to create directory", path));
                }
            }
            return result::ok();
        }

        // Names of regular files directly inside a directory
        [[nodiscard]] inline auto list_files(const String &dir) -> Res<Vector<String>> {
            Vector<String> names;
            DIR *d = ::opendir(dir.c_str());
            if (d == nullptr) {
                if (errno == ENOENT) {
                    return result::ok(names);
                }
                return result::err(err::io_at("Failed to read directory", dir));
            }

            while (struct dirent *entry = ::readdir(d)) {
                String name(entry->d_name);
                if (name == "." || name == "..") {
                    continue;
                }
                if (is_directory(join_path(dir, name))) {
                    continue;
                }
                names.push_back(name);
            }
            ::closedir(d);
            return result::ok(names);
        }

        // Remove a directory and the plain files inside it. Missing directory is fine.
        [[nodiscard]] inline auto remove_flat_dir(const String &dir) -> VoidRes {
            if (!path_exists(dir)) {
                return result::ok();
            }
            auto files = list_files(dir);
            if (files.is_err()) {
                return result::err(files.error());
            }
            for (const auto &name : files.value()) {
                String full = join_path(dir, name);
                if (::unlink(full.c_str()) != 0 && errno != ENOENT) {
                    return result::err(err::io_at("Failed to remove", full));
                }
            }
            if (::rmdir(dir.c_str()) != 0 && errno != ENOENT) {
                return result::err(err::io_at("Failed to remove directory", dir));
            }
            return result::ok();
        }

        // =============================================================================
        // Files
        // =============================================================================

        [[nodiscard]] inline auto read_file(const String &path) -> Res<String> {
            std::ifstream file(path.c_str());
            if (!file.is_open()) {
                if (!path_exists(path)) {
                    return result::err(err::not_found(String("No such file: ") + path));
                }
                return result::err(err::io_at("Failed to open", path));
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            std::string content = buffer.str();
            return result::ok(String(content.c_str(), content.size()));
        }

        [[nodiscard]] inline auto remove_file(const String &path) -> VoidRes {
            if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
                return result::err(err::io_at("Failed to remove", path));
            }
            return result::ok();
        }

        namespace detail {
            inline auto write_all(int fd, const String &content) -> boolean {
                usize written = 0;
                while (written < content.size()) {
                    ssize_t n = ::write(fd, content.c_str() + written, content.size() - written);
                    if (n < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        return false;
                    }
                    written += static_cast<usize>(n);
                }
                return true;
            }
        } // namespace detail

        // Write to a temp file beside the target, fsync, then rename over it.
        // The target is never observed partially written.
        [[nodiscard]] inline auto write_file_atomic(const String &path, const String &content, u32 mode) -> VoidRes {
            String dir = dirname(path);
            String tmpl = join_path(dir, String(".") + basename(path) + ".tmp-XXXXXX");

            Vector<char> name_buf;
            name_buf.reserve(tmpl.size() + 1);
            for (usize i = 0; i < tmpl.size(); ++i) {
                name_buf.push_back(tmpl[i]);
            }
            name_buf.push_back('\0');

            int fd = ::mkstemp(name_buf.data());
            if (fd < 0) {
                return result::err(err::io_at("Failed to create temp file in", dir));
            }
            String tmp_path(name_buf.data());

            auto fail = [&](const char *what) -> VoidRes {
                ::close(fd);
                ::unlink(tmp_path.c_str());
                return result::err(err::io_at(what, path));
            };

            if (::fchmod(fd, static_cast<mode_t>(mode)) != 0) {
                return fail("Failed to set permissions for");
            }
            if (!detail::write_all(fd, content)) {
                return fail("Failed to write");
            }
            if (::fsync(fd) != 0) {
                return fail("Failed to sync");
            }
            if (::close(fd) != 0) {
                ::unlink(tmp_path.c_str());
                return result::err(err::io_at("Failed to close temp file for", path));
            }
            if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
                ::unlink(tmp_path.c_str());
                return result::err(err::io_at("Failed to rename temp file onto", path));
            }
            return result::ok();
        }

    } // namespace sys

} // namespace homelab
