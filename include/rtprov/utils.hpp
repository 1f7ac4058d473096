/**
 * @file utils.hpp
 * @brief Utility functions for path expansion and template substitution
 *
 * This header provides helper functions for:
 * - Expanding tilde (~) to user's home directory
 * - Locating the default audit log directory
 * - Substituting placeholders in URL and command templates
 * - Validating release identifiers used as directory names
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace rtprov {

    /**
     * @brief Placeholder substituted with the release identifier in URL templates
     */
    inline constexpr const char* VERSION_PLACEHOLDER = "{version}";

    /**
     * @brief Placeholder substituted with the package name in package manager commands
     */
    inline constexpr const char* PACKAGE_PLACEHOLDER = "{package}";

    /**
     * @brief Name of the symlink that points at the active version directory
     */
    inline constexpr const char* CURRENT_LINK_NAME = "current";

    /**
     * @brief Expands a tilde (~) in a path to the user's home directory
     *
     * Examples:
     *   "~/.rtprov"      → "/home/username/.rtprov"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *   "relative/path"  → "relative/path" (unchanged)
     *
     * @param path The path string that may contain a tilde
     * @return std::filesystem::path The expanded path
     *
     * @note If HOME environment variable is not set, returns the original path
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            std::cerr << "HOME environment variable not set" << std::endl;
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Gets the default directory for the audit log
     *
     * Root runs log system-wide to /var/log/rtprov, everyone else
     * to ~/.rtprov/logs.
     *
     * @return std::filesystem::path Default log directory
     */
    inline std::filesystem::path get_default_log_dir() {
        if (geteuid() == 0) {
            return "/var/log/rtprov";
        }
        return expand_tilde("~/.rtprov/logs");
    }

    /**
     * @brief Replaces every occurrence of a placeholder in a template
     *
     * @param text Template text
     * @param placeholder Placeholder to look for, e.g. "{version}"
     * @param value Replacement value
     * @return std::string Text with all placeholders replaced
     */
    inline std::string substitute(std::string text,
                                  const std::string& placeholder,
                                  const std::string& value) {
        if (placeholder.empty()) {
            return text;
        }

        size_t pos = 0;
        while ((pos = text.find(placeholder, pos)) != std::string::npos) {
            text.replace(pos, placeholder.length(), value);
            pos += value.length();
        }
        return text;
    }

    /**
     * @brief Substitutes a placeholder in every element of an argv template
     */
    inline std::vector<std::string> substitute_all(std::vector<std::string> argv,
                                                   const std::string& placeholder,
                                                   const std::string& value) {
        for (auto& arg : argv) {
            arg = substitute(arg, placeholder, value);
        }
        return argv;
    }

    /**
     * @brief Checks that a release identifier can be used as a directory name
     *
     * A release must be a single, non-empty path component that does not
     * start with '.' and does not collide with the current link.
     *
     * @param version Release identifier, e.g. "17.03.1-ce"
     * @return true if the identifier is usable
     */
    inline bool is_valid_version(const std::string& version) {
        // Leading dots are reserved for staging entries in the install root
        if (version.empty() || version[0] == '.') {
            return false;
        }
        if (version == CURRENT_LINK_NAME) {
            return false;
        }
        return version.find('/') == std::string::npos &&
               version.find('\0') == std::string::npos;
    }

    /**
     * @brief Joins an argv vector into a single printable string
     */
    inline std::string join_command(const std::vector<std::string>& argv) {
        std::string result;
        for (const auto& arg : argv) {
            if (!result.empty()) {
                result += ' ';
            }
            result += arg;
        }
        return result;
    }

} // namespace rtprov
