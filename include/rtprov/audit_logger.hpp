/**
 * @file audit_logger.hpp
 * @brief Persistent record of what a provisioning run did to the host
 *
 * Every run appends to <log_dir>/audit.log. One line per event:
 *
 *   [2017-03-01 12:00:00] [STEP] Stage fetch
 *   [2017-03-01 12:00:04] [ACTION] Fetched release: /opt/docker/17.03.1-ce
 *   [2017-03-01 12:00:04] [SKIP] Link mode: Symlink modes are not supported on this platform
 *
 * log_dir defaults to /var/log/rtprov for root and ~/.rtprov/logs otherwise.
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace rtprov {

    /**
     * @brief File name of the audit log inside the log directory
     */
    inline constexpr const char* AUDIT_LOG_FILENAME = "audit.log";

    /**
     * @brief Categories of audit log entries
     */
    enum class AuditCategory {
        STEP,       // Stage entered
        ACTION,     // Host modified
        SKIP,       // Host already converged
        ERROR,      // Stage failed
        SUCCESS,    // Stage or run completed
        INFO        // Anything else
    };

    /**
     * @brief Appends categorized, timestamped lines to audit.log
     *
     * Lines are flushed as they are written so an aborted run still leaves
     * its trail. Writes are serialized by a mutex.
     */
    class AuditLogger {
    public:
        /**
         * @brief Opens (creating if needed) <logs_dir>/audit.log for appending
         *
         * An unusable log directory is reported on stderr and the logger
         * then drops its entries; provisioning never fails because of it.
         *
         * @param logs_dir Directory holding audit.log
         */
        explicit AuditLogger(std::filesystem::path logs_dir);

        ~AuditLogger();

        AuditLogger(const AuditLogger&) = delete;
        AuditLogger& operator=(const AuditLogger&) = delete;

        /**
         * @brief Records entry into a stage
         *
         * @param stage Stage name (e.g. "fetch")
         * @param details Appended after ": " when not empty
         */
        void log_step(const std::string& stage, const std::string& details = "");

        void log_action(const std::string& action, const std::string& details = "");

        void log_skip(const std::string& operation, const std::string& details = "");

        /**
         * @brief Records a failure
         *
         * @param error What went wrong
         * @param context Stage name, written as a "[context] " prefix
         */
        void log_error(const std::string& error, const std::string& context = "");

        void log_success(const std::string& operation, const std::string& details = "");

        void log_info(const std::string& message);

        [[nodiscard]] std::filesystem::path get_log_path() const { return audit_log_path_; }

        /**
         * @brief Reads back the tail of the log
         *
         * @param n Number of lines to return
         * @return std::string The last n lines, each terminated by '\n'
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

    private:
        std::filesystem::path audit_log_path_;
        std::ofstream log_file_;
        mutable std::mutex mutex_;

        /** @brief Local time as YYYY-MM-DD HH:MM:SS */
        [[nodiscard]] static std::string timestamp();

        [[nodiscard]] static const char* category_name(AuditCategory category);

        void write_entry(AuditCategory category, const std::string& message);
    };

} // namespace rtprov
