#include "rtprov/audit_logger.hpp"
#include <unistd.h>
#include <ctime>
#include <iostream>
#include <vector>

namespace rtprov {

    namespace fs = std::filesystem;

    namespace {
        std::string compose(const std::string& subject, const std::string& details) {
            if (details.empty()) {
                return subject;
            }
            return subject + ": " + details;
        }
    }

    AuditLogger::AuditLogger(fs::path logs_dir)
        : audit_log_path_(logs_dir / AUDIT_LOG_FILENAME) {
        std::error_code ec;
        fs::create_directories(logs_dir, ec);
        if (ec) {
            std::cerr << "[AuditLogger] Cannot create " << logs_dir << ": " << ec.message() << std::endl;
        }

        log_file_.open(audit_log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "[AuditLogger] Cannot open " << audit_log_path_
                      << ", audit entries will be dropped" << std::endl;
            return;
        }

        write_entry(AuditCategory::INFO, "Audit log opened by pid " + std::to_string(getpid()));
    }

    AuditLogger::~AuditLogger() {
        if (log_file_.is_open()) {
            write_entry(AuditCategory::INFO, "Audit log closed by pid " + std::to_string(getpid()));
        }
    }

    void AuditLogger::log_step(const std::string& stage, const std::string& details) {
        write_entry(AuditCategory::STEP, compose("Stage " + stage, details));
    }

    void AuditLogger::log_action(const std::string& action, const std::string& details) {
        write_entry(AuditCategory::ACTION, compose(action, details));
    }

    void AuditLogger::log_skip(const std::string& operation, const std::string& details) {
        write_entry(AuditCategory::SKIP, compose(operation, details));
    }

    void AuditLogger::log_error(const std::string& error, const std::string& context) {
        write_entry(AuditCategory::ERROR, context.empty() ? error : "[" + context + "] " + error);
    }

    void AuditLogger::log_success(const std::string& operation, const std::string& details) {
        write_entry(AuditCategory::SUCCESS, compose(operation, details));
    }

    void AuditLogger::log_info(const std::string& message) {
        write_entry(AuditCategory::INFO, message);
    }

    std::string AuditLogger::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream file(audit_log_path_);
        if (!file.is_open() || n == 0) {
            return "";
        }

        // Ring of the last n lines; `next` is the oldest slot once full
        std::vector<std::string> ring;
        ring.reserve(n);
        size_t next = 0;

        std::string line;
        while (std::getline(file, line)) {
            if (ring.size() < n) {
                ring.push_back(std::move(line));
            } else {
                ring[next] = std::move(line);
                next = (next + 1) % n;
            }
        }

        std::string tail;
        for (size_t i = 0; i < ring.size(); ++i) {
            tail += ring[(next + i) % ring.size()];
            tail += '\n';
        }
        return tail;
    }

    std::string AuditLogger::timestamp() {
        std::time_t now = std::time(nullptr);
        std::tm local_time{};
        localtime_r(&now, &local_time);

        char buffer[32];
        size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_time);
        return std::string(buffer, length);
    }

    const char* AuditLogger::category_name(AuditCategory category) {
        switch (category) {
            case AuditCategory::STEP:    return "STEP";
            case AuditCategory::ACTION:  return "ACTION";
            case AuditCategory::SKIP:    return "SKIP";
            case AuditCategory::ERROR:   return "ERROR";
            case AuditCategory::SUCCESS: return "SUCCESS";
            case AuditCategory::INFO:    return "INFO";
        }
        return "UNKNOWN";
    }

    void AuditLogger::write_entry(AuditCategory category, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!log_file_.is_open()) {
            return;
        }

        log_file_ << "[" << timestamp() << "] [" << category_name(category) << "] "
                  << message << std::endl;
    }

} // namespace rtprov
