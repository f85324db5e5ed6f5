#include "Logger.h"
#include <iostream>
#include <filesystem>
#include <system_error>

const char* level_name(Logger::Level level) {
    switch (level) {
        case Logger::Level::Info: return "INFO";
        case Logger::Level::Warning: return "WARNING";
        case Logger::Level::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(const std::string& logs_dir, Clock clock)
    : clock_(std::move(clock)) {
    if (logs_dir.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    if (ec) {
        std::cerr << "[Logger] Could not create logs directory " << logs_dir << ": " << ec.message() << std::endl;
    }

    audit_path_ = logs_dir + "/audit.log";
    error_path_ = logs_dir + "/errors.log";
    audit_out_.open(audit_path_, std::ios::app);
    error_out_.open(error_path_, std::ios::app);
    if (!audit_out_) {
        std::cerr << "[Logger] Could not open " << audit_path_ << std::endl;
    }
    if (!error_out_) {
        std::cerr << "[Logger] Could not open " << error_path_ << std::endl;
    }
}

void Logger::write_line(std::ofstream& out, Level level, const std::string& msg) {
    if (!out) return;
    out << format_local_time(clock_()) << " - " << level_name(level) << " - " << msg << "\n";
    out.flush();
}

void Logger::audit(Level level, const std::string& event, const std::string& identity,
                   const std::string& details) {
    std::string line = event + " - User: " + identity;
    if (!details.empty()) {
        line += " - " + details;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    write_line(audit_out_, level, line);
    if (verbose_) {
        std::cerr << "[Audit] " << line << std::endl;
    }
}

void Logger::error(const std::string& context, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mtx_);
    write_line(error_out_, Level::Error, context + ": " + detail);
    if (verbose_) {
        std::cerr << "[Error] " << context << ": " << detail << std::endl;
    }
}

void Logger::info(const std::string& tag, const std::string& msg) {
    if (!verbose_) return;
    std::lock_guard<std::mutex> lock(mtx_);
    std::cerr << "[" << tag << "] " << msg << std::endl;
}

void Logger::warn(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::cerr << "[" << tag << "] Warning: " << msg << std::endl;
}
