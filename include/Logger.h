#ifndef LOGGER_H
#define LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include "TimeUtil.h"

/**
 * @class Logger
 * @brief Audit and error channels plus tagged console diagnostics.
 *
 * The audit channel records every access, admission and cleanup decision for
 * later forensic review. The error channel carries failure detail that is
 * never returned to callers.
 */
class Logger {
public:
    enum class Level { Info, Warning, Error };

    /**
     * @param logs_dir Directory holding audit.log and errors.log. Created if missing.
     *                 An empty path disables both files (console only).
     */
    explicit Logger(const std::string& logs_dir, Clock clock = wall_clock_seconds);

    void audit(Level level, const std::string& event, const std::string& identity,
               const std::string& details = "");
    void error(const std::string& context, const std::string& detail);

    // Console diagnostics, e.g. info("Registry", "loaded 3 entries").
    void info(const std::string& tag, const std::string& msg);
    void warn(const std::string& tag, const std::string& msg);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    const std::string& audit_path() const { return audit_path_; }
    const std::string& error_path() const { return error_path_; }

private:
    void write_line(std::ofstream& out, Level level, const std::string& msg);

    Clock clock_;
    std::string audit_path_;
    std::string error_path_;
    std::ofstream audit_out_;
    std::ofstream error_out_;
    std::mutex mtx_;
    bool verbose_ = false;
};

const char* level_name(Logger::Level level);

#endif // LOGGER_H
