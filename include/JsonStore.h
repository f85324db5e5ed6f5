#ifndef JSON_STORE_H
#define JSON_STORE_H

#include <chrono>
#include <functional>
#include <string>
#include "nlohmann/json.hpp"

class Logger;

enum class StoreStatus {
    Ok,
    LockTimeout,
    WriteFailed,
};

const char* store_status_name(StoreStatus status);

/**
 * @class JsonStore
 * @brief One persisted JSON object per concern (registry, rate limits, verified users).
 *
 * A missing file reads as an empty object. A file that cannot be parsed is
 * reported on the error channel and also reads as empty, so corruption never
 * takes the caller down. Writes go to a temp file that is renamed into place,
 * which keeps readers from ever seeing a half-written document.
 */
class JsonStore {
public:
    JsonStore(std::string path, Logger& logger,
              std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(10000));

    // Snapshot of the current document. Never throws.
    nlohmann::json load() const;

    /**
     * @brief Read-modify-write under the store's exclusive lock.
     * @param mutate Edits the document in place; return false to skip the write.
     */
    StoreStatus update(const std::function<bool(nlohmann::json&)>& mutate);

    const std::string& path() const { return path_; }

private:
    bool save(const nlohmann::json& doc) const;

    std::string path_;
    Logger& logger_;
    std::chrono::milliseconds lock_timeout_;
};

#endif // JSON_STORE_H
