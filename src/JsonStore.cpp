#include "JsonStore.h"
#include "FileLock.h"
#include "Logger.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

using json = nlohmann::json;

const char* store_status_name(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok: return "ok";
        case StoreStatus::LockTimeout: return "lock_timeout";
        case StoreStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

JsonStore::JsonStore(std::string path, Logger& logger, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), logger_(logger), lock_timeout_(lock_timeout) {
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            logger_.error("JsonStore", "could not create " + parent.string() + ": " + ec.message());
        }
    }
}

json JsonStore::load() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return json::object(); // Absent store reads as empty
    }

    try {
        json doc = json::parse(in);
        if (!doc.is_object()) {
            logger_.error("PersistenceCorrupt", path_ + ": top-level value is not an object");
            return json::object();
        }
        return doc;
    } catch (const json::exception& e) {
        logger_.error("PersistenceCorrupt", path_ + ": " + e.what());
        return json::object();
    }
}

bool JsonStore::save(const json& doc) const {
    std::string tmp_path = path_ + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            logger_.error("JsonStore", "could not open " + tmp_path + " for writing");
            return false;
        }
        out << doc.dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out) {
            logger_.error("JsonStore", "short write to " + tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        logger_.error("JsonStore", "could not replace " + path_);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

StoreStatus JsonStore::update(const std::function<bool(json&)>& mutate) {
    auto lock = FileLock::acquire(path_ + ".lock", lock_timeout_);
    if (!lock) {
        logger_.error("JsonStore", "timed out waiting for lock on " + path_);
        return StoreStatus::LockTimeout;
    }

    json doc = load();
    if (!mutate(doc)) {
        return StoreStatus::Ok;
    }
    return save(doc) ? StoreStatus::Ok : StoreStatus::WriteFailed;
}
