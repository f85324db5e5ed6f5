#ifndef TEST_UTIL_H
#define TEST_UTIL_H

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include "TimeUtil.h"

namespace testutil {

// Unique scratch directory, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream name;
        name << "labctl-test-" << std::hex << rd() << rd();
        path_ = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// Clock whose value tests move by hand. Copies share the same time.
class ManualClock {
public:
    explicit ManualClock(double start = 1700000000.0) : now_(std::make_shared<double>(start)) {}

    double now() const { return *now_; }
    void advance(double seconds) { *now_ += seconds; }
    void set(double t) { *now_ = t; }

    Clock fn() const {
        auto now = now_;
        return [now]() { return *now; };
    }

private:
    std::shared_ptr<double> now_;
};

inline std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

} // namespace testutil

#endif // TEST_UTIL_H
