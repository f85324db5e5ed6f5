#ifndef FILE_LOCK_H
#define FILE_LOCK_H

#include <chrono>
#include <optional>
#include <string>

/**
 * @class FileLock
 * @brief RAII exclusive flock() on a lock file.
 *
 * Every acquisition opens its own descriptor, so the lock excludes other
 * threads of this process as well as other processes. Released on destruction.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Polls for the lock until it is held or the timeout elapses.
     * @return The held lock, or std::nullopt on timeout or open failure.
     */
    static std::optional<FileLock> acquire(const std::string& path, std::chrono::milliseconds timeout);

    bool held() const { return fd_ >= 0; }
    void release();

private:
    explicit FileLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};

// Maps an arbitrary key (an owner name, an identity) to a safe lock file name.
std::string lock_file_name(const std::string& prefix, const std::string& key);

#endif // FILE_LOCK_H
