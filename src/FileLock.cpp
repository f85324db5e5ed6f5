#include "FileLock.h"
#include <iostream>
#include <thread>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

static constexpr std::chrono::milliseconds LOCK_POLLING_INTERVAL(20);

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

std::optional<FileLock> FileLock::acquire(const std::string& path, std::chrono::milliseconds timeout) {
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "[FileLock] Could not open " << path << ": " << strerror(errno) << std::endl;
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return FileLock(fd);
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            std::cerr << "[FileLock] flock failed on " << path << ": " << strerror(errno) << std::endl;
            close(fd);
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close(fd);
            return std::nullopt;
        }
        std::this_thread::sleep_for(LOCK_POLLING_INTERVAL);
    }
}

std::string lock_file_name(const std::string& prefix, const std::string& key) {
    std::string name = prefix + "-";
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            name += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            name += hex;
        }
    }
    return name + ".lock";
}
