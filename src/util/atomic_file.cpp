/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Atomic File Writer Implementation
 */

#include "util/atomic_file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>

namespace mailrlm::util {

AtomicFileWriter::AtomicFileWriter(std::filesystem::path target)
    : target_(std::move(target)) {
    if (target_.has_parent_path()) {
        std::filesystem::create_directories(target_.parent_path());
    }

    temp_path_ = make_temp_path(target_);

    fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create temporary file " + temp_path_.string() +
                                 ": " + std::strerror(errno));
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!done_) {
        abort();
    }
}

std::filesystem::path AtomicFileWriter::make_temp_path(const std::filesystem::path& target) {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(100000, 999999);

    auto temp = target;
    temp += std::string(kTempMarker) + std::to_string(dist(rng));
    return temp;
}

void AtomicFileWriter::write(std::string_view data) {
    if (done_) {
        throw std::runtime_error("Cannot write to committed or aborted file");
    }

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            abort();
            throw std::runtime_error("Write to " + temp_path_.string() + " failed: " +
                                     std::strerror(err));
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

void AtomicFileWriter::commit() {
    if (done_) {
        throw std::runtime_error("Cannot commit already committed or aborted file");
    }

    if (::fsync(fd_) != 0) {
        int err = errno;
        abort();
        throw std::runtime_error("fsync failed: " + std::string(std::strerror(err)));
    }

    if (::close(fd_) != 0) {
        fd_ = -1;
        int err = errno;
        abort();
        throw std::runtime_error("close failed: " + std::string(std::strerror(err)));
    }
    fd_ = -1;

    if (std::rename(temp_path_.c_str(), target_.c_str()) != 0) {
        int err = errno;
        abort();
        throw std::runtime_error("Atomic rename to " + target_.string() + " failed: " +
                                 std::strerror(err));
    }

    done_ = true;
}

void AtomicFileWriter::abort() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!temp_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }
    done_ = true;
}

void write_file_atomic(const std::filesystem::path& path, std::string_view content) {
    AtomicFileWriter writer(path);
    writer.write(content);
    writer.commit();
}

} // namespace mailrlm::util
