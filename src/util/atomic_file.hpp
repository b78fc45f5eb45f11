/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Atomic File Writer - temp-file-then-rename persistence
 *
 * A crash mid-write leaves at most a stray "<name>.tmp.<n>" file next to
 * the target; the target itself is either the old or the new content.
 */

#ifndef MAILRLM_UTIL_ATOMIC_FILE_HPP
#define MAILRLM_UTIL_ATOMIC_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace mailrlm::util {

/**
 * Writes to a temporary sibling of the target and renames it over the
 * target on commit(). Aborts (removes the temporary) on destruction if
 * not committed.
 */
class AtomicFileWriter {
public:
    /**
     * @throws std::runtime_error if the temporary file cannot be created
     */
    explicit AtomicFileWriter(std::filesystem::path target);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    /**
     * Append data to the temporary file
     * @throws std::runtime_error on write failure
     */
    void write(std::string_view data);

    /**
     * fsync the temporary file and rename it over the target
     * @throws std::runtime_error on failure (the temporary is removed)
     */
    void commit();

    /**
     * Discard the temporary file
     */
    void abort() noexcept;

private:
    static std::filesystem::path make_temp_path(const std::filesystem::path& target);

    std::filesystem::path target_;
    std::filesystem::path temp_path_;
    int fd_{-1};
    bool done_{false};
};

/**
 * Write content to path atomically (creates parent directories)
 */
void write_file_atomic(const std::filesystem::path& path, std::string_view content);

/**
 * Suffix marker carried by in-flight temporary files
 */
constexpr std::string_view kTempMarker = ".tmp.";

} // namespace mailrlm::util

#endif // MAILRLM_UTIL_ATOMIC_FILE_HPP
