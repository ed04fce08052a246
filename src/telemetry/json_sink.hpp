/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace jobguard {

/**
 * @brief Writes NDJSON to size-rotated files.
 *
 * The active file is `<dir>/<prefix><extension>` (extension defaults to
 * ".ndjson"). When it reaches the size limit it becomes
 * `<prefix>.1<extension>`, older files shift up by one, and
 * at most @c max_files files are kept. A size limit of 0 never rotates.
 * Not thread-safe on its own; callers serialize (Logger, RunHistory).
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5,
                 std::string extension = ".ndjson");
    ~JsonFileSink() override;

    /// Sink whose active file is exactly @p file.
    [[nodiscard]] static std::unique_ptr<JsonFileSink> for_file(const std::filesystem::path& file,
                                                                uint32_t max_file_size_mb = 50,
                                                                uint32_t max_files = 5);

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }
    [[nodiscard]] std::filesystem::path current_path() const;

    /// Path of rotated file @p index (1 = newest).
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Test hook: rotate after @p bytes instead of whole megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    std::string extension_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and containers.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace jobguard
