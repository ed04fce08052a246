/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>
#include <utility>

namespace jobguard {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                            const std::string& prefix,
                            uint32_t max_file_size_mb,
                            uint32_t max_files,
                            std::string extension)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , extension_(std::move(extension))
    , max_file_size_bytes_(uint64_t{max_file_size_mb} * 1024 * 1024)
    , max_files_(max_files == 0 ? 1 : max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    open_current();
}

std::unique_ptr<JsonFileSink> JsonFileSink::for_file(const std::filesystem::path& file,
                                                     uint32_t max_file_size_mb,
                                                     uint32_t max_files) {
    auto dir = file.parent_path();
    if (dir.empty()) dir = ".";
    return std::make_unique<JsonFileSink>(dir, file.stem().string(), max_file_size_mb, max_files,
                                          file.extension().string());
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + extension_);
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + extension_);
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::open_current() {
    auto path = current_path();
    current_file_.open(path, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : size;
}

void JsonFileSink::rotate_if_needed() {
    if (max_file_size_bytes_ == 0 || current_size_ < max_file_size_bytes_) return;

    current_file_.close();

    std::error_code ec;
    if (max_files_ <= 1) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(rotated_path(max_files_ - 1), ec);
        for (uint32_t i = max_files_ - 1; i > 1; --i) {
            std::filesystem::rename(rotated_path(i - 1), rotated_path(i), ec);
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }

    open_current();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace jobguard
