/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support, plus utility sinks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wave_delegator {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * Active file is `<prefix>.ndjson`; on rotation it becomes `<prefix>.1.ndjson`
 * and older files shift up, keeping at most @p max_files rotated files.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Rotation threshold in bytes; exposed for tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output, for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every line in memory, used by tests to inspect output.
 *
 * The line store is shared so a test can keep observing it after the sink
 * has been moved into a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Store {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    MemorySink() : store_(std::make_shared<Store>()) {}

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Store> store() const noexcept { return store_; }
    [[nodiscard]] std::vector<std::string> lines() const;

private:
    std::shared_ptr<Store> store_;
};

}  // namespace wave_delegator
