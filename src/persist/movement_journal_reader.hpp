#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "persist/movement_log_format.hpp"

namespace persist {

struct JournalReaderStats {
    std::uint64_t records_ok{0};
    std::uint64_t records_corrupt{0};
    std::uint64_t checksum_failures{0};
    std::uint64_t bad_length{0};
    std::uint64_t bad_type{0};
    std::uint64_t version_mismatch{0};
    std::uint64_t truncated_tail{0};
    std::uint64_t files_opened{0};
    std::uint64_t bytes_read{0};
    std::uint64_t io_errors{0};
};

struct JournalReaderOptions {
    std::vector<std::filesystem::path> files{};
    std::filesystem::path directory{};
    std::string filename_prefix{std::string(journal_filename_prefix())};
};

enum class JournalReadStatus {
    Ok = 0,
    EndOfStream,
    Corrupt,
    Truncated,
    IoError,
};

// Reads journal files in file-name order. Corrupt records are reported once and
// skipped; a truncated tail ends the current file.
class MovementJournalReader {
public:
    explicit MovementJournalReader(JournalReaderOptions opts);

    // Collects the file list. Returns false when there is nothing to read.
    bool open();

    JournalReadStatus next(core::Movement& out);

    const JournalReaderStats& stats() const noexcept { return stats_; }
    const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    bool load_current_file();
    void close_file() noexcept;

    JournalReaderOptions opts_;
    JournalReaderStats stats_;
    std::vector<std::filesystem::path> files_;
    std::vector<std::byte> buffer_;
    std::size_t offset_{0};
    std::size_t file_index_{0};
    bool have_current_{false};
};

std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir, const std::string& prefix);

// Convenience wrapper for tests and the dump tool: reads every good record.
std::vector<core::Movement> read_all_movements(const std::filesystem::path& dir, JournalReaderStats* stats = nullptr);

} // namespace persist
