#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "core/types.hpp"
#include "persist/file_sink.hpp"
#include "persist/movement_log_format.hpp"

namespace persist {

struct JournalConfig {
    bool enabled{false};
    std::filesystem::path output_dir{"./movement_journal"};
    std::size_t rotate_max_bytes{64 * 1024 * 1024}; // 64MB
    bool fsync_on_commit{false};
};

struct JournalCounters {
    std::atomic<std::uint64_t> records_written{0};
    std::atomic<std::uint64_t> bytes_written{0};
    std::atomic<std::uint64_t> batches_written{0};
    std::atomic<std::uint64_t> io_errors{0};
    std::atomic<std::uint64_t> rotations{0};
    std::atomic<std::uint64_t> batches_discarded{0};
    std::atomic<std::uint64_t> discard_failures{0};
};

// Synchronous append-only writer for committed movements. A batch is written
// (and optionally synced) before append() returns, so a successful return means
// the batch is on the sink. Not internally synchronised: the ledger calls it
// from its commit critical section only.
//
// A failed write or sync truncates the file back to where the batch started, so
// a batch is on the sink whole or not at all. The file is then closed and the
// next append opens a fresh one; a torn record can only ever be the tail of a
// file whose truncate also failed.
class MovementJournal {
public:
    explicit MovementJournal(JournalConfig cfg, std::unique_ptr<IFileSink> sink = nullptr);
    ~MovementJournal();

    MovementJournal(const MovementJournal&) = delete;
    MovementJournal& operator=(const MovementJournal&) = delete;

    IoResult append(std::span<const core::Movement> batch);
    void close() noexcept;

    const JournalConfig& config() const noexcept { return cfg_; }
    const JournalCounters& counters() const noexcept { return counters_; }
    const std::filesystem::path& current_path() const noexcept { return current_path_; }

private:
    IoResult ensure_file_ready(std::size_t next_bytes);
    IoResult open_new_file();
    IoResult writev_fully(const struct iovec* iov, int iovcnt);
    void discard_batch(std::uint64_t batch_start);
    void fail(const char* what, int error_code);

    JournalConfig cfg_;
    std::unique_ptr<IFileSink> sink_;
    JournalCounters counters_;
    std::vector<std::byte> staging_;
    std::filesystem::path current_path_;
    std::uint64_t file_seq_{0};
};

} // namespace persist
