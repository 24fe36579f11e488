#include "persist/movement_journal.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

#include "util/log.hpp"

namespace persist {

namespace {

constexpr const char* kLogCat = "journal";

std::string format_filename(std::chrono::system_clock::time_point tp, std::uint64_t seq) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << journal_filename_prefix();
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_seq" << std::setw(3) << std::setfill('0') << seq << ".bin";
    return oss.str();
}

} // namespace

MovementJournal::MovementJournal(JournalConfig cfg, std::unique_ptr<IFileSink> sink)
    : cfg_(std::move(cfg)), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = std::make_unique<PosixFileSink>();
    }
}

MovementJournal::~MovementJournal() { close(); }

void MovementJournal::close() noexcept {
    if (sink_ && sink_->is_open()) {
        sink_->close();
    }
}

IoResult MovementJournal::append(std::span<const core::Movement> batch) {
    if (batch.empty()) {
        return {true, 0};
    }
    staging_.clear();
    for (const auto& m : batch) {
        encode_movement_record(m, staging_);
    }

    if (auto res = ensure_file_ready(staging_.size()); !res.ok) {
        return res;
    }

    const std::uint64_t batch_start = sink_->current_size();
    struct iovec iov{staging_.data(), staging_.size()};
    if (auto res = writev_fully(&iov, 1); !res.ok) {
        discard_batch(batch_start);
        fail("writev", res.error_code);
        return res;
    }
    if (cfg_.fsync_on_commit) {
        if (auto res = sink_->sync(); !res.ok) {
            discard_batch(batch_start);
            fail("fdatasync", res.error_code);
            return res;
        }
    }

    counters_.records_written.fetch_add(batch.size(), std::memory_order_relaxed);
    counters_.bytes_written.fetch_add(staging_.size(), std::memory_order_relaxed);
    counters_.batches_written.fetch_add(1, std::memory_order_relaxed);
    return {true, 0};
}

IoResult MovementJournal::ensure_file_ready(std::size_t next_bytes) {
    if (!sink_->is_open()) {
        return open_new_file();
    }
    const std::uint64_t projected = sink_->current_size() + next_bytes;
    if (cfg_.rotate_max_bytes > 0 && sink_->current_size() > 0 && projected > cfg_.rotate_max_bytes) {
        sink_->close();
        counters_.rotations.fetch_add(1, std::memory_order_relaxed);
        return open_new_file();
    }
    return {true, 0};
}

IoResult MovementJournal::open_new_file() {
    std::error_code ec;
    std::filesystem::create_directories(cfg_.output_dir, ec);
    if (ec) {
        fail("create_directories", ec.value());
        return {false, ec.value()};
    }
    current_path_ = cfg_.output_dir / format_filename(std::chrono::system_clock::now(), file_seq_++);
    const auto res = sink_->open(current_path_.string());
    if (!res.ok) {
        fail("open", res.error_code);
        return res;
    }
    QL_LOG_INFO(kLogCat, "opened movement journal %s", current_path_.string().c_str());
    return {true, 0};
}

IoResult MovementJournal::writev_fully(const struct iovec* iov, int iovcnt) {
    std::vector<struct iovec> cur(iov, iov + iovcnt);
    std::size_t idx = 0;
    while (idx < cur.size()) {
        std::size_t bytes_written = 0;
        const auto res = sink_->writev(cur.data() + idx, static_cast<int>(cur.size() - idx), bytes_written);
        if (!res.ok) {
            if (res.error_code == EINTR) {
                continue;
            }
            return res;
        }
        if (bytes_written == 0) {
            return {false, EIO};
        }
        std::size_t remaining = bytes_written;
        while (remaining > 0 && idx < cur.size()) {
            if (remaining < cur[idx].iov_len) {
                cur[idx].iov_base = static_cast<std::byte*>(cur[idx].iov_base) + remaining;
                cur[idx].iov_len -= remaining;
                remaining = 0;
            } else {
                remaining -= cur[idx].iov_len;
                ++idx;
            }
        }
    }
    return {true, 0};
}

void MovementJournal::discard_batch(std::uint64_t batch_start) {
    if (!sink_->is_open()) {
        return;
    }
    if (auto res = sink_->truncate(batch_start); !res.ok) {
        counters_.discard_failures.fetch_add(1, std::memory_order_relaxed);
        QL_LOG_ERROR(kLogCat, "truncate to %llu failed on %s: err=%d, failed batch stays in the file",
                     static_cast<unsigned long long>(batch_start), current_path_.string().c_str(), res.error_code);
        return;
    }
    counters_.batches_discarded.fetch_add(1, std::memory_order_relaxed);
    if (cfg_.fsync_on_commit) {
        if (auto res = sink_->sync(); !res.ok) {
            QL_LOG_WARN(kLogCat, "fdatasync after truncate failed on %s: err=%d", current_path_.string().c_str(),
                        res.error_code);
        }
    }
}

void MovementJournal::fail(const char* what, int error_code) {
    counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
    QL_LOG_ERROR(kLogCat, "%s failed on %s: err=%d", what, current_path_.string().c_str(), error_code);
    if (sink_->is_open()) {
        sink_->close();
    }
}

} // namespace persist
