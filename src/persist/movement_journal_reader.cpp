#include "persist/movement_journal_reader.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <span>
#include <system_error>

namespace persist {

std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir, const std::string& prefix) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return out;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0 && entry.path().extension() == ".bin") {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

MovementJournalReader::MovementJournalReader(JournalReaderOptions opts)
    : opts_(std::move(opts)) {}

bool MovementJournalReader::open() {
    files_.clear();
    if (!opts_.files.empty()) {
        files_ = opts_.files;
    } else if (!opts_.directory.empty()) {
        files_ = scan_journal_files(opts_.directory, opts_.filename_prefix);
    }
    file_index_ = 0;
    close_file();
    return !files_.empty();
}

bool MovementJournalReader::load_current_file() {
    close_file();
    const auto& path = files_[file_index_];
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size > static_cast<std::uintmax_t>(std::numeric_limits<std::size_t>::max())) {
        ++stats_.io_errors;
        return false;
    }
    buffer_.resize(static_cast<std::size_t>(size));
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        ++stats_.io_errors;
        return false;
    }
    if (size > 0) {
        in.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        if (!in) {
            ++stats_.io_errors;
            return false;
        }
    }
    have_current_ = true;
    ++stats_.files_opened;
    stats_.bytes_read += buffer_.size();
    return true;
}

void MovementJournalReader::close_file() noexcept {
    buffer_.clear();
    offset_ = 0;
    have_current_ = false;
}

JournalReadStatus MovementJournalReader::next(core::Movement& out) {
    while (true) {
        if (!have_current_) {
            if (file_index_ >= files_.size()) {
                return JournalReadStatus::EndOfStream;
            }
            if (!load_current_file()) {
                ++file_index_;
                return JournalReadStatus::IoError;
            }
        }
        if (offset_ >= buffer_.size()) {
            ++file_index_;
            close_file();
            continue;
        }

        DecodedRecord rec;
        const auto status = decode_record(
            std::span<const std::byte>(buffer_.data() + offset_, buffer_.size() - offset_), rec);
        switch (status) {
        case DecodeStatus::Ok:
            offset_ += rec.consumed;
            ++stats_.records_ok;
            out = std::move(rec.movement);
            return JournalReadStatus::Ok;
        case DecodeStatus::Truncated:
            ++stats_.truncated_tail;
            ++file_index_;
            close_file();
            return JournalReadStatus::Truncated;
        case DecodeStatus::InvalidCrc:
            ++stats_.checksum_failures;
            break;
        case DecodeStatus::InvalidType:
            ++stats_.bad_type;
            break;
        case DecodeStatus::VersionMismatch:
            ++stats_.version_mismatch;
            break;
        case DecodeStatus::InvalidLength:
            ++stats_.bad_length;
            break;
        }
        ++stats_.records_corrupt;
        if (rec.consumed == 0) {
            // Frame length itself is unusable; nothing after it can be trusted.
            ++file_index_;
            close_file();
        } else {
            offset_ += rec.consumed;
        }
        return JournalReadStatus::Corrupt;
    }
}

std::vector<core::Movement> read_all_movements(const std::filesystem::path& dir, JournalReaderStats* stats) {
    std::vector<core::Movement> out;
    JournalReaderOptions opts;
    opts.directory = dir;
    MovementJournalReader reader(std::move(opts));
    if (reader.open()) {
        core::Movement m;
        for (auto st = reader.next(m); st != JournalReadStatus::EndOfStream; st = reader.next(m)) {
            if (st == JournalReadStatus::Ok) {
                out.push_back(m);
            }
        }
    }
    if (stats) {
        *stats = reader.stats();
    }
    return out;
}

} // namespace persist
