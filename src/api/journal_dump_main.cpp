#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "persist/movement_journal_reader.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <dir|file1,file2,...> [options]\n"
              << "Options:\n"
              << "  --item <id>         Only print movements of this item\n"
              << "  --max-records <N>   Stop after N printed movements\n"
              << "  --stats-only        Print reader statistics only\n";
}

std::vector<std::filesystem::path> split_files(const std::string& s) {
    std::vector<std::filesystem::path> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.emplace_back(item);
        }
    }
    return out;
}

void print_movement(const core::Movement& m) {
    std::printf("%llu %s item=%llu from=%llu to=%llu qty=%lld wh=%llu ts=%llu ref=%s actor=%s\n",
                static_cast<unsigned long long>(m.id), core::movement_type_name(m.type),
                static_cast<unsigned long long>(m.item), static_cast<unsigned long long>(m.from_quant),
                static_cast<unsigned long long>(m.to_quant), static_cast<long long>(m.qty),
                static_cast<unsigned long long>(m.warehouse), static_cast<unsigned long long>(m.created_at_ns),
                m.reference.c_str(), m.actor.c_str());
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    persist::JournalReaderOptions opts;
    bool have_item = false;
    core::ItemId item = 0;
    std::size_t max_records = 0;
    bool stats_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            const std::string val = argv[++i];
            if (val.find(',') != std::string::npos) {
                opts.files = split_files(val);
            } else {
                std::filesystem::path p(val);
                if (std::filesystem::is_regular_file(p)) {
                    opts.files = {p};
                } else {
                    opts.directory = p;
                }
            }
        } else if (arg == "--item" && i + 1 < argc) {
            have_item = true;
            item = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--max-records" && i + 1 < argc) {
            max_records = static_cast<std::size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (arg == "--stats-only") {
            stats_only = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    persist::MovementJournalReader reader(opts);
    if (!reader.open()) {
        std::cerr << "No journal files found\n";
        return 1;
    }

    std::size_t printed = 0;
    core::Movement m;
    for (auto st = reader.next(m); st != persist::JournalReadStatus::EndOfStream; st = reader.next(m)) {
        if (st != persist::JournalReadStatus::Ok || stats_only) {
            continue;
        }
        if (have_item && m.item != item) {
            continue;
        }
        print_movement(m);
        if (max_records != 0 && ++printed >= max_records) {
            break;
        }
    }

    const auto& s = reader.stats();
    std::printf("files=%llu records_ok=%llu corrupt=%llu crc=%llu bad_length=%llu bad_type=%llu version=%llu "
                "truncated=%llu io_errors=%llu bytes=%llu\n",
                static_cast<unsigned long long>(s.files_opened), static_cast<unsigned long long>(s.records_ok),
                static_cast<unsigned long long>(s.records_corrupt), static_cast<unsigned long long>(s.checksum_failures),
                static_cast<unsigned long long>(s.bad_length), static_cast<unsigned long long>(s.bad_type),
                static_cast<unsigned long long>(s.version_mismatch), static_cast<unsigned long long>(s.truncated_tail),
                static_cast<unsigned long long>(s.io_errors), static_cast<unsigned long long>(s.bytes_read));
    return s.records_corrupt == 0 && s.io_errors == 0 ? 0 : 2;
}
