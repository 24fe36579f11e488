#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "core/allocation_strategy.hpp"
#include "core/types.hpp"
#include "persist/movement_journal.hpp"
#include "util/log.hpp"

namespace core {

// Upper bound on LedgerConfig::lock_timeout (one day).
inline constexpr std::chrono::milliseconds max_lock_timeout{24LL * 60 * 60 * 1000};

struct LedgerConfig {
    // Longest a transaction waits for any single row lock before the whole
    // operation rolls back with LockTimeoutError. Values above max_lock_timeout
    // are treated as max_lock_timeout.
    std::chrono::milliseconds lock_timeout{5000};

    // Categories reserve may draw from. BLOCKED is masked out on every read of
    // this field regardless of what is stored here.
    std::uint8_t allocatable_categories{allocatable_default_mask};

    AllocationStrategy default_strategy{AllocationStrategy::Fifo};

    persist::JournalConfig journal{};

    util::LogLevel log_level{util::LogLevel::Info};

    std::uint8_t effective_allocatable_mask() const noexcept {
        return static_cast<std::uint8_t>(allocatable_categories & allocatable_default_mask);
    }
};

// Default configuration suitable for production
[[nodiscard]] inline LedgerConfig default_ledger_config() {
    return LedgerConfig{};
}

using EnvLookup = std::function<const char*(const char*)>;

// Applies QL_* environment overrides. Stops at the first unparsable value,
// leaving that key untouched, and returns false with a message in `error`.
bool apply_env_overrides(LedgerConfig& cfg, const EnvLookup& lookup, std::string& error);
bool apply_env_overrides(LedgerConfig& cfg, std::string& error);

// Parses a comma-separated list of category names into a bit mask.
bool parse_category_mask(const std::string& text, std::uint8_t& out, std::string& error);

} // namespace core
