#include "core/ledger_config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace core {

namespace {

bool parse_uint64(std::string_view text, std::uint64_t& out) noexcept {
    if (text.empty()) {
        return false;
    }
    const auto conv = std::from_chars(text.data(), text.data() + text.size(), out);
    return conv.ec == std::errc{} && conv.ptr == text.data() + text.size();
}

bool parse_bool(std::string_view text, bool& out) noexcept {
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

bool parse_category_mask(const std::string& text, std::uint8_t& out, std::string& error) {
    std::uint8_t mask = 0;
    std::string_view rest(text);
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto token = trim(rest.substr(0, comma));
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        if (token.empty()) {
            continue;
        }
        const auto cat = category_from_string(token);
        if (!cat) {
            error = "unknown stock category '" + std::string(token) + "'";
            return false;
        }
        if (*cat == StockCategory::Blocked) {
            error = "BLOCKED stock can never be allocatable";
            return false;
        }
        mask = static_cast<std::uint8_t>(mask | category_bit(*cat));
    }
    if (mask == 0) {
        error = "allocatable category list is empty";
        return false;
    }
    out = mask;
    return true;
}

bool apply_env_overrides(LedgerConfig& cfg, const EnvLookup& lookup, std::string& error) {
    if (const char* v = lookup("QL_LOCK_TIMEOUT_MS")) {
        std::uint64_t ms = 0;
        if (!parse_uint64(v, ms) || ms == 0) {
            error = "QL_LOCK_TIMEOUT_MS: expected a positive integer, got '" + std::string(v) + "'";
            return false;
        }
        if (ms > static_cast<std::uint64_t>(max_lock_timeout.count())) {
            error = "QL_LOCK_TIMEOUT_MS: " + std::string(v) + " exceeds the limit of " +
                    std::to_string(max_lock_timeout.count());
            return false;
        }
        cfg.lock_timeout = std::chrono::milliseconds{static_cast<std::int64_t>(ms)};
    }
    if (const char* v = lookup("QL_ALLOCATABLE_CATEGORIES")) {
        std::uint8_t mask = 0;
        std::string why;
        if (!parse_category_mask(v, mask, why)) {
            error = "QL_ALLOCATABLE_CATEGORIES: " + why;
            return false;
        }
        cfg.allocatable_categories = mask;
    }
    if (const char* v = lookup("QL_DEFAULT_STRATEGY")) {
        const auto s = strategy_from_string(v);
        if (!s) {
            error = "QL_DEFAULT_STRATEGY: expected FIFO or FEFO, got '" + std::string(v) + "'";
            return false;
        }
        cfg.default_strategy = *s;
    }
    if (const char* v = lookup("QL_JOURNAL_DIR")) {
        if (*v == '\0') {
            error = "QL_JOURNAL_DIR: empty path";
            return false;
        }
        cfg.journal.output_dir = v;
    }
    if (const char* v = lookup("QL_JOURNAL_ENABLED")) {
        if (!parse_bool(v, cfg.journal.enabled)) {
            error = "QL_JOURNAL_ENABLED: expected a boolean, got '" + std::string(v) + "'";
            return false;
        }
    }
    if (const char* v = lookup("QL_JOURNAL_FSYNC")) {
        if (!parse_bool(v, cfg.journal.fsync_on_commit)) {
            error = "QL_JOURNAL_FSYNC: expected a boolean, got '" + std::string(v) + "'";
            return false;
        }
    }
    if (const char* v = lookup("QL_JOURNAL_ROTATE_BYTES")) {
        std::uint64_t bytes = 0;
        if (!parse_uint64(v, bytes)) {
            error = "QL_JOURNAL_ROTATE_BYTES: expected an integer, got '" + std::string(v) + "'";
            return false;
        }
        cfg.journal.rotate_max_bytes = static_cast<std::size_t>(bytes);
    }
    if (const char* v = lookup("QL_LOG_LEVEL")) {
        const auto lvl = util::level_from_string(v);
        if (!lvl) {
            error = "QL_LOG_LEVEL: unknown level '" + std::string(v) + "'";
            return false;
        }
        cfg.log_level = *lvl;
    }
    return true;
}

bool apply_env_overrides(LedgerConfig& cfg, std::string& error) {
    return apply_env_overrides(cfg, [](const char* name) -> const char* { return std::getenv(name); }, error);
}

} // namespace core
