#include <gtest/gtest.h>

#include <map>
#include <string>

#include "core/ledger_config.hpp"

namespace {

core::EnvLookup env(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

TEST(LedgerConfig, ProductionDefaults) {
    const auto cfg = core::default_ledger_config();
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.default_strategy, core::AllocationStrategy::Fifo);
    EXPECT_FALSE(cfg.journal.enabled);
    EXPECT_EQ(cfg.log_level, util::LogLevel::Info);
    const auto mask = cfg.effective_allocatable_mask();
    EXPECT_TRUE(mask & core::category_bit(core::StockCategory::Unrestricted));
    EXPECT_TRUE(mask & core::category_bit(core::StockCategory::QualityCheck));
    EXPECT_TRUE(mask & core::category_bit(core::StockCategory::Consignment));
    EXPECT_FALSE(mask & core::category_bit(core::StockCategory::Blocked));
}

TEST(LedgerConfig, BlockedIsMaskedEvenWhenStored) {
    auto cfg = core::default_ledger_config();
    cfg.allocatable_categories = core::all_categories_mask;
    EXPECT_FALSE(cfg.effective_allocatable_mask() & core::category_bit(core::StockCategory::Blocked));
}

TEST(LedgerConfig, EnvOverridesApply) {
    auto cfg = core::default_ledger_config();
    std::string err;
    const auto vars = env({
        {"QL_LOCK_TIMEOUT_MS", "250"},
        {"QL_ALLOCATABLE_CATEGORIES", "UNRESTRICTED, CONSIGNMENT"},
        {"QL_DEFAULT_STRATEGY", "FEFO"},
        {"QL_JOURNAL_DIR", "/tmp/ql_journal"},
        {"QL_JOURNAL_ENABLED", "true"},
        {"QL_JOURNAL_FSYNC", "1"},
        {"QL_JOURNAL_ROTATE_BYTES", "4096"},
        {"QL_LOG_LEVEL", "debug"},
    });
    ASSERT_TRUE(core::apply_env_overrides(cfg, vars, err)) << err;
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.allocatable_categories, core::category_bit(core::StockCategory::Unrestricted) |
                                              core::category_bit(core::StockCategory::Consignment));
    EXPECT_EQ(cfg.default_strategy, core::AllocationStrategy::Fefo);
    EXPECT_EQ(cfg.journal.output_dir, std::filesystem::path("/tmp/ql_journal"));
    EXPECT_TRUE(cfg.journal.enabled);
    EXPECT_TRUE(cfg.journal.fsync_on_commit);
    EXPECT_EQ(cfg.journal.rotate_max_bytes, 4096u);
    EXPECT_EQ(cfg.log_level, util::LogLevel::Debug);
}

TEST(LedgerConfig, UnsetVariablesLeaveDefaults) {
    auto cfg = core::default_ledger_config();
    std::string err;
    ASSERT_TRUE(core::apply_env_overrides(cfg, env({}), err));
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(5000));
    EXPECT_TRUE(err.empty());
}

TEST(LedgerConfig, RejectsBadTimeout) {
    auto cfg = core::default_ledger_config();
    std::string err;
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_LOCK_TIMEOUT_MS", "soon"}}), err));
    EXPECT_NE(err.find("QL_LOCK_TIMEOUT_MS"), std::string::npos);
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(5000));

    err.clear();
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_LOCK_TIMEOUT_MS", "0"}}), err));
}

TEST(LedgerConfig, RejectsTimeoutAboveLimit) {
    auto cfg = core::default_ledger_config();
    std::string err;
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_LOCK_TIMEOUT_MS", "18446744073709551615"}}), err));
    EXPECT_NE(err.find("exceeds"), std::string::npos);
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_LOCK_TIMEOUT_MS", "86400001"}}), err));
    EXPECT_EQ(cfg.lock_timeout, std::chrono::milliseconds(5000));

    ASSERT_TRUE(core::apply_env_overrides(cfg, env({{"QL_LOCK_TIMEOUT_MS", "86400000"}}), err)) << err;
    EXPECT_EQ(cfg.lock_timeout, core::max_lock_timeout);
}

TEST(LedgerConfig, BlockedCannotBeMadeAllocatable) {
    auto cfg = core::default_ledger_config();
    const auto before = cfg.allocatable_categories;
    std::string err;
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_ALLOCATABLE_CATEGORIES", "UNRESTRICTED,BLOCKED"}}), err));
    EXPECT_NE(err.find("BLOCKED"), std::string::npos);
    EXPECT_EQ(cfg.allocatable_categories, before);
}

TEST(LedgerConfig, RejectsUnknownValues) {
    auto cfg = core::default_ledger_config();
    std::string err;
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_DEFAULT_STRATEGY", "LIFO"}}), err));
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_JOURNAL_ENABLED", "maybe"}}), err));
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_LOG_LEVEL", "loud"}}), err));
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_ALLOCATABLE_CATEGORIES", "DAMAGED"}}), err));
    EXPECT_FALSE(core::apply_env_overrides(cfg, env({{"QL_ALLOCATABLE_CATEGORIES", " , "}}), err));
    EXPECT_EQ(cfg.default_strategy, core::AllocationStrategy::Fifo);
    EXPECT_FALSE(cfg.journal.enabled);
}

} // namespace
