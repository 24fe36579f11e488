#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

#include "util/crc32c.hpp"
#include "util/log.hpp"

namespace {

std::vector<std::byte> bytes_of(const std::string& s) {
    std::vector<std::byte> out(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

TEST(Crc32c, KnownCheckValue) {
    // Standard CRC-32C check value for "123456789".
    const auto data = bytes_of("123456789");
    EXPECT_EQ(util::Crc32c::compute(data.data(), data.size()), 0xE3069283u);
}

TEST(Crc32c, IncrementalMatchesOneShot) {
    const auto data = bytes_of("quant ledger movement journal");
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, data.data(), 10);
    crc = util::Crc32c::update(crc, std::span<const std::byte>(data.data() + 10, data.size() - 10));
    EXPECT_EQ(util::Crc32c::finalize(crc), util::Crc32c::compute(data.data(), data.size()));
}

TEST(Crc32c, EmptyInput) {
    EXPECT_EQ(util::Crc32c::compute(nullptr, 0), 0u);
}

TEST(Log, LevelParsingAndThreshold) {
    EXPECT_EQ(util::level_from_string("WARN"), util::LogLevel::Warn);
    EXPECT_EQ(util::level_from_string("debug"), util::LogLevel::Debug);
    EXPECT_FALSE(util::level_from_string("verbose").has_value());

    const auto saved = util::log_level();
    util::set_log_level(util::LogLevel::Error);
    EXPECT_FALSE(util::log_enabled(util::LogLevel::Warn));
    EXPECT_TRUE(util::log_enabled(util::LogLevel::Fatal));
    util::set_log_level(saved);
}

} // namespace
