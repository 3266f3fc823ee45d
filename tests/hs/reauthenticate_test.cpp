#include <gtest/gtest.h>
#include <onionid/hs/reauthenticate.hpp>
#include <onionid/hs/error.hpp>

using namespace onionid;
using namespace onionid::hs;

namespace
{

class FakeChannel final : public ControlChannel
{
public:
    explicit FakeChannel(std::error_code result)
        : result_(result)
    {
    }

    void authenticate(std::string_view password, std::error_code& ec) override
    {
        passwords.emplace_back(password);
        ec = result_;
    }

    std::vector<std::string> passwords;

private:
    std::error_code result_;
};

class RecordingLogger final : public log::Logger
{
public:
    void write(log::Level level, std::string_view msg) override
    {
        records.emplace_back(level, std::string(msg));
    }

    std::vector<std::pair<log::Level, std::string>> records;
};

} // namespace

TEST(ReauthenticateTest, Success)
{
    FakeChannel channel{std::error_code{}};
    RecordingLogger logger;

    ASSERT_TRUE(Reauthenticate(channel, ReauthSettings{"secret", std::chrono::milliseconds(0)}, logger));
    ASSERT_EQ(channel.passwords, std::vector<std::string>{"secret"});
    ASSERT_TRUE(logger.records.empty());
}

TEST(ReauthenticateTest, FailureIsLogged)
{
    FakeChannel channel{std::make_error_code(std::errc::permission_denied)};
    RecordingLogger logger;

    ASSERT_FALSE(Reauthenticate(channel, ReauthSettings{"secret", std::chrono::milliseconds(0)}, logger));
    ASSERT_EQ(channel.passwords.size(), 1U);
    ASSERT_EQ(logger.records.size(), 1U);
    ASSERT_EQ(logger.records.front().first, log::Level::Error);
    ASSERT_EQ(logger.records.front().second.rfind("Failed to re-authenticate controller", 0), 0U);
}

TEST(ReauthenticateTest, WaitsForDelay)
{
    FakeChannel channel{std::error_code{}};
    RecordingLogger logger;

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(Reauthenticate(channel, ReauthSettings{"", std::chrono::milliseconds(50)}, logger));
    ASSERT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST(ReauthenticateTest, DefaultDelay)
{
    ReauthSettings settings;
    ASSERT_EQ(settings.delay, std::chrono::seconds(10));
}
