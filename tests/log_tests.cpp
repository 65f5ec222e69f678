#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <pbk/util/log.hpp>

using LogLevel = Log::LogLevel;

static void CollectMessages(Log& log, std::vector<std::string>& messages)
{
    log.InstallHook(
        [&messages](const Log::DetailInformation&, LogLevel, std::string_view message)
        {
            messages.emplace_back(message);
        });
}

TEST_CASE("Debug messages need a verbose log", "[log_verbose]")
{
    std::vector<std::string> messages;

    SECTION("Quiet")
    {
        Log log{ LogFlags::DetailLocation };
        CollectMessages(log, messages);

        LogDebug("placed {}", "a.png");
        LogInfo("laid out {} images", 1);
        REQUIRE(messages == std::vector<std::string>{ "laid out 1 images" });
    }

    SECTION("Verbose")
    {
        Log log{ LogFlags::Verbose };
        CollectMessages(log, messages);

        LogDebug("placed {}", "a.png");
        LogWarning("skipping {}", "b.png");
        REQUIRE(messages == std::vector<std::string>{ "placed a.png", "skipping b.png" });
    }
}

TEST_CASE("The previous log is active again after a nested log", "[log_nesting]")
{
    std::vector<std::string> outer_messages;
    std::vector<std::string> inner_messages;

    Log outer{ LogFlags{} };
    REQUIRE(Log::GetActive() == &outer);
    CollectMessages(outer, outer_messages);

    {
        Log inner{ LogFlags{} };
        REQUIRE(Log::GetActive() == &inner);
        CollectMessages(inner, inner_messages);
        LogError("inner");
    }

    REQUIRE(Log::GetActive() == &outer);
    LogError("outer");

    REQUIRE(inner_messages == std::vector<std::string>{ "inner" });
    REQUIRE(outer_messages == std::vector<std::string>{ "outer" });
}

TEST_CASE("Log hooks see the call site", "[log_details]")
{
    Log log{ LogFlags{} };

    std::size_t line{ 0 };
    const uint32_t hook_id{
        log.InstallHook(
            [&line](const Log::DetailInformation& detail_info, LogLevel, std::string_view)
            {
                line = detail_info.m_Line;
            })
    };

    const std::size_t expected_line{ __LINE__ + 1 };
    LogInfo("here");
    REQUIRE(line == expected_line);

    log.UninstallHook(hook_id);
    LogInfo("not seen");
    REQUIRE(line == expected_line);
}
