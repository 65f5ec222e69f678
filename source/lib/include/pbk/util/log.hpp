#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include <pbk/typedefs.hpp>

/*
        A Log writes to the console and/or a log file, chosen by the flags it is constructed with
        Constructing a Log makes it the active log until it is destroyed, the previously active log is restored then
*/
class Log
{
  public:
    explicit Log(LogFlags log_flags);
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    // nullptr if no log is alive
    static Log* GetActive();

    enum class LogLevel
    {
        Debug,
        Information,
        Warning,
        Error,
    };

    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
    };

    // Hooks receive every message that passes the level filter, without the prefix
    using LogHook = std::function<void(const DetailInformation&, LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    /*
            Wrapper for a log message, captures the call site and checks the format string at compile time
    */
    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message{};
        std::source_location m_SourceInfo{};
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<std::type_identity_t<Args>...>;

    bool Accepts(LogLevel level) const;
    void Print(const DetailInformation& detail_info, LogLevel level, std::string_view message);

    template<class... Args>
    static void DoLog(LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        Log* log{ GetActive() };
        if (log != nullptr && log->Accepts(level))
        {
            const DetailInformation detail_info{
                std::time(nullptr),
                message.m_SourceInfo.file_name(),
                message.m_SourceInfo.line(),
            };
            log->Print(detail_info, level, fmt::format(message.m_Message, std::forward<Args>(args)...));
        }
    }

  private:
    class Sink;
    std::unique_ptr<Sink> m_Sink;
    Log* m_Previous{ nullptr };
};

template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
