#include <pbk/util/log.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>

namespace fs = std::filesystem;

static std::mutex g_ActiveLogMutex;
static Log* g_ActiveLog{ nullptr };

static constexpr std::string_view LevelPrefix(Log::LogLevel level)
{
    switch (level)
    {
    case Log::LogLevel::Debug:
        return "[DEBUG]";
    case Log::LogLevel::Information:
        return " [INFO]";
    case Log::LogLevel::Warning:
        return " [WARN]";
    case Log::LogLevel::Error:
        return "[ERROR]";
    }
    return "[?????]";
}

// Removes the oldest log files so that at most max_files - 1 remain
static void PruneLogFiles(const fs::path& logs_directory, size_t max_files)
{
    std::vector<fs::directory_entry> log_files;
    for (const fs::directory_entry& entry : fs::directory_iterator{ logs_directory })
    {
        if (entry.is_regular_file() && entry.path().extension() == ".log")
        {
            log_files.push_back(entry);
        }
    }
    if (log_files.size() < max_files)
    {
        return;
    }

    std::ranges::sort(log_files, {}, [](const fs::directory_entry& entry)
                      { return entry.last_write_time(); });
    const size_t num_removed{ log_files.size() - max_files + 1 };
    for (size_t i = 0; i < num_removed; i++)
    {
        std::error_code error;
        fs::remove(log_files[i].path(), error);
    }
}

class Log::Sink
{
  public:
    explicit Sink(LogFlags log_flags)
        : m_LogFlags{ log_flags }
    {
        if (bool(m_LogFlags & LogFlags::File))
        {
            OpenLogFile();
        }
    }

    bool Accepts(LogLevel level) const
    {
        return level != LogLevel::Debug || bool(m_LogFlags & LogFlags::Verbose);
    }

    uint32_t InstallHook(LogHook hook)
    {
        std::lock_guard lock{ m_Mutex };
        m_Hooks.push_back({ m_NextHookId++, std::move(hook) });
        return m_Hooks.back().m_HookId;
    }

    void UninstallHook(uint32_t hook_id)
    {
        std::lock_guard lock{ m_Mutex };
        std::erase_if(m_Hooks,
                      [hook_id](const InstalledHook& hook)
                      { return hook.m_HookId == hook_id; });
    }

    void Print(const DetailInformation& detail_info, LogLevel level, std::string_view message)
    {
        std::string line{ LevelPrefix(level) };

        const bool with_time{ bool(m_LogFlags & LogFlags::DetailTime) };
        const bool with_location{ bool(m_LogFlags & LogFlags::DetailLocation) };
        if (with_time || with_location)
        {
            line += '<';
            if (with_time)
            {
                line += fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time));
            }
            if (with_location)
            {
                std::string_view file{ detail_info.m_File };
#ifdef PBK_SOURCE_ROOT
                if (file.starts_with(PBK_SOURCE_ROOT))
                {
                    file.remove_prefix(std::strlen(PBK_SOURCE_ROOT));
                }
#endif
                line += fmt::format("{}{}:{}", with_time ? "; " : "", file, detail_info.m_Line);
            }
            line += '>';
        }
        line += ": ";
        line += message;

        std::lock_guard lock{ m_Mutex };
        if (bool(m_LogFlags & LogFlags::Console))
        {
            qDebug().noquote() << QString::fromStdString(line);
        }
        if (m_FileStream.is_open())
        {
            m_FileStream << line << '\n'
                         << std::flush;
        }

        for (const InstalledHook& hook : m_Hooks)
        {
            hook.m_Hook(detail_info, level, message);
        }
    }

  private:
    void OpenLogFile()
    {
        static constexpr size_t c_MaxLogFiles{ 32 };

        const fs::path logs_directory{ fs::absolute("logs") };
        if (fs::exists(logs_directory) && !fs::is_directory(logs_directory))
        {
            fs::remove(logs_directory);
        }
        fs::create_directories(logs_directory);
        PruneLogFiles(logs_directory, c_MaxLogFiles);

        const fs::path log_file{
            logs_directory / fmt::format("{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)))
        };
        m_FileStream.open(log_file);
    }

    struct InstalledHook
    {
        uint32_t m_HookId;
        LogHook m_Hook;
    };

    const LogFlags m_LogFlags;

    std::mutex m_Mutex;
    std::vector<InstalledHook> m_Hooks;
    uint32_t m_NextHookId{ 1 };
    std::ofstream m_FileStream;
};

Log::Log(LogFlags log_flags)
    : m_Sink{ std::make_unique<Sink>(log_flags) }
{
    std::lock_guard lock{ g_ActiveLogMutex };
    m_Previous = g_ActiveLog;
    g_ActiveLog = this;
}

Log::~Log()
{
    std::lock_guard lock{ g_ActiveLogMutex };
    if (g_ActiveLog == this)
    {
        g_ActiveLog = m_Previous;
    }
}

Log* Log::GetActive()
{
    std::lock_guard lock{ g_ActiveLogMutex };
    return g_ActiveLog;
}

uint32_t Log::InstallHook(LogHook hook)
{
    return m_Sink->InstallHook(std::move(hook));
}
void Log::UninstallHook(uint32_t hook_id)
{
    m_Sink->UninstallHook(hook_id);
}

bool Log::Accepts(LogLevel level) const
{
    return m_Sink->Accepts(level);
}
void Log::Print(const DetailInformation& detail_info, LogLevel level, std::string_view message)
{
    m_Sink->Print(detail_info, level, message);
}
