#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace trellis
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Warning;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t cursor       = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", cursor);
                if (pos != std::string::npos)
                {
                    auto text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    cursor = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();

// Appends one line per entry to `filename`, flushed as written. Throws
// std::runtime_error when the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);

// Appends every entry to a shared buffer. Intended for tests and tooling that
// inspect what the pipeline reported.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer);
}   // namespace sinks

#define TRELLIS_LOG_TRACE(category, ...)                                            \
    do                                                                              \
    {                                                                               \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Trace))   \
        {                                                                           \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Trace, \
                                                        category,                   \
                                                        __VA_ARGS__);               \
        }                                                                           \
    } while (0)

#define TRELLIS_LOG_DEBUG(category, ...)                                            \
    do                                                                              \
    {                                                                               \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Debug))   \
        {                                                                           \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Debug, \
                                                        category,                   \
                                                        __VA_ARGS__);               \
        }                                                                           \
    } while (0)

#define TRELLIS_LOG_INFO(category, ...)                                            \
    do                                                                             \
    {                                                                              \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Info))   \
        {                                                                          \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Info, \
                                                        category,                  \
                                                        __VA_ARGS__);              \
        }                                                                          \
    } while (0)

#define TRELLIS_LOG_WARN(category, ...)                                               \
    do                                                                                \
    {                                                                                 \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Warning))   \
        {                                                                             \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Warning, \
                                                        category,                     \
                                                        __VA_ARGS__);                 \
        }                                                                             \
    } while (0)

#define TRELLIS_LOG_ERROR(category, ...)                                            \
    do                                                                              \
    {                                                                               \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Error))   \
        {                                                                           \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Error, \
                                                        category,                   \
                                                        __VA_ARGS__);               \
        }                                                                           \
    } while (0)

#define TRELLIS_LOG_CRITICAL(category, ...)                                            \
    do                                                                                 \
    {                                                                                  \
        if (::trellis::Logger::instance().is_enabled(::trellis::LogLevel::Critical))   \
        {                                                                              \
            ::trellis::Logger::instance().log_formatted(::trellis::LogLevel::Critical, \
                                                        category,                      \
                                                        __VA_ARGS__);                  \
        }                                                                              \
    } while (0)

}   // namespace trellis
