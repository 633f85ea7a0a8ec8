#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <sstream>

LogLevel Logger::s_minLevel = LogLevel::Info;
LogOutput Logger::s_output = LogOutput::Console;
std::ofstream Logger::s_file;
bool Logger::s_initialized = false;
uint64_t Logger::s_counts[4] = {0, 0, 0, 0};

const char *log_level_name(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

static std::string timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::init(LogOutput output, LogLevel minLevel, const std::string &logDir)
{
    s_output = output;
    s_minLevel = minLevel;
    reset_counts();

    if (output == LogOutput::File || output == LogOutput::Both)
    {
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (ec)
        {
            fmt::print(stderr, "[Logger] Failed to create log directory {}: {}\n", logDir, ec.message());
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::ostringstream filename;
        filename << logDir << "/bastion_"
                << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S")
                << ".log";

        s_file.open(filename.str(), std::ios::out | std::ios::trunc);
        if (!s_file.is_open())
        {
            fmt::print(stderr, "[Logger] Failed to open log file: {}\n", filename.str());
        }
    }

    s_initialized = true;
}

void Logger::shutdown()
{
    if (s_file.is_open())
        s_file.close();
    s_initialized = false;
}

uint64_t Logger::count(LogLevel level)
{
    return s_counts[static_cast<size_t>(level)];
}

void Logger::reset_counts()
{
    std::fill(std::begin(s_counts), std::end(s_counts), 0);
}

void Logger::bump(LogLevel level)
{
    ++s_counts[static_cast<size_t>(level)];
}

void Logger::log(LogLevel level, std::string_view message)
{
    bump(level);

    if (s_output == LogOutput::Console || s_output == LogOutput::Both)
    {
        if (level == LogLevel::Error || level == LogLevel::Warn)
            fmt::print(stderr, "[{}] {}\n", log_level_name(level), message);
        else
            fmt::print("{}\n", message);
    }

    if ((s_output == LogOutput::File || s_output == LogOutput::Both) && s_file.is_open())
    {
        s_file << '[' << log_level_name(level) << "] [" << timestamp() << "] "
                << message << '\n';
        s_file.flush();
    }
}
