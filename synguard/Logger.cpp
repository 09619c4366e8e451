#include "Logger.h"
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <atomic>

static std::mutex g_log_mutex;
static FILE *g_log_file = nullptr;
static std::atomic<int> g_log_level{LOG_INFO};

static const char *LevelTag(eLogLevel level)
{
    switch (level)
    {
    case LOG_DEBUG:
        return "DEBUG";
    case LOG_INFO:
        return "INFO";
    case LOG_WARN:
        return "WARN";
    case LOG_ERROR:
        return "ERROR";
    }
    return "?";
}

bool InitLogger(eLogLevel level, const std::string &file_path)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_level = level;

    if (g_log_file)
    {
        fclose(g_log_file);
        g_log_file = nullptr;
    }
    if (file_path.empty())
        return true;

    g_log_file = fopen(file_path.c_str(), "a");
    if (!g_log_file)
    {
        fprintf(stderr, "[Logger] can not open log file: %s\n", file_path.c_str());
        return false;
    }
    return true;
}

void LogMsg(eLogLevel level, const char *fmt, ...)
{
    if (level < g_log_level.load(std::memory_order_relaxed))
        return;

    char body[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char stamp[16];
    time_t t = time(nullptr);
    struct tm tm_;
    localtime_r(&t, &tm_);
    strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE *out = (level >= LOG_WARN) ? stderr : stdout;
    fprintf(out, "[%s] %-5s %s\n", stamp, LevelTag(level), body);
    fflush(out);

    if (g_log_file)
    {
        fprintf(g_log_file, "[%s] %-5s %s\n", stamp, LevelTag(level), body);
        fflush(g_log_file);
    }
}

void ShutdownLogger()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file)
    {
        fclose(g_log_file);
        g_log_file = nullptr;
    }
}

bool LogLevelFromString(const std::string &text, eLogLevel &out_level)
{
    if (text == "debug")
        out_level = LOG_DEBUG;
    else if (text == "info")
        out_level = LOG_INFO;
    else if (text == "warn")
        out_level = LOG_WARN;
    else if (text == "error")
        out_level = LOG_ERROR;
    else
        return false;
    return true;
}
