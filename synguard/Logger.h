#pragma once
#include <string>

enum eLogLevel
{
	LOG_DEBUG,
	LOG_INFO,
	LOG_WARN,
	LOG_ERROR
};

// Call once at start. file_path empty -> console only.
bool InitLogger(eLogLevel level, const std::string &file_path = "");

// Thread-safe printf-style logging; every line gets a [HH:MM:SS] stamp.
// WARN and ERROR go to stderr, the rest to stdout.
void LogMsg(eLogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

void ShutdownLogger();

bool LogLevelFromString(const std::string &text, eLogLevel &out_level);
