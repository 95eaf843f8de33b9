#ifndef __TINY_STEAMGUARD_BASICIO_HPP__
#define __TINY_STEAMGUARD_BASICIO_HPP__

#include <cstdarg>
#include <cstdio>
#include <mutex>

enum class LogLevel : int
{
	Critical = 0,
	Warning,
	Info,
	Debug,
	Trace,
};

inline LogLevel		g_LogLevel = LogLevel::Info;
inline std::mutex	g_LogLock;

inline void SetLogLevel(LogLevel level)
{
	g_LogLevel = level;
}

inline bool IsLogLevelEnabled(LogLevel level)
{
	return static_cast<int>(level) <= static_cast<int>(g_LogLevel);
}

inline int vlogmsg(LogLevel level, const char* format, va_list args)
{
	if (!IsLogLevelEnabled(level))
		return 0;

	//Accounts are loaded on a thread pool, keep lines whole
	std::lock_guard<std::mutex> lock(g_LogLock);
	return vfprintf(stderr, format, args);
}

//Print raw protocol traffic
inline int tracemsg(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	int count = vlogmsg(LogLevel::Trace, format, args);
	va_end(args);
	return count;
}

//Print debug message
inline int dbgmsg(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	int count = vlogmsg(LogLevel::Debug, format, args);
	va_end(args);
	return count;
}

inline int infomsg(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	int count = vlogmsg(LogLevel::Info, format, args);
	va_end(args);
	return count;
}

inline int warnmsg(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	int count = vlogmsg(LogLevel::Warning, format, args);
	va_end(args);
	return count;
}

//Print critical messages, never filtered
inline int criticalmsg(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	int count = vlogmsg(LogLevel::Critical, format, args);
	va_end(args);
	return count;
}

#endif // !__TINY_STEAMGUARD_BASICIO_HPP__
