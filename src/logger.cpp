// Logger 实现：基于 Qt 日志分类的 qCDebug 系列宏封装日志输出
#include "logger.h"

#include <atomic>

Q_LOGGING_CATEGORY(lcLyrics, "lyrics.core")

namespace Lyrics
{

namespace
{

// 解析可能在多个线程中并发运行，级别读写使用原子变量
std::atomic<int> levelValue{static_cast<int>(Logger::Level::Info)};

bool enabled(Logger::Level level)
{
	return levelValue.load(std::memory_order_relaxed) <= static_cast<int>(level);
}

}

void Logger::init(Level level)
{
	setLevel(level);
}

void Logger::setLevel(Level level)
{
	levelValue.store(static_cast<int>(level), std::memory_order_relaxed);
}

Logger::Level Logger::level()
{
	return static_cast<Level>(levelValue.load(std::memory_order_relaxed));
}

// 输出调试日志（仅 Debug 级别可见）
void Logger::debug(const QString &message)
{
	if (enabled(Level::Debug))
		qCDebug(lcLyrics).noquote() << message;
}

void Logger::info(const QString &message)
{
	if (enabled(Level::Info))
		qCInfo(lcLyrics).noquote() << message;
}

void Logger::warning(const QString &message)
{
	if (enabled(Level::Warning))
		qCWarning(lcLyrics).noquote() << message;
}

void Logger::error(const QString &message)
{
	if (enabled(Level::Error))
		qCCritical(lcLyrics).noquote() << message;
}

}
