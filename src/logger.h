// 日志封装：统一控制日志级别，并输出到 lyrics.core 日志分类
#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcLyrics)

namespace Lyrics
{

class Logger
{
public:
	// 日志级别，按严重程度递增
	enum class Level
	{
		Debug,
		Info,
		Warning,
		Error,
		None
	};

	// 初始化日志模块，设置初始日志级别
	static void init(Level level = Level::Info);
	static void setLevel(Level level);
	static Level level();

	static void debug(const QString &message);
	static void info(const QString &message);
	static void warning(const QString &message);
	static void error(const QString &message);
};

}
