// 核心领域模型与通用结果类型定义
#pragma once

#include <QList>
#include <QString>

namespace Lyrics
{

// 逐字歌词中的单个字词（时间单位：秒）
struct LyricWord
{
	double startTime = 0.0;
	double endTime = 0.0;
	QString text;
};

// 最终输出的单行歌词
struct LyricLine
{
	double time = 0.0;
	QString text;
	QList<LyricWord> words;
	// 为空表示没有翻译
	QString translation;
	// true 表示逐字时间可信（来自逐字歌词源）
	bool isPreciseTiming = false;
	// 由时间轴后处理填充
	double duration = 0.0;
	// 长间奏中插入的占位行
	bool isInterlude = false;
};

// 解析器内部的中间记录，不会离开单次解析调用
struct ParsedLineData
{
	double time = 0.0;
	QString text;
	QList<LyricWord> words;
	// 分组优先级：普通行 0，增强 LRC 为字标签数量，逐字行为 1000 + 字数
	int tagCount = 0;
	int originalIndex = 0;
	bool isMetadata = false;
};

// 逐字行优先级基数，保证逐字行总是排在普通行之前
constexpr int WordSyncedPriority = 1000;

// 错误分类，用于统一错误上报
enum class ErrorCategory
{
	Parser,
	Io,
	Unknown
};

// 统一错误对象
struct Error
{
	ErrorCategory category = ErrorCategory::Unknown;
	int code = 0;
	QString message;
	QString detail;
};

// 泛型结果类型，用于携带返回值或错误信息
template <typename T>
struct Result
{
	bool ok = false;
	T value{};
	Error error;

	static Result<T> success(const T &v)
	{
		Result<T> r;
		r.ok = true;
		r.value = v;
		return r;
	}

	static Result<T> failure(const Error &e)
	{
		Result<T> r;
		r.ok = false;
		r.error = e;
		return r;
	}
};

}
