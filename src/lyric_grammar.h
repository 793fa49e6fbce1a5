// 歌词行文法：对象行、逐字行、时间标签行，以及三者共用的优先级分派
//
// 逐字歌词文件与外部翻译轨都按同一顺序尝试：对象行 -> 逐字行 -> 时间标签行，
// 先匹配者生效。两处调用都经过 parseTrackLine，保证优先级不会出现分歧。
#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include "core_types.h"

namespace Lyrics
{

// {"t":0,"c":[{"tx":"作词: "},{"tx":"name"}]}
struct ObjectLine
{
	qint64 timeMs = 0;
	QString text;
};

// [startMs,durationMs](wordStartMs,wordDurationMs,flag)word...
struct WordSyncedLine
{
	qint64 startMs = 0;
	qint64 durationMs = 0;
	QString text;
	// 原始字词，尚未合并标点
	QList<LyricWord> words;
};

// [mm:ss.xx][mm:ss.xx]content
struct TimedLine
{
	QList<double> times;
	QString content;
};

// 按 \n、\r\n、\r 拆分原始文本
QStringList splitLines(const QString &content);

bool matchObjectLine(const QString &line, ObjectLine &out);
bool matchWordSyncedLine(const QString &line, WordSyncedLine &out);
// 只识别行首连续的时间标签，标签之后的全部文本为共享内容
bool matchTimedLine(const QString &line, TimedLine &out);

// 格式探测用：是否以 { 开头且带有片段数组标记
bool looksLikeObjectLine(const QString &line);
bool looksLikeWordSyncedLine(const QString &line);

// 去掉 <mm:ss.xx> 字标签
QString stripWordTags(const QString &content);

// 按 对象行 -> 逐字行 -> 时间标签行 的顺序解析一行，不匹配任何文法时返回空列表
QList<ParsedLineData> parseTrackLine(const QString &line, int originalIndex);

// 以 10ms 精度的时间键排序，键相同时按原始行号，保证结果确定
void sortEntriesByTime(QList<ParsedLineData> &entries);

}
