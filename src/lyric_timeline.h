// 时间轴后处理：行时长计算与间奏占位行插入
#pragma once

#include <QList>

#include "core_types.h"
#include "lyrics_options.h"

namespace Lyrics
{

// 带原始行号的输出行，仅在解析器内部用于排序
struct IndexedLine
{
	LyricLine line;
	int originalIndex = 0;
};

// 按 time 升序稳定排序，time 相同时按原始行号
QList<LyricLine> sortedLines(QList<IndexedLine> lines);

// 在相邻两行间隔过长处插入间奏占位行；与已有占位行相邻的间隔不再处理，因此可重复调用
QList<LyricLine> insertInterludes(const QList<LyricLine> &lines, const LyricsOptions &options);

// duration = 下一行 time - 本行 time；最后一行取 lineHoldTime 与逐字跨度中的较大者
QList<LyricLine> computeDurations(const QList<LyricLine> &lines, const LyricsOptions &options);

// 按配置插入间奏后计算时长，对自身输出再次调用结果不变
QList<LyricLine> applyTimeline(const QList<LyricLine> &lines, const LyricsOptions &options);

// 将行内字词的结束时间限制在下一行开始之前，并保证 end > start
void clampWordsToNextLine(QList<LyricLine> &lines, double minWordDuration);

}
