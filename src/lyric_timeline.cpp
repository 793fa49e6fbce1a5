// 时间轴后处理实现
#include "lyric_timeline.h"

#include <algorithm>

#include "lyric_text.h"

namespace Lyrics
{

namespace
{

// 估计一行在屏幕上结束的时间：有字词时取最后一个字词的结束，否则按固定停留时长
double estimatedEnd(const LyricLine &line, const LyricsOptions &options)
{
	if (!line.words.isEmpty())
		return std::max(line.words.last().endTime, line.time);
	return line.time + options.lineHoldTime;
}

LyricLine makeInterlude(double time)
{
	LyricLine interlude;
	interlude.time = time;
	interlude.isInterlude = true;
	return interlude;
}

}

QList<LyricLine> sortedLines(QList<IndexedLine> lines)
{
	std::stable_sort(lines.begin(), lines.end(), [](const IndexedLine &a, const IndexedLine &b) {
		if (a.line.time != b.line.time)
			return a.line.time < b.line.time;
		return a.originalIndex < b.originalIndex;
	});
	QList<LyricLine> out;
	out.reserve(lines.size());
	for (const IndexedLine &l : lines)
		out.append(l.line);
	return out;
}

QList<LyricLine> insertInterludes(const QList<LyricLine> &lines, const LyricsOptions &options)
{
	QList<LyricLine> out;
	out.reserve(lines.size());
	for (int i = 0; i < lines.size(); ++i)
	{
		const LyricLine &line = lines.at(i);
		out.append(line);
		if (i + 1 >= lines.size())
			break;
		const LyricLine &next = lines.at(i + 1);
		if (line.isInterlude || next.isInterlude)
			continue;
		const qint64 nextKey = normalizeTimeKey(next.time);
		if (nextKey - normalizeTimeKey(line.time) <= normalizeTimeKey(options.interludeThreshold))
			continue;
		const double end = estimatedEnd(line, options);
		if (nextKey - normalizeTimeKey(end) < normalizeTimeKey(options.interludeMinDuration))
			continue;
		out.append(makeInterlude(end));
	}
	return out;
}

QList<LyricLine> computeDurations(const QList<LyricLine> &lines, const LyricsOptions &options)
{
	QList<LyricLine> out = lines;
	for (int i = 0; i < out.size(); ++i)
	{
		LyricLine &line = out[i];
		if (i + 1 < out.size())
		{
			line.duration = out.at(i + 1).time - line.time;
			continue;
		}
		double span = 0.0;
		if (!line.words.isEmpty())
			span = line.words.last().endTime - line.time;
		line.duration = std::max(options.lineHoldTime, span);
	}
	return out;
}

QList<LyricLine> applyTimeline(const QList<LyricLine> &lines, const LyricsOptions &options)
{
	if (!options.insertInterludes)
		return computeDurations(lines, options);
	return computeDurations(insertInterludes(lines, options), options);
}

void clampWordsToNextLine(QList<LyricLine> &lines, double minWordDuration)
{
	for (int i = 0; i + 1 < lines.size(); ++i)
	{
		const double nextTime = lines.at(i + 1).time;
		for (LyricWord &w : lines[i].words)
		{
			if (w.endTime > nextTime)
				w.endTime = nextTime;
			if (w.endTime <= w.startTime)
				w.endTime = w.startTime + minWordDuration;
		}
	}
}

}
