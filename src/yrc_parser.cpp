// 逐字歌词解析实现
#include "yrc_parser.h"

#include <algorithm>
#include <limits>

#include "logger.h"
#include "lyric_grammar.h"
#include "lyric_text.h"
#include "lyric_timeline.h"

namespace Lyrics
{

namespace
{

bool isWordSynced(const ParsedLineData &entry)
{
	return entry.tagCount >= WordSyncedPriority;
}

// 一个逐字主行及分配给它的翻译
struct Bucket
{
	const ParsedLineData *main = nullptr;
	QStringList translations;
};

LyricLine toLine(const ParsedLineData &entry, bool precise)
{
	LyricLine line;
	line.time = entry.time;
	line.text = entryDisplayText(entry);
	if (line.text.isEmpty())
		line.text = entry.text;
	line.words = entry.words;
	line.isPreciseTiming = precise;
	return line;
}

QList<IndexedLine> mergeWithTranslations(const QList<ParsedLineData> &entries, const LyricsOptions &options)
{
	QList<Bucket> buckets;
	QList<const ParsedLineData *> others;
	for (const ParsedLineData &entry : entries)
	{
		if (isWordSynced(entry))
		{
			Bucket bucket;
			bucket.main = &entry;
			buckets.append(bucket);
		}
		else
		{
			others.append(&entry);
		}
	}

	QList<const ParsedLineData *> orphans;
	for (const ParsedLineData *entry : others)
	{
		if (entry->isMetadata)
			continue;
		// 以毫秒比较，避免浮点误差让容差边界随输入漂移
		const qint64 entryKey = normalizeTimeKey(entry->time);
		int closest = -1;
		qint64 minDiff = std::numeric_limits<qint64>::max();
		for (int i = 0; i < buckets.size(); ++i)
		{
			const qint64 diff = qAbs(normalizeTimeKey(buckets.at(i).main->time) - entryKey);
			if (diff < minDiff)
			{
				minDiff = diff;
				closest = i;
			}
		}
		if (closest >= 0 && minDiff < normalizeTimeKey(options.bucketTolerance))
			buckets[closest].translations.append(entryDisplayText(*entry));
		else
			orphans.append(entry);
	}

	QList<IndexedLine> result;
	for (const Bucket &bucket : buckets)
	{
		if (bucket.main->isMetadata)
			continue;
		IndexedLine out;
		out.line = toLine(*bucket.main, true);
		out.originalIndex = bucket.main->originalIndex;

		QStringList kept;
		for (const QString &raw : bucket.translations)
		{
			const QString text = raw.trimmed();
			if (text.isEmpty() || sameTextIgnoringCase(text, out.line.text))
				continue;
			kept.append(text);
		}
		out.line.translation = kept.join(QLatin1Char('\n'));
		result.append(out);
	}

	for (const ParsedLineData *orphan : orphans)
	{
		IndexedLine out;
		out.line = toLine(*orphan, false);
		out.originalIndex = orphan->originalIndex;
		result.append(out);
	}

	Logger::debug(QStringLiteral("YRC: %1 word-synced lines, %2 secondary entries, %3 orphans")
					  .arg(buckets.size())
					  .arg(others.size())
					  .arg(orphans.size()));
	return result;
}

// 没有逐字行时的退路：只保留有内容的非署名行
QList<IndexedLine> plainLines(const QList<ParsedLineData> &entries)
{
	QList<IndexedLine> result;
	for (const ParsedLineData &entry : entries)
	{
		if (entry.isMetadata || !hasMeaningfulContent(entry))
			continue;
		IndexedLine out;
		out.line = toLine(entry, false);
		out.originalIndex = entry.originalIndex;
		result.append(out);
	}
	return result;
}

}

void sanitizeWordDurations(QList<ParsedLineData> &entries, const LyricsOptions &options)
{
	// 每条记录之后第一个开始时间更晚的逐字行；中间的翻译行与同时刻的行都跳过
	QList<double> nextLineTime(entries.size(), -1.0);
	for (int i = 0; i < entries.size(); ++i)
	{
		for (int j = i + 1; j < entries.size(); ++j)
		{
			const ParsedLineData &following = entries.at(j);
			if (isWordSynced(following) && following.time > entries.at(i).time)
			{
				nextLineTime[i] = following.time;
				break;
			}
		}
	}

	for (int i = 0; i < entries.size(); ++i)
	{
		QList<LyricWord> &words = entries[i].words;
		for (int j = 0; j < words.size(); ++j)
		{
			LyricWord &word = words[j];
			double maxEnd = 0.0;
			if (j + 1 < words.size())
				maxEnd = words.at(j + 1).startTime;
			else if (nextLineTime.at(i) >= 0.0)
				maxEnd = nextLineTime.at(i);
			else
				maxEnd = word.startTime + options.maxWordDuration;

			if (word.endTime - word.startTime > options.maxWordDuration)
				word.endTime = std::min(word.startTime + options.maxWordDuration, maxEnd);
			if (word.endTime > maxEnd)
				word.endTime = maxEnd;
			if (word.endTime <= word.startTime)
				word.endTime = word.startTime + options.minWordDuration;
		}
	}
}

QList<LyricLine> parseWordSyncedLyrics(const QString &content, const LyricsOptions &options)
{
	const QStringList rawLines = splitLines(content);
	QList<ParsedLineData> entries;
	for (int index = 0; index < rawLines.size(); ++index)
		entries.append(parseTrackLine(rawLines.at(index), index));

	sortEntriesByTime(entries);
	sanitizeWordDurations(entries, options);

	bool hasWordSynced = false;
	for (const ParsedLineData &entry : entries)
	{
		if (isWordSynced(entry))
		{
			hasWordSynced = true;
			break;
		}
	}

	QList<IndexedLine> merged = hasWordSynced ? mergeWithTranslations(entries, options) : plainLines(entries);
	return applyTimeline(sortedLines(merged), options);
}

}
