// LRC 解析实现：逐行解析 -> 排序 -> 按时间分组选主行 -> 清洗字词 -> 时间轴后处理
#include "lrc_parser.h"

#include <algorithm>
#include <QRegularExpression>

#include "logger.h"
#include "lyric_grammar.h"
#include "lyric_text.h"
#include "lyric_timeline.h"

namespace Lyrics
{

namespace
{

// <mm:ss.xx>word
const QRegularExpression &wordTagRe()
{
	static const QRegularExpression re(QStringLiteral("<(\\d{1,3}:\\d{1,2}(?:[.:]\\d{1,3})?)>([^<]*)"));
	return re;
}

struct WordTagContent
{
	QString text;
	QList<LyricWord> words;
	int tagCount = 0;
};

// 字标签的结束时间为下一个字标签的开始，最后一个字按 lastWordDuration 估计
WordTagContent parseWordTags(const QString &content, const LyricsOptions &options)
{
	struct Tag
	{
		double time = 0.0;
		QString text;
	};
	QList<Tag> tags;
	QRegularExpressionMatchIterator it = wordTagRe().globalMatch(content);
	while (it.hasNext())
	{
		QRegularExpressionMatch m = it.next();
		bool ok = false;
		Tag tag;
		tag.time = parseTimeTag(m.captured(1), &ok);
		if (!ok)
			continue;
		tag.text = m.captured(2);
		tags.append(tag);
	}

	WordTagContent out;
	out.tagCount = tags.size();
	QList<LyricWord> words;
	for (int i = 0; i < tags.size(); ++i)
	{
		const Tag &tag = tags.at(i);
		if (tag.text.isEmpty())
			continue;
		const double end = (i + 1 < tags.size()) ? tags.at(i + 1).time : tag.time + options.lastWordDuration;
		words.append(createWord(tag.text, tag.time, end));
	}
	out.words = mergePunctuationWords(words);
	out.text = stripWordTags(content);
	return out;
}

// 一行可带多个时间标签，每个标签产生一条共享文本与字词的记录
QList<ParsedLineData> parseLrcLine(const QString &line, int originalIndex, const LyricsOptions &options)
{
	QList<ParsedLineData> entries;
	TimedLine timed;
	if (!matchTimedLine(line.trimmed(), timed))
		return entries;

	const WordTagContent content = parseWordTags(timed.content, options);
	const bool metadata = isMetadataLine(content.text);
	for (double t : timed.times)
	{
		ParsedLineData entry;
		entry.time = t;
		entry.text = content.text;
		entry.words = content.words;
		entry.tagCount = content.tagCount;
		entry.originalIndex = originalIndex;
		entry.isMetadata = metadata;
		entries.append(entry);
	}
	return entries;
}

// 组内主行：非署名且有内容的最高优先级，其次任意有内容，最后取第一个
const ParsedLineData *pickMain(QList<const ParsedLineData *> &group)
{
	std::stable_sort(group.begin(), group.end(), [](const ParsedLineData *a, const ParsedLineData *b) {
		if (a->tagCount != b->tagCount)
			return a->tagCount > b->tagCount;
		return a->originalIndex < b->originalIndex;
	});
	for (const ParsedLineData *entry : group)
	{
		if (!entry->isMetadata && hasMeaningfulContent(*entry))
			return entry;
	}
	for (const ParsedLineData *entry : group)
	{
		if (hasMeaningfulContent(*entry))
			return entry;
	}
	return group.first();
}

QList<IndexedLine> groupAndMergeLines(const QList<ParsedLineData> &entries, const LyricsOptions &options)
{
	QList<IndexedLine> result;
	int i = 0;
	while (i < entries.size())
	{
		const ParsedLineData &anchor = entries.at(i);
		QList<const ParsedLineData *> group{&anchor};
		// 分组窗口按毫秒比较，10.00 / 10.10 与 1.00 / 1.10 同样视为恰好 100ms
		const qint64 anchorKey = normalizeTimeKey(anchor.time);
		const qint64 windowMs = normalizeTimeKey(options.groupThreshold);
		int j = i + 1;
		while (j < entries.size() && qAbs(normalizeTimeKey(entries.at(j).time) - anchorKey) < windowMs)
		{
			group.append(&entries.at(j));
			++j;
		}
		i = j;

		const ParsedLineData *main = pickMain(group);
		if (main->isMetadata)
			continue;

		QString mainText = entryDisplayText(*main);
		if (mainText.isEmpty())
			mainText = main->text;

		QStringList translations;
		for (const ParsedLineData *entry : group)
		{
			if (entry == main || entry->isMetadata || !hasMeaningfulContent(*entry))
				continue;
			const QString text = entryDisplayText(*entry).trimmed();
			if (text.isEmpty() || sameTextIgnoringCase(text, mainText))
				continue;
			translations.append(text);
		}

		IndexedLine out;
		out.line.time = main->time;
		out.line.text = mainText;
		out.line.words = main->words;
		out.line.translation = translations.join(QLatin1Char('\n'));
		out.line.isPreciseTiming = false;
		out.originalIndex = main->originalIndex;
		result.append(out);
	}
	return result;
}

}

QList<LyricLine> parseLrc(const QString &content, const LyricsOptions &options)
{
	const QStringList rawLines = splitLines(content);
	QList<ParsedLineData> entries;
	for (int index = 0; index < rawLines.size(); ++index)
		entries.append(parseLrcLine(rawLines.at(index), index, options));

	sortEntriesByTime(entries);
	QList<LyricLine> lines = sortedLines(groupAndMergeLines(entries, options));
	clampWordsToNextLine(lines, options.minWordDuration);

	Logger::debug(QStringLiteral("LRC: %1 raw lines, %2 timed entries, %3 output lines")
					  .arg(rawLines.size())
					  .arg(entries.size())
					  .arg(lines.size()));
	return applyTimeline(lines, options);
}

}
