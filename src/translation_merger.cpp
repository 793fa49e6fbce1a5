// 外部翻译轨合并实现
#include "translation_merger.h"

#include <cstdlib>
#include <limits>

#include "logger.h"
#include "lyric_grammar.h"
#include "lyric_text.h"

namespace Lyrics
{

void TranslationMap::insert(qint64 key, const QString &text)
{
	buckets[key].enqueue(text);
}

bool TranslationMap::popFront(QMap<qint64, QQueue<QString>>::iterator it, QString &out)
{
	if (it == buckets.end() || it->isEmpty())
		return false;
	out = it->dequeue();
	if (it->isEmpty())
		buckets.erase(it);
	return true;
}

bool TranslationMap::takeExact(qint64 key, QString &out)
{
	return popFront(buckets.find(key), out);
}

bool TranslationMap::takeNearest(qint64 key, qint64 toleranceMs, QString &out)
{
	auto best = buckets.end();
	qint64 minDiff = std::numeric_limits<qint64>::max();
	// 只需扫描 [key - tolerance, key + tolerance] 区间
	for (auto it = buckets.lowerBound(key - toleranceMs); it != buckets.end() && it.key() <= key + toleranceMs; ++it)
	{
		if (it->isEmpty())
			continue;
		const qint64 diff = std::abs(it.key() - key);
		if (diff < minDiff)
		{
			minDiff = diff;
			best = it;
		}
	}
	return popFront(best, out);
}

bool TranslationMap::isEmpty() const
{
	return buckets.isEmpty();
}

int TranslationMap::size() const
{
	int total = 0;
	for (const QQueue<QString> &queue : buckets)
		total += queue.size();
	return total;
}

TranslationMap buildTranslationMap(const QString &translationContent)
{
	TranslationMap map;
	const QStringList rawLines = splitLines(translationContent);
	for (int index = 0; index < rawLines.size(); ++index)
	{
		for (const ParsedLineData &entry : parseTrackLine(rawLines.at(index), index))
		{
			const QString text = entryDisplayText(entry).trimmed();
			if (text.isEmpty() || isMetadataLine(text))
				continue;
			map.insert(normalizeTimeKey(entry.time), text);
		}
	}
	return map;
}

QList<LyricLine> mergeTranslations(const QList<LyricLine> &lines, const QString &translationContent,
								   const LyricsOptions &options)
{
	if (translationContent.trimmed().isEmpty())
		return lines;
	TranslationMap map = buildTranslationMap(translationContent);
	if (map.isEmpty())
		return lines;

	const int available = map.size();
	QList<LyricLine> out = lines;
	for (LyricLine &line : out)
	{
		if (line.isInterlude)
			continue;
		const qint64 key = normalizeTimeKey(line.time);
		const double tolerance = line.isPreciseTiming ? options.preciseTranslationTolerance : options.lineTranslationTolerance;
		QString value;
		if (!map.takeExact(key, value) && !map.takeNearest(key, normalizeTimeKey(tolerance), value))
			continue;
		value = value.trimmed();
		if (!value.isEmpty() && !sameTextIgnoringCase(value, line.text))
			line.translation = value;
	}

	Logger::debug(QStringLiteral("Translation: %1 entries available, %2 left unmatched")
					  .arg(available)
					  .arg(map.size()));
	return out;
}

}
