// 歌词行文法实现
#include "lyric_grammar.h"

#include <algorithm>
#include <cmath>

#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

#include "json_utils.h"
#include "lyric_text.h"

namespace Lyrics
{

namespace
{

const QRegularExpression &timeTagRe()
{
	static const QRegularExpression re(QStringLiteral("\\[(\\d{1,3}:\\d{1,2}(?:[.:]\\d{1,3})?)\\]"));
	return re;
}

const QRegularExpression &wordSyncedLineRe()
{
	static const QRegularExpression re(QStringLiteral("^\\[(\\d+),(\\d+)\\](.*)$"));
	return re;
}

const QRegularExpression &wordSyncedWordRe()
{
	static const QRegularExpression re(QStringLiteral("\\((\\d+),(\\d+),(\\d+)\\)([^(]*)"));
	return re;
}

const QRegularExpression &wordTagRe()
{
	static const QRegularExpression re(QStringLiteral("<[^>]+>"));
	return re;
}

ParsedLineData makeEntry(double time, const QString &text, int originalIndex)
{
	ParsedLineData entry;
	entry.time = time;
	entry.text = text;
	entry.originalIndex = originalIndex;
	return entry;
}

}

QStringList splitLines(const QString &content)
{
	QString normalized = content;
	normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
	normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));
	return normalized.split(QLatin1Char('\n'));
}

bool matchObjectLine(const QString &line, ObjectLine &out)
{
	if (!line.startsWith(QLatin1Char('{')) || !line.endsWith(QLatin1Char('}')))
		return false;
	QJsonParseError err{};
	QJsonDocument doc = QJsonDocument::fromJson(line.toUtf8(), &err);
	if (err.error != QJsonParseError::NoError || !doc.isObject())
		return false;
	QJsonObject obj = doc.object();
	Result<QJsonArray> chunks = Json::readArray(obj, QStringLiteral("c"));
	if (!chunks.ok)
		return false;
	Result<qint64> t = Json::readInt64(obj, QStringLiteral("t"), false);

	QString text;
	for (const QJsonValue &cv : chunks.value)
	{
		if (!cv.isObject())
			continue;
		Result<QString> tx = Json::readString(cv.toObject(), QStringLiteral("tx"), false);
		if (tx.ok)
			text.append(tx.value);
	}
	out.timeMs = t.ok ? t.value : 0;
	out.text = text;
	return true;
}

bool matchWordSyncedLine(const QString &line, WordSyncedLine &out)
{
	QRegularExpressionMatch m = wordSyncedLineRe().match(line);
	if (!m.hasMatch())
		return false;
	bool okStart = false;
	bool okDuration = false;
	const qint64 startMs = m.captured(1).toLongLong(&okStart);
	const qint64 durationMs = m.captured(2).toLongLong(&okDuration);
	if (!okStart || !okDuration)
		return false;

	const QString content = m.captured(3);
	QList<LyricWord> words;
	QString text;
	QRegularExpressionMatchIterator it = wordSyncedWordRe().globalMatch(content);
	bool anyWordGroup = false;
	while (it.hasNext())
	{
		QRegularExpressionMatch wm = it.next();
		anyWordGroup = true;
		bool okWordStart = false;
		bool okWordDuration = false;
		const qint64 wordStartMs = wm.captured(1).toLongLong(&okWordStart);
		const qint64 wordDurationMs = wm.captured(2).toLongLong(&okWordDuration);
		const QString wordText = wm.captured(4);
		if (!okWordStart || !okWordDuration || wordText.isEmpty())
			continue;
		text.append(wordText);
		words.append(createWord(wordText, wordStartMs / 1000.0, (wordStartMs + wordDurationMs) / 1000.0));
	}

	out.startMs = startMs;
	out.durationMs = durationMs;
	out.words = words;
	out.text = anyWordGroup ? text : content.trimmed();
	return true;
}

bool matchTimedLine(const QString &line, TimedLine &out)
{
	QList<double> times;
	int offset = 0;
	for (;;)
	{
		QRegularExpressionMatch m = timeTagRe().match(line, offset, QRegularExpression::NormalMatch,
													  QRegularExpression::AnchorAtOffsetMatchOption);
		if (!m.hasMatch())
			break;
		bool ok = false;
		const double t = parseTimeTag(m.captured(1), &ok);
		if (ok)
			times.append(t);
		offset = m.capturedEnd();
	}
	if (times.isEmpty())
		return false;
	out.times = times;
	out.content = line.mid(offset).trimmed();
	return true;
}

bool looksLikeObjectLine(const QString &line)
{
	return line.startsWith(QLatin1Char('{')) && line.contains(QStringLiteral("\"c\":["));
}

bool looksLikeWordSyncedLine(const QString &line)
{
	return wordSyncedLineRe().match(line).hasMatch();
}

QString stripWordTags(const QString &content)
{
	QString text = content;
	text.remove(wordTagRe());
	return text.trimmed();
}

QList<ParsedLineData> parseTrackLine(const QString &line, int originalIndex)
{
	QList<ParsedLineData> entries;
	const QString trimmed = line.trimmed();
	if (trimmed.isEmpty())
		return entries;

	ObjectLine object;
	if (matchObjectLine(trimmed, object))
	{
		ParsedLineData entry = makeEntry(object.timeMs / 1000.0, object.text, originalIndex);
		entry.isMetadata = true;
		entries.append(entry);
		return entries;
	}

	WordSyncedLine synced;
	if (matchWordSyncedLine(trimmed, synced))
	{
		ParsedLineData entry = makeEntry(synced.startMs / 1000.0, synced.text, originalIndex);
		entry.words = mergePunctuationWords(synced.words);
		entry.tagCount = entry.words.size() + WordSyncedPriority;
		entry.isMetadata = isMetadataLine(synced.text);
		entries.append(entry);
		return entries;
	}

	TimedLine timed;
	if (matchTimedLine(trimmed, timed))
	{
		const QString text = stripWordTags(timed.content);
		const bool metadata = isMetadataLine(text);
		for (double t : timed.times)
		{
			ParsedLineData entry = makeEntry(t, text, originalIndex);
			entry.isMetadata = metadata;
			entries.append(entry);
		}
	}
	return entries;
}

void sortEntriesByTime(QList<ParsedLineData> &entries)
{
	auto key = [](double time) {
		return static_cast<qint64>(std::llround(time * 100.0));
	};
	std::stable_sort(entries.begin(), entries.end(), [&key](const ParsedLineData &a, const ParsedLineData &b) {
		const qint64 ka = key(a.time);
		const qint64 kb = key(b.time);
		if (ka != kb)
			return ka < kb;
		return a.originalIndex < b.originalIndex;
	});
}

}
