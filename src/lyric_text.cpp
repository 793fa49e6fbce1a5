// 歌词基础工具实现
#include "lyric_text.h"

#include <cmath>
#include <QRegularExpression>

namespace Lyrics
{

namespace
{

// 中英文署名标签，后接可选的 by 与冒号
const QRegularExpression &creditLabelRe()
{
	static const QRegularExpression re(
		QStringLiteral("^(?:作词|作曲|编曲|词|曲|制作人|监制|混音|母带|录音|和声|演唱|原唱|出品|发行|企划|统筹"
					   "|lyrics|lyricist|written|composer|composed|music|arranger|arranged|arrangement"
					   "|producer|produced|mixed|mastered|vocals?|recorded)"
					   "(?:\\s*by)?\\s*[:：]"),
		QRegularExpression::CaseInsensitiveOption);
	return re;
}

// "Lyrics by xxx" 这类无冒号的英文署名
const QRegularExpression &creditByRe()
{
	static const QRegularExpression re(
		QStringLiteral("^(?:lyrics|music|composed|arranged|produced|written|mixed)\\s+by\\s+\\S"),
		QRegularExpression::CaseInsensitiveOption);
	return re;
}

// 整行被一对括号包裹且内部带冒号标签，如 "【作词：xxx】"、"(Producer: xxx)"
const QRegularExpression &bracketLabelRe()
{
	static const QRegularExpression re(
		QStringLiteral("^(?:\\[[^\\]]*[:：][^\\]]*\\]"
					   "|【[^】]*[:：][^】]*】"
					   "|\\([^)]*[:：][^)]*\\)"
					   "|（[^）]*[:：][^）]*）)$"));
	return re;
}

}

double parseTimeTag(const QString &tag, bool *ok)
{
	if (ok)
		*ok = false;
	const int colon = tag.indexOf(QLatin1Char(':'));
	if (colon <= 0)
		return 0.0;
	const QString minutesPart = tag.left(colon);
	QString rest = tag.mid(colon + 1);
	QString fractionPart;
	int sep = rest.indexOf(QLatin1Char('.'));
	if (sep < 0)
		sep = rest.indexOf(QLatin1Char(':'));
	if (sep >= 0)
	{
		fractionPart = rest.mid(sep + 1);
		rest = rest.left(sep);
	}

	bool okMin = false;
	bool okSec = false;
	const qint64 minutes = minutesPart.toLongLong(&okMin);
	const qint64 seconds = rest.toLongLong(&okSec);
	if (!okMin || !okSec || minutes < 0 || seconds < 0)
		return 0.0;

	qint64 millis = 0;
	if (!fractionPart.isEmpty())
	{
		bool okFrac = false;
		const qint64 raw = fractionPart.toLongLong(&okFrac);
		if (!okFrac || raw < 0 || fractionPart.size() > 3)
			return 0.0;
		if (fractionPart.size() == 1)
			millis = raw * 100;
		else if (fractionPart.size() == 2)
			millis = raw * 10;
		else
			millis = raw;
	}

	if (ok)
		*ok = true;
	return static_cast<double>(minutes * 60000 + seconds * 1000 + millis) / 1000.0;
}

qint64 normalizeTimeKey(double time)
{
	return static_cast<qint64>(std::llround(time * 1000.0));
}

LyricWord createWord(const QString &text, double start, double end)
{
	LyricWord w;
	w.text = text;
	w.startTime = start;
	w.endTime = end;
	return w;
}

bool isPunctuationOnly(const QString &text)
{
	if (text.isEmpty())
		return false;
	for (const QChar c : text)
	{
		if (!c.isPunct() && !c.isSymbol() && !c.isSpace())
			return false;
	}
	return true;
}

QList<LyricWord> mergePunctuationWords(const QList<LyricWord> &words)
{
	QList<LyricWord> merged;
	merged.reserve(words.size());
	for (const LyricWord &w : words)
	{
		if (!merged.isEmpty() && isPunctuationOnly(w.text))
		{
			LyricWord &prev = merged.last();
			prev.text.append(w.text);
			prev.endTime = w.endTime;
			continue;
		}
		merged.append(w);
	}
	return merged;
}

QString joinWordText(const QList<LyricWord> &words)
{
	QString text;
	for (const LyricWord &w : words)
		text.append(w.text);
	return text;
}

QString entryDisplayText(const ParsedLineData &entry)
{
	if (!entry.words.isEmpty())
	{
		const QString rebuilt = joinWordText(entry.words).trimmed();
		if (!rebuilt.isEmpty())
			return rebuilt;
	}
	return entry.text;
}

bool hasMeaningfulContent(const ParsedLineData &entry)
{
	const QString text = entryDisplayText(entry).trimmed();
	return !text.isEmpty() && !isPunctuationOnly(text);
}

bool isMetadataLine(const QString &text)
{
	const QString trimmed = text.trimmed();
	if (trimmed.isEmpty())
		return false;
	return creditLabelRe().match(trimmed).hasMatch()
		|| creditByRe().match(trimmed).hasMatch()
		|| bracketLabelRe().match(trimmed).hasMatch();
}

bool sameTextIgnoringCase(const QString &a, const QString &b)
{
	return QString::compare(a.trimmed(), b.trimmed(), Qt::CaseInsensitive) == 0;
}

}
