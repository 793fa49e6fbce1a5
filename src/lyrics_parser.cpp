// 歌词解析入口实现
#include "lyrics_parser.h"

#include <QJsonDocument>
#include <QJsonParseError>

#include "json_utils.h"
#include "logger.h"
#include "lrc_parser.h"
#include "lyric_grammar.h"
#include "lyric_timeline.h"
#include "translation_merger.h"
#include "yrc_parser.h"

namespace Lyrics
{

namespace
{

// 读取 root[track].lyric，字段缺失或类型不符时视为没有该歌词轨
QString readTrack(const QJsonObject &root, const QString &track)
{
	Result<QJsonObject> obj = Json::readObject(root, track, false);
	if (!obj.ok)
	{
		Logger::warning(QStringLiteral("Lyric response: %1").arg(obj.error.message));
		return QString();
	}
	Result<QString> lyric = Json::readString(obj.value, QStringLiteral("lyric"), false);
	if (!lyric.ok)
	{
		Logger::warning(QStringLiteral("Lyric response: %1.%2").arg(track, lyric.error.message));
		return QString();
	}
	return lyric.value;
}

}

bool isWordSyncedFormat(const QString &content)
{
	for (const QString &line : splitLines(content))
	{
		const QString trimmed = line.trimmed();
		if (looksLikeWordSyncedLine(trimmed) || looksLikeObjectLine(trimmed))
			return true;
	}
	return false;
}

QList<LyricLine> parseLyrics(const QString &content, const QString &translationContent, const LyricsOptions &options)
{
	if (content.trimmed().isEmpty())
		return {};

	const bool wordSynced = isWordSyncedFormat(content);
	QList<LyricLine> lines = wordSynced ? parseWordSyncedLyrics(content, options) : parseLrc(content, options);
	if (!translationContent.trimmed().isEmpty())
		lines = mergeTranslations(lines, translationContent, options);

	Logger::debug(QStringLiteral("Parsed %1 lyric lines (%2)")
					  .arg(lines.size())
					  .arg(wordSynced ? QStringLiteral("word-synced") : QStringLiteral("line-timed")));
	return applyTimeline(lines, options);
}

Result<QList<LyricLine>> parseLyricResponse(const QByteArray &body, const LyricsOptions &options)
{
	QJsonParseError err{};
	QJsonDocument doc = QJsonDocument::fromJson(body, &err);
	if (err.error != QJsonParseError::NoError || !doc.isObject())
	{
		Error e;
		e.category = ErrorCategory::Parser;
		e.code = -1;
		e.message = QStringLiteral("Parse lyric response failed");
		e.detail = err.error != QJsonParseError::NoError ? err.errorString() : QStringLiteral("root is not an object");
		return Result<QList<LyricLine>>::failure(e);
	}
	const QJsonObject root = doc.object();
	const QString rawLrc = readTrack(root, QStringLiteral("lrc"));
	const QString rawTLrc = readTrack(root, QStringLiteral("tlyric"));
	const QString rawYrc = readTrack(root, QStringLiteral("yrc"));
	const QString rawYtLrc = readTrack(root, QStringLiteral("ytlrc"));

	if (!rawYrc.trimmed().isEmpty())
	{
		const QString translation = rawYtLrc.trimmed().isEmpty() ? rawTLrc : rawYtLrc;
		return Result<QList<LyricLine>>::success(parseLyrics(rawYrc, translation, options));
	}
	return Result<QList<LyricLine>>::success(parseLyrics(rawLrc, rawTLrc, options));
}

}
