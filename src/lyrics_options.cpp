// LyricsOptions 实现：读取 QSettings 中的 lyrics 分组
#include "lyrics_options.h"

#include <QSettings>

#include "logger.h"

namespace Lyrics
{

namespace
{

double readSeconds(QSettings &settings, const QString &key, double fallback)
{
	QVariant v = settings.value(key);
	if (!v.isValid())
		return fallback;
	bool ok = false;
	double value = v.toDouble(&ok);
	if (!ok || value <= 0.0)
	{
		Logger::warning(QStringLiteral("Ignoring invalid lyrics setting %1=%2").arg(key, v.toString()));
		return fallback;
	}
	return value;
}

}

LyricsOptions LyricsOptions::fromSettings(QSettings &settings)
{
	LyricsOptions o;
	settings.beginGroup(QStringLiteral("lyrics"));
	o.groupThreshold = readSeconds(settings, QStringLiteral("groupThreshold"), o.groupThreshold);
	o.lastWordDuration = readSeconds(settings, QStringLiteral("lastWordDuration"), o.lastWordDuration);
	o.bucketTolerance = readSeconds(settings, QStringLiteral("bucketTolerance"), o.bucketTolerance);
	o.maxWordDuration = readSeconds(settings, QStringLiteral("maxWordDuration"), o.maxWordDuration);
	o.minWordDuration = readSeconds(settings, QStringLiteral("minWordDuration"), o.minWordDuration);
	o.preciseTranslationTolerance = readSeconds(settings, QStringLiteral("preciseTranslationTolerance"), o.preciseTranslationTolerance);
	o.lineTranslationTolerance = readSeconds(settings, QStringLiteral("lineTranslationTolerance"), o.lineTranslationTolerance);
	o.lineHoldTime = readSeconds(settings, QStringLiteral("lineHoldTime"), o.lineHoldTime);
	o.insertInterludes = settings.value(QStringLiteral("insertInterludes"), o.insertInterludes).toBool();
	o.interludeThreshold = readSeconds(settings, QStringLiteral("interludeThreshold"), o.interludeThreshold);
	o.interludeMinDuration = readSeconds(settings, QStringLiteral("interludeMinDuration"), o.interludeMinDuration);
	settings.endGroup();
	return o;
}

}
