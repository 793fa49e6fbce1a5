#include <QSettings>
#include <QTemporaryDir>
#include <QtTest>

#include "logger.h"
#include "lyrics_options.h"
#include "lyrics_parser.h"

using namespace Lyrics;

class TestLyricsParser : public QObject
{
	Q_OBJECT

private slots:
	void initTestCase()
	{
		Logger::init(Logger::Level::Warning);
	}

	void blankInputIsEmpty()
	{
		QVERIFY(parseLyrics(QString()).isEmpty());
		QVERIFY(parseLyrics(QStringLiteral("   \n\t\n")).isEmpty());
	}

	void detectsFormat()
	{
		QVERIFY(isWordSyncedFormat(QStringLiteral("[00:01.00]a\n[1000,200](1000,200,0)b")));
		QVERIFY(isWordSyncedFormat(QStringLiteral("{\"t\":0,\"c\":[{\"tx\":\"x\"}]}")));
		QVERIFY(!isWordSyncedFormat(QStringLiteral("[00:01.00]a\n[00:02.00]b")));
	}

	void dispatchesLineTimed()
	{
		const QList<LyricLine> lines = parseLyrics(QStringLiteral("[00:12.34]Hello world"));
		QCOMPARE(lines.size(), 1);
		QCOMPARE(lines.at(0).time, 12.34);
		QCOMPARE(lines.at(0).text, QStringLiteral("Hello world"));
		QVERIFY(!lines.at(0).isPreciseTiming);
	}

	void dispatchesWordSynced()
	{
		const QList<LyricLine> lines = parseLyrics(QStringLiteral("[12340,2500](12340,500,0)Hello(12840,600,0)World"));
		QCOMPARE(lines.size(), 1);
		QVERIFY(lines.at(0).isPreciseTiming);
		QCOMPARE(lines.at(0).words.size(), 2);
	}

	void mergesExternalTranslation()
	{
		const QString lrc = QStringLiteral("[00:01.00]One\n[00:02.00]Two");
		const QString trans = QStringLiteral("[00:01.00]一\n[00:02.10]二");
		const QList<LyricLine> lines = parseLyrics(lrc, trans);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).translation, QStringLiteral("一"));
		QCOMPARE(lines.at(1).translation, QStringLiteral("二"));
	}

	void outputInvariantsHold()
	{
		const QString content = QStringLiteral(
			"[00:40.00]late\n"
			"[00:01.00]early\n"
			"[00:01.03]EARLY\n"
			"[00:15.00][00:02.00]shared\n"
			"[00:02.05]共享\n");
		const QList<LyricLine> lines = parseLyrics(content, QStringLiteral("[00:40.00]Late"));
		QVERIFY(!lines.isEmpty());
		for (int i = 1; i < lines.size(); ++i)
			QVERIFY(lines.at(i - 1).time <= lines.at(i).time);
		for (const LyricLine &line : lines)
		{
			if (!line.translation.isEmpty())
				QVERIFY(line.translation.trimmed().toLower() != line.text.trimmed().toLower());
		}
	}

	void responsePrefersWordSyncedTrack()
	{
		const QByteArray body = R"({
			"lrc": {"lyric": "[00:01.00]line lyric"},
			"tlyric": {"lyric": "[00:01.00]行翻译"},
			"yrc": {"lyric": "[1000,1000](1000,500,0)word(1500,500,0) lyric"},
			"ytlrc": {"lyric": "[00:01.00]逐字翻译"}
		})";
		Result<QList<LyricLine>> result = parseLyricResponse(body);
		QVERIFY(result.ok);
		QCOMPARE(result.value.size(), 1);
		QVERIFY(result.value.at(0).isPreciseTiming);
		QCOMPARE(result.value.at(0).text, QStringLiteral("word lyric"));
		QCOMPARE(result.value.at(0).translation, QStringLiteral("逐字翻译"));
	}

	void responseFallsBackToLineTrack()
	{
		const QByteArray body = R"({"lrc": {"lyric": "[00:01.00]line lyric"}, "tlyric": {"lyric": "[00:01.00]行翻译"}})";
		Result<QList<LyricLine>> result = parseLyricResponse(body);
		QVERIFY(result.ok);
		QCOMPARE(result.value.size(), 1);
		QVERIFY(!result.value.at(0).isPreciseTiming);
		QCOMPARE(result.value.at(0).translation, QStringLiteral("行翻译"));
	}

	void responseWithoutTracksIsEmpty()
	{
		Result<QList<LyricLine>> result = parseLyricResponse(R"({"pureMusic": true})");
		QVERIFY(result.ok);
		QVERIFY(result.value.isEmpty());
	}

	void malformedResponseFails()
	{
		Result<QList<LyricLine>> result = parseLyricResponse("not json");
		QVERIFY(!result.ok);
		QVERIFY(result.error.category == ErrorCategory::Parser);

		result = parseLyricResponse("[1, 2]");
		QVERIFY(!result.ok);
	}

	void mistypedTrackIsTreatedAsMissing()
	{
		QTest::ignoreMessage(QtWarningMsg, "Lyric response: Invalid type for field: yrc, expected object");
		const QByteArray body = R"({"yrc": "broken", "lrc": {"lyric": "[00:01.00]line lyric"}})";
		Result<QList<LyricLine>> result = parseLyricResponse(body);
		QVERIFY(result.ok);
		QCOMPARE(result.value.size(), 1);
		QVERIFY(!result.value.at(0).isPreciseTiming);
		QCOMPARE(result.value.at(0).text, QStringLiteral("line lyric"));
	}

	void optionsFromSettings()
	{
		QTemporaryDir dir;
		QVERIFY(dir.isValid());
		QSettings settings(dir.filePath(QStringLiteral("lyrics.ini")), QSettings::IniFormat);
		settings.beginGroup(QStringLiteral("lyrics"));
		settings.setValue(QStringLiteral("groupThreshold"), 0.2);
		settings.setValue(QStringLiteral("interludeThreshold"), -3);
		settings.setValue(QStringLiteral("insertInterludes"), false);
		settings.endGroup();

		const LyricsOptions options = LyricsOptions::fromSettings(settings);
		QCOMPARE(options.groupThreshold, 0.2);
		QCOMPARE(options.interludeThreshold, LyricsOptions().interludeThreshold);
		QCOMPARE(options.insertInterludes, false);
		QCOMPARE(options.maxWordDuration, 2.0);

		const QList<LyricLine> lines = parseLyrics(QStringLiteral("[00:01.00]a\n[00:01.15]b"), QString(), options);
		QCOMPARE(lines.size(), 1);
		QCOMPARE(lines.at(0).translation, QStringLiteral("b"));
	}
};

QTEST_GUILESS_MAIN(TestLyricsParser)

#include "test_lyrics_parser.moc"
