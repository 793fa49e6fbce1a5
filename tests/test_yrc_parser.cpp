#include <QtTest>

#include "lyric_text.h"
#include "yrc_parser.h"

using namespace Lyrics;

namespace
{

ParsedLineData syncedEntry(double time, const QList<LyricWord> &words, int index)
{
	ParsedLineData e;
	e.time = time;
	e.words = words;
	e.tagCount = words.size() + WordSyncedPriority;
	e.originalIndex = index;
	return e;
}

}

class TestYrcParser : public QObject
{
	Q_OBJECT

private slots:
	void wordSyncedLine()
	{
		const QList<LyricLine> lines = parseWordSyncedLyrics(QStringLiteral("[12340,2500](12340,500,0)Hello(12840,600,0)World"));
		QCOMPARE(lines.size(), 1);
		const LyricLine &line = lines.at(0);
		QCOMPARE(line.time, 12.34);
		QVERIFY(line.isPreciseTiming);
		QCOMPARE(line.text, QStringLiteral("HelloWorld"));
		QCOMPARE(line.words.size(), 2);
		QCOMPARE(line.words.at(0).startTime, 12.34);
		QCOMPARE(line.words.at(0).endTime, 12.84);
		QCOMPARE(line.words.at(0).text, QStringLiteral("Hello"));
		QCOMPARE(line.words.at(1).startTime, 12.84);
		QCOMPARE(line.words.at(1).endTime, 13.44);
		QCOMPARE(line.words.at(1).text, QStringLiteral("World"));
	}

	void metadataObjectsAreDropped()
	{
		const QString content = QStringLiteral(
			"{\"t\":0,\"c\":[{\"tx\":\"作词: \"},{\"tx\":\"某人\"}]}\n"
			"{\"t\":1000,\"c\":[{\"tx\":\"作曲: \"},{\"tx\":\"某人\"}]}\n"
			"[5000,1000](5000,500,0)Sing(5500,500,0)along");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 1);
		QCOMPARE(lines.at(0).text, QStringLiteral("Singalong"));
	}

	void fallbackLineAttachesToNearestBucket()
	{
		const QString content = QStringLiteral(
			"[10000,2000](10000,1000,0)First(11000,1000,0)line\n"
			"[20000,2000](20000,1000,0)Second(21000,1000,0)line\n"
			"[00:11.50]第一行\n"
			"[00:19.00]第二行");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).translation, QStringLiteral("第一行"));
		QCOMPARE(lines.at(1).translation, QStringLiteral("第二行"));
		QVERIFY(lines.at(0).isPreciseTiming);
	}

	void distantFallbackBecomesOrphan()
	{
		LyricsOptions options;
		options.insertInterludes = false;
		const QString content = QStringLiteral(
			"[10000,2000](10000,1000,0)Main(11000,1000,0)line\n"
			"[00:30.00]Far away line");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content, options);
		QCOMPARE(lines.size(), 2);
		QVERIFY(lines.at(0).translation.isEmpty());
		QCOMPARE(lines.at(1).text, QStringLiteral("Far away line"));
		QCOMPARE(lines.at(1).time, 30.0);
		QVERIFY(!lines.at(1).isPreciseTiming);
	}

	void duplicateTranslationIsDropped()
	{
		const QString content = QStringLiteral(
			"[10000,1000](10000,500,0)Hello(10500,500,0) there\n"
			"[00:10.00]hello THERE\n"
			"[00:10.10]你好");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 1);
		QCOMPARE(lines.at(0).text, QStringLiteral("Hello there"));
		QCOMPARE(lines.at(0).translation, QStringLiteral("你好"));
	}

	void noWordSyncedLinesFallsBackToPlainLines()
	{
		const QString content = QStringLiteral(
			"{\"t\":0,\"c\":[{\"tx\":\"作词: 某人\"}]}\n"
			"[00:01.00]One\n"
			"[00:02.00]...\n"
			"[00:03.00]Two");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).text, QStringLiteral("One"));
		QCOMPARE(lines.at(1).text, QStringLiteral("Two"));
		QVERIFY(!lines.at(0).isPreciseTiming);
	}

	void runawayWordIsClampedToNextWord()
	{
		QList<ParsedLineData> entries{
			syncedEntry(1.0, {createWord(QStringLiteral("long"), 1.0, 9.0), createWord(QStringLiteral("next"), 4.0, 4.5)}, 0),
		};
		sanitizeWordDurations(entries, LyricsOptions());
		const LyricWord &word = entries.at(0).words.at(0);
		QVERIFY(word.endTime <= 4.0);
		QVERIFY(word.endTime <= word.startTime + 2.0);
		QCOMPARE(word.endTime, 3.0);
	}

	void lastWordIsClampedToNextLine()
	{
		QList<ParsedLineData> entries{
			syncedEntry(1.0, {createWord(QStringLiteral("a"), 1.0, 2.9)}, 0),
			syncedEntry(2.5, {createWord(QStringLiteral("b"), 2.5, 10.0)}, 1),
		};
		sanitizeWordDurations(entries, LyricsOptions());
		QCOMPARE(entries.at(0).words.at(0).endTime, 2.5);
		// 最后一行的最后一个字：上限为 start + 2s
		QCOMPARE(entries.at(1).words.at(0).endTime, 4.5);
	}

	void nonPositiveDurationIsRepaired()
	{
		QList<ParsedLineData> entries{
			syncedEntry(1.0, {createWord(QStringLiteral("a"), 1.0, 1.0), createWord(QStringLiteral("b"), 1.0, 1.2)}, 0),
		};
		sanitizeWordDurations(entries, LyricsOptions());
		QCOMPARE(entries.at(0).words.at(0).endTime, 1.1);
		QVERIFY(entries.at(0).words.at(1).endTime > entries.at(0).words.at(1).startTime);
	}

	void lastWordStopsAtNextLineSharingTranslationTime()
	{
		const QString content = QStringLiteral(
			"[10000,2000](10000,500,0)A(11500,1500,0)B\n"
			"[00:12.00]翻译\n"
			"[12000,1000](12000,500,0)C");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).words.size(), 2);
		QCOMPARE(lines.at(0).words.at(1).endTime, 12.0);
		QCOMPARE(lines.at(1).time, 12.0);
		QCOMPARE(lines.at(1).translation, QStringLiteral("翻译"));
		QVERIFY(lines.at(0).translation.isEmpty());
	}

	void nextLineSkipsEntriesAtTheSameTime()
	{
		QList<ParsedLineData> entries{
			syncedEntry(1.0, {createWord(QStringLiteral("a"), 1.0, 3.5)}, 0),
			syncedEntry(3.0, {createWord(QStringLiteral("b"), 3.0, 3.5)}, 1),
			syncedEntry(3.0, {createWord(QStringLiteral("c"), 3.0, 3.5)}, 2),
			syncedEntry(4.0, {createWord(QStringLiteral("d"), 4.0, 4.5)}, 3),
		};
		sanitizeWordDurations(entries, LyricsOptions());
		QCOMPARE(entries.at(0).words.at(0).endTime, 3.0);
		// 同时刻的逐字行不是彼此的“下一行”
		QCOMPARE(entries.at(1).words.at(0).endTime, 3.5);
		QCOMPARE(entries.at(2).words.at(0).endTime, 3.5);
	}

	void bucketToleranceBoundaryInMilliseconds()
	{
		LyricsOptions options;
		options.insertInterludes = false;
		const QString content = QStringLiteral(
			"[10000,1000](10000,1000,0)Main\n"
			"[00:12.999]近\n"
			"[00:13.000]远");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content, options);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).translation, QStringLiteral("近"));
		QCOMPARE(lines.at(1).text, QStringLiteral("远"));
		QCOMPARE(lines.at(1).time, 13.0);
	}

	void translationLinesDoNotCutWords()
	{
		const QString content = QStringLiteral(
			"[10000,3000](10000,1000,0)Keep(11000,1500,0)going\n"
			"[00:10.20]继续\n"
			"[15000,1000](15000,1000,0)Next");
		const QList<LyricLine> lines = parseWordSyncedLyrics(content);
		QCOMPARE(lines.size(), 2);
		QCOMPARE(lines.at(0).words.at(1).endTime, 12.5);
		QCOMPARE(lines.at(0).translation, QStringLiteral("继续"));
	}
};

QTEST_APPLESS_MAIN(TestYrcParser)

#include "test_yrc_parser.moc"
