// lyricdump 入口：读取歌词文件（及可选翻译文件），解析后输出为文本或 JSON
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QSettings>
#include <QStringList>
#include <QTextStream>

#include "json_utils.h"
#include "logger.h"
#include "lyrics_options.h"
#include "lyrics_parser.h"

namespace
{

// 以 UTF-8 读取整个文件
Lyrics::Result<QByteArray> readFile(const QString &path)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly))
	{
		Lyrics::Error e;
		e.category = Lyrics::ErrorCategory::Io;
		e.code = static_cast<int>(file.error());
		e.message = QStringLiteral("Cannot read ") + path;
		e.detail = file.errorString();
		return Lyrics::Result<QByteArray>::failure(e);
	}
	return Lyrics::Result<QByteArray>::success(file.readAll());
}

QString formatTime(double seconds)
{
	const qint64 ms = static_cast<qint64>(seconds * 1000.0 + 0.5);
	return QStringLiteral("%1:%2.%3")
		.arg(ms / 60000, 2, 10, QLatin1Char('0'))
		.arg((ms / 1000) % 60, 2, 10, QLatin1Char('0'))
		.arg(ms % 1000, 3, 10, QLatin1Char('0'));
}

void printText(const QList<Lyrics::LyricLine> &lines)
{
	QTextStream out(stdout);
	for (const Lyrics::LyricLine &line : lines)
	{
		out << '[' << formatTime(line.time) << "] " << (line.isInterlude ? QStringLiteral("...") : line.text) << '\n';
		if (!line.translation.isEmpty())
		{
			for (const QString &t : line.translation.split(QLatin1Char('\n')))
				out << "            " << t << '\n';
		}
	}
}

void printUsage()
{
	QTextStream(stderr) << "usage: lyricdump [--debug] [--json] [--response] <lyrics-file> [translation-file]\n";
}

}

int main(int argc, char *argv[])
{
	QCoreApplication::setOrganizationName("lyrics-core");
	QCoreApplication::setApplicationName("lyricdump");
	QCoreApplication app(argc, argv);

	Lyrics::Logger::Level logLevel = Lyrics::Logger::Level::Warning;
	bool json = false;
	bool response = false;
	QStringList files;
	for (int i = 1; i < argc; ++i)
	{
		const QString arg = QString::fromLocal8Bit(argv[i]);
		if (arg == "--debug")
			logLevel = Lyrics::Logger::Level::Debug;
		else if (arg == "--json")
			json = true;
		else if (arg == "--response")
			response = true;
		else
			files.append(arg);
	}
	Lyrics::Logger::init(logLevel);

	if (files.isEmpty() || files.size() > 2 || (response && files.size() > 1))
	{
		printUsage();
		return 2;
	}

	QSettings settings;
	const Lyrics::LyricsOptions options = Lyrics::LyricsOptions::fromSettings(settings);

	Lyrics::Result<QByteArray> content = readFile(files.at(0));
	if (!content.ok)
	{
		Lyrics::Logger::error(content.error.message + QStringLiteral(": ") + content.error.detail);
		return 1;
	}

	QList<Lyrics::LyricLine> lines;
	if (response)
	{
		Lyrics::Result<QList<Lyrics::LyricLine>> parsed = Lyrics::parseLyricResponse(content.value, options);
		if (!parsed.ok)
		{
			Lyrics::Logger::error(parsed.error.message + QStringLiteral(": ") + parsed.error.detail);
			return 1;
		}
		lines = parsed.value;
	}
	else
	{
		QString translation;
		if (files.size() > 1)
		{
			Lyrics::Result<QByteArray> t = readFile(files.at(1));
			if (!t.ok)
			{
				Lyrics::Logger::error(t.error.message + QStringLiteral(": ") + t.error.detail);
				return 1;
			}
			translation = QString::fromUtf8(t.value);
		}
		lines = Lyrics::parseLyrics(QString::fromUtf8(content.value), translation, options);
	}

	if (json)
		QTextStream(stdout) << QJsonDocument(Lyrics::Json::writeLines(lines)).toJson(QJsonDocument::Indented);
	else
		printText(lines);
	return 0;
}
