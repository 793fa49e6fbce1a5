// JsonUtils 实现：统一 JSON 字段读取与错误构造
#include "json_utils.h"

namespace
{

// 构造“缺少字段”错误结果
template <typename T>
Lyrics::Result<T> missingField(const QString &key)
{
	Lyrics::Error e;
	e.category = Lyrics::ErrorCategory::Parser;
	e.code = 1;
	e.message = QStringLiteral("Missing field: ") + key;
	return Lyrics::Result<T>::failure(e);
}

// 构造“类型不匹配”错误结果
template <typename T>
Lyrics::Result<T> typeError(const QString &key, const QString &expected)
{
	Lyrics::Error e;
	e.category = Lyrics::ErrorCategory::Parser;
	e.code = 2;
	e.message = QStringLiteral("Invalid type for field: ") + key + QStringLiteral(", expected ") + expected;
	return Lyrics::Result<T>::failure(e);
}

QJsonObject writeWord(const Lyrics::LyricWord &word)
{
	QJsonObject o;
	o.insert(QStringLiteral("startTime"), word.startTime);
	o.insert(QStringLiteral("endTime"), word.endTime);
	o.insert(QStringLiteral("text"), word.text);
	return o;
}

}

namespace Lyrics
{
namespace Json
{

// 宽容读取字符串字段：接受 string/number/bool，并统一输出 QString
Result<QString> readString(const QJsonObject &obj, const QString &key, bool required)
{
	if (!obj.contains(key) || obj.value(key).isNull())
	{
		if (required)
			return missingField<QString>(key);
		return Result<QString>::success(QString());
	}
	QJsonValue v = obj.value(key);
	if (v.isString())
		return Result<QString>::success(v.toString());
	if (v.isDouble())
		return Result<QString>::success(QString::number(v.toDouble()));
	if (v.isBool())
		return Result<QString>::success(v.toBool() ? QStringLiteral("true") : QStringLiteral("false"));
	return typeError<QString>(key, QStringLiteral("string"));
}

// 宽容读取 64 位整数：接受 number 或字符串数字
Result<qint64> readInt64(const QJsonObject &obj, const QString &key, bool required)
{
	if (!obj.contains(key) || obj.value(key).isNull())
	{
		if (required)
			return missingField<qint64>(key);
		return Result<qint64>::success(0);
	}
	QJsonValue v = obj.value(key);
	if (v.isDouble())
		return Result<qint64>::success(static_cast<qint64>(v.toDouble()));
	if (v.isString())
	{
		bool ok = false;
		qint64 value = v.toString().trimmed().toLongLong(&ok);
		if (ok)
			return Result<qint64>::success(value);
	}
	return typeError<qint64>(key, QStringLiteral("integer"));
}

Result<QJsonObject> readObject(const QJsonObject &obj, const QString &key, bool required)
{
	if (!obj.contains(key) || obj.value(key).isNull())
	{
		if (required)
			return missingField<QJsonObject>(key);
		return Result<QJsonObject>::success(QJsonObject());
	}
	QJsonValue v = obj.value(key);
	if (v.isObject())
		return Result<QJsonObject>::success(v.toObject());
	return typeError<QJsonObject>(key, QStringLiteral("object"));
}

Result<QJsonArray> readArray(const QJsonObject &obj, const QString &key, bool required)
{
	if (!obj.contains(key) || obj.value(key).isNull())
	{
		if (required)
			return missingField<QJsonArray>(key);
		return Result<QJsonArray>::success(QJsonArray());
	}
	QJsonValue v = obj.value(key);
	if (v.isArray())
		return Result<QJsonArray>::success(v.toArray());
	return typeError<QJsonArray>(key, QStringLiteral("array"));
}

QJsonArray writeLines(const QList<LyricLine> &lines)
{
	QJsonArray arr;
	for (const LyricLine &line : lines)
	{
		QJsonObject o;
		o.insert(QStringLiteral("time"), line.time);
		o.insert(QStringLiteral("text"), line.text);
		if (!line.words.isEmpty())
		{
			QJsonArray words;
			for (const LyricWord &w : line.words)
				words.append(writeWord(w));
			o.insert(QStringLiteral("words"), words);
		}
		if (!line.translation.isEmpty())
			o.insert(QStringLiteral("translation"), line.translation);
		o.insert(QStringLiteral("isPreciseTiming"), line.isPreciseTiming);
		o.insert(QStringLiteral("duration"), line.duration);
		if (line.isInterlude)
			o.insert(QStringLiteral("isInterlude"), true);
		arr.append(o);
	}
	return arr;
}

}
}
