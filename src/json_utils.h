// JSON 辅助函数：宽容的字段读取、统一错误处理，以及歌词行的 JSON 输出
#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "core_types.h"

namespace Lyrics
{
namespace Json
{

// 读取字符串字段，可容忍数字 / 布尔并转换为字符串
Result<QString> readString(const QJsonObject &obj, const QString &key, bool required = true);
// 读取 64 位整数，支持字符串数字转换
Result<qint64> readInt64(const QJsonObject &obj, const QString &key, bool required = true);
// 读取对象字段
Result<QJsonObject> readObject(const QJsonObject &obj, const QString &key, bool required = true);
// 读取数组字段
Result<QJsonArray> readArray(const QJsonObject &obj, const QString &key, bool required = true);

// 将歌词行序列转换为 JSON 数组；空翻译与空字词列表不输出对应字段
QJsonArray writeLines(const QList<LyricLine> &lines);

}
}
