// 歌词基础工具：时间标签、时间键、字词构造与合并、元数据行识别、显示文本
#pragma once

#include <QList>
#include <QString>

#include "core_types.h"

namespace Lyrics
{

// 解析 "mm:ss.xx" / "mm:ss.xxx" / "mm:ss" 形式的时间为秒；数字组非法时 ok 置为 false 并返回 0
double parseTimeTag(const QString &tag, bool *ok = nullptr);

// 将秒数量化为毫秒整数，作为精确 / 近似匹配的 map key
qint64 normalizeTimeKey(double time);

// 构造字词，不保证 end > start，由后续清洗阶段处理
LyricWord createWord(const QString &text, double start, double end);

// 文本是否只由标点、符号与空白组成（空串不算）
bool isPunctuationOnly(const QString &text);

// 把纯标点字词并入前一个字词，首个字词保持不变
QList<LyricWord> mergePunctuationWords(const QList<LyricWord> &words);

// 按顺序拼接字词文本
QString joinWordText(const QList<LyricWord> &words);

// 优先返回由字词重建的文本，重建为空时返回原始文本
QString entryDisplayText(const ParsedLineData &entry);

// 显示文本去除首尾空白后非空且不只是标点
bool hasMeaningfulContent(const ParsedLineData &entry);

// 作词 / 作曲等署名行识别，所有解析器共用这一份规则
bool isMetadataLine(const QString &text);

// 去除首尾空白后忽略大小写比较
bool sameTextIgnoringCase(const QString &a, const QString &b);

}
