// 歌词解析入口：格式探测、分派解析器、合并外部翻译、时间轴后处理
#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "core_types.h"
#include "lyrics_options.h"

namespace Lyrics
{

// 任意一行是逐字行，或是带片段数组的对象行时，按逐字歌词处理
bool isWordSyncedFormat(const QString &content);

// 纯函数：输入原始文本，输出按时间排序的歌词行。内容为空白时返回空列表，
// 单行格式错误只会被跳过，不会导致整体失败。
QList<LyricLine> parseLyrics(const QString &content, const QString &translationContent = QString(),
							 const LyricsOptions &options = LyricsOptions());

// 解析歌词接口的响应体：{"lrc":{"lyric":..},"tlyric":{..},"yrc":{..},"ytlrc":{..}}。
// 优先使用逐字歌词 yrc（翻译取 ytlrc，缺失时取 tlyric），否则使用 lrc + tlyric。
// 响应体不是 JSON 对象时返回 Parser 错误；没有任何歌词轨时返回空列表。
Result<QList<LyricLine>> parseLyricResponse(const QByteArray &body, const LyricsOptions &options = LyricsOptions());

}
