// 逐字歌词（YRC）解析：逐字行为主行，同一文件中的对象行与 LRC 行作为翻译或独立行
#pragma once

#include <QList>
#include <QString>

#include "core_types.h"
#include "lyrics_options.h"

namespace Lyrics
{

// 解析逐字歌词文件。每个逐字行是一个分组，其余非署名行并入时间最近且差值小于
// bucketTolerance 的分组作为翻译，找不到分组的行单独输出。
// 文件中没有逐字行时，只输出有内容的非署名行。
QList<LyricLine> parseWordSyncedLyrics(const QString &content, const LyricsOptions &options = LyricsOptions());

// 修正异常的字词时长：单字不超过 maxWordDuration，且不越过下一个字或下一个逐字行的开始。
// entries 须已按时间排序。
void sanitizeWordDurations(QList<ParsedLineData> &entries, const LyricsOptions &options);

}
