// 标准 / 增强 LRC 歌词解析
#pragma once

#include <QList>
#include <QString>

#include "core_types.h"
#include "lyrics_options.h"

namespace Lyrics
{

// 解析 [mm:ss.xx]text 与 [mm:ss.xx]<mm:ss.xx>word<mm:ss.xx>word 形式的歌词。
// 时间差小于 groupThreshold 的行合并为一行，其余成员作为翻译；
// 署名行被选为主行时整组丢弃。结果已计算时长并按配置插入间奏。
QList<LyricLine> parseLrc(const QString &content, const LyricsOptions &options = LyricsOptions());

}
