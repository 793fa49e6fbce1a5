// 外部翻译轨合并：按时间把独立提供的翻译文本挂到已解析的歌词行上
#pragma once

#include <QList>
#include <QMap>
#include <QQueue>
#include <QString>

#include "core_types.h"
#include "lyrics_options.h"

namespace Lyrics
{

// 时间键 -> 翻译文本队列。同一时间键上的多条翻译按出现顺序先进先出，
// 取出后即移除，队列为空时删除该键，同一条翻译不会被两行使用。
class TranslationMap
{
public:
	void insert(qint64 key, const QString &text);

	// 精确匹配时间键，成功时弹出队首到 out
	bool takeExact(qint64 key, QString &out);
	// 在差值不超过 toleranceMs 的键中取最近者，差值相同时取较小的键
	bool takeNearest(qint64 key, qint64 toleranceMs, QString &out);

	bool isEmpty() const;
	// 剩余翻译条数
	int size() const;

private:
	bool popFront(QMap<qint64, QQueue<QString>>::iterator it, QString &out);

	QMap<qint64, QQueue<QString>> buckets;
};

// 按 对象行 -> 逐字行 -> 时间标签行 的优先级解析翻译轨，跳过署名行与空行
TranslationMap buildTranslationMap(const QString &translationContent);

// 为每行消费一条翻译：先精确匹配，再在容差内取最近；逐字行容差较宽。
// 取到的翻译非空且与原文不同时覆盖原翻译，否则保留；间奏占位行不参与匹配。
QList<LyricLine> mergeTranslations(const QList<LyricLine> &lines, const QString &translationContent,
								   const LyricsOptions &options = LyricsOptions());

}
