// 歌词列表模型：把解析结果暴露给 QML / Widgets 视图
#pragma once

#include <QAbstractListModel>

#include "core_types.h"

namespace Lyrics
{

class LyricListModel : public QAbstractListModel
{
	Q_OBJECT

public:
	enum Roles
	{
		TimeRole = Qt::UserRole + 1,
		TextRole,
		TranslationRole,
		WordsRole,
		PreciseTimingRole,
		DurationRole,
		InterludeRole
	};

	explicit LyricListModel(QObject *parent = nullptr);

	int rowCount(const QModelIndex &parent = QModelIndex()) const override;
	QVariant data(const QModelIndex &index, int role) const override;
	QHash<int, QByteArray> roleNames() const override;

	void setLines(const QList<LyricLine> &lines);
	const QList<LyricLine> &lines() const;

	// 播放位置（秒）对应的行：最后一个 time <= position 的行，位于首行之前时返回 -1
	Q_INVOKABLE int indexForPosition(double position) const;

private:
	QList<LyricLine> m_lines;
};

}
