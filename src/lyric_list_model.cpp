#include "lyric_list_model.h"

#include <algorithm>
#include <QVariantList>
#include <QVariantMap>

namespace Lyrics
{

namespace
{

QVariantList wordsToVariant(const QList<LyricWord> &words)
{
	QVariantList list;
	list.reserve(words.size());
	for (const LyricWord &w : words)
	{
		QVariantMap m;
		m.insert(QStringLiteral("startTime"), w.startTime);
		m.insert(QStringLiteral("endTime"), w.endTime);
		m.insert(QStringLiteral("text"), w.text);
		list.append(m);
	}
	return list;
}

}

LyricListModel::LyricListModel(QObject *parent)
	: QAbstractListModel(parent)
{
}

int LyricListModel::rowCount(const QModelIndex &parent) const
{
	if (parent.isValid())
		return 0;
	return m_lines.size();
}

QVariant LyricListModel::data(const QModelIndex &index, int role) const
{
	if (!index.isValid() || index.row() < 0 || index.row() >= m_lines.size())
		return {};
	const LyricLine &line = m_lines.at(index.row());
	switch (role)
	{
	case Qt::DisplayRole:
	case TextRole:
		return line.text;
	case TimeRole:
		return line.time;
	case TranslationRole:
		return line.translation;
	case WordsRole:
		return wordsToVariant(line.words);
	case PreciseTimingRole:
		return line.isPreciseTiming;
	case DurationRole:
		return line.duration;
	case InterludeRole:
		return line.isInterlude;
	default:
		return {};
	}
}

QHash<int, QByteArray> LyricListModel::roleNames() const
{
	QHash<int, QByteArray> roles;
	roles[TimeRole] = "time";
	roles[TextRole] = "text";
	roles[TranslationRole] = "translation";
	roles[WordsRole] = "words";
	roles[PreciseTimingRole] = "isPreciseTiming";
	roles[DurationRole] = "duration";
	roles[InterludeRole] = "isInterlude";
	return roles;
}

void LyricListModel::setLines(const QList<LyricLine> &lines)
{
	beginResetModel();
	m_lines = lines;
	endResetModel();
}

const QList<LyricLine> &LyricListModel::lines() const
{
	return m_lines;
}

int LyricListModel::indexForPosition(double position) const
{
	// 行已按时间升序排列，找到第一个 time > position 的行，其前一行即为当前行
	auto it = std::upper_bound(m_lines.cbegin(), m_lines.cend(), position, [](double pos, const LyricLine &line) {
		return pos < line.time;
	});
	return static_cast<int>(std::distance(m_lines.cbegin(), it)) - 1;
}

}
