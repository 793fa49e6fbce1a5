// 歌词解析可调参数，支持从 QSettings 读取
#pragma once

class QSettings;

namespace Lyrics
{

// 所有时间单位均为秒
struct LyricsOptions
{
	// LRC：时间差小于该阈值的行归为同一组
	double groupThreshold = 0.1;
	// LRC：行内最后一个字标签的估计时长
	double lastWordDuration = 1.0;
	// 逐字歌词：翻译 / 回退行并入最近逐字行的最大时间差
	double bucketTolerance = 3.0;
	// 单个字词的最大时长与最小时长
	double maxWordDuration = 2.0;
	double minWordDuration = 0.1;
	// 外部翻译匹配容差：逐字行 / 普通行
	double preciseTranslationTolerance = 3.0;
	double lineTranslationTolerance = 0.25;
	// 无法由下一行推算时的行显示时长
	double lineHoldTime = 5.0;
	// 间奏占位行
	bool insertInterludes = true;
	double interludeThreshold = 10.0;
	double interludeMinDuration = 4.0;

	// 从 settings 的 "lyrics" 分组读取，缺失或非正数的值使用默认值
	static LyricsOptions fromSettings(QSettings &settings);
};

}
