/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <algorithm>
#include <cctype>

#include "clem/log/SinkFilter.hpp"


namespace clem
{
	namespace log
	{
		std::string rightTrim(const std::string& s)
		{
			auto r = std::find_if_not(s.rbegin(), s.rend(), [](int c)
			{
				return std::isspace(c);
			}).base();

			return std::string(s.begin(), r);
		}


		bool SinkFilter::isFiltered(g3::LogMessage& logMessage) const
		{
			return (filter && filter(logMessage));
		}


		FilterType SinkFilter::belowLevel(const LEVELS& level)
		{
			auto threshold{level.value};

			return [threshold](g3::LogMessage& logMessage)
			{
				return logMessage._level.value < threshold;
			};
		}
	}
}
