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

#pragma once

#include <functional>
#include <g3log/logmessage.hpp>
#include <string>


namespace clem
{
	namespace log
	{
		std::string rightTrim(const std::string&);

		// returns true if a log entry should be skipped
		using FilterType = std::function<bool(g3::LogMessage&)>;

		class SinkFilter
		{
			public:
				explicit SinkFilter(FilterType f = nullptr)
				: filter{std::move(f)} {}

				// using Rule Of Zero
			   ~SinkFilter() = default;
				SinkFilter(const SinkFilter&) = default;
				SinkFilter& operator=(const SinkFilter&) = default;
				SinkFilter(SinkFilter&& rhs) = default;
				SinkFilter& operator=(SinkFilter&& rhs) = default;

				bool isFiltered(g3::LogMessage& logMessage) const;

				// skips entries below provided level; used to hide DEBUG output unless verbose mode is on
				static FilterType belowLevel(const LEVELS& level);

			private:
				FilterType filter;
		};
	}
}
