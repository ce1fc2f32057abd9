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

#include <g3log/logmessage.hpp>

#include "clem/log/SinkFilter.hpp"


namespace clem
{
	namespace log
	{
		class ConsoleSink : public SinkFilter
		{
			public:
				explicit ConsoleSink(FilterType filter = nullptr)
				: SinkFilter{std::move(filter)} {}

			   ~ConsoleSink() = default;
				ConsoleSink(const ConsoleSink&) = delete;             // non-copyable
				ConsoleSink& operator=(const ConsoleSink&) = delete;  // non-assignable

				void print(g3::LogMessageMover logEntry);
		};
	}
}
