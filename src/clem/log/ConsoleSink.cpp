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

#include <iostream>
#include <string>

#include "clem/log/ConsoleSink.hpp"


namespace clem
{
	namespace log
	{
		void ConsoleSink::print(g3::LogMessageMover logEntry)
		{
			auto logMessage = logEntry.get();

			if (!isFiltered(logMessage))
			{
				// log output goes to stderr so it does not mix with the CLI output
				std::cerr << logMessage.timestamp("%Y/%m/%d %H:%M:%S.%f3") << " "
						  << logMessage.level()
						  << " ["  << logMessage.threadID() << "]"
						  << " ("  << logMessage.file() << ":" << logMessage.line() << ")"
						  << " - " << rightTrim(logMessage.message())
						  << std::endl << std::flush;
			}
		}
	}
}
