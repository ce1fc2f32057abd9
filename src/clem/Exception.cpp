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

#include "clem/Exception.hpp"


namespace clem
{
	std::ostream& operator<< (std::ostream& os, const Exception& exception)
	{
		return os << "Error: " << exception.what();
	}
}
