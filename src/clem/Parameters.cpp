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

#include <limits>
#include <string>

#include "clem/Exception.hpp"
#include "clem/Parameters.hpp"


namespace clem
{
	void Parameters::validate() const
	{
		if (host.empty())
		{
			throw ValidationError{"Host name must not be empty"};
		}

		if (port == 0 || port > 65535)
		{
			throw ValidationError{"Port must be within 1-65535 range, provided: " + std::to_string(port)};
		}

		ts::with(authCode, [](auto& code)
		{
			if (code < 0)
			{
				throw ValidationError{"Auth code must not be negative, provided: " + std::to_string(code)};
			}
		});

		if (reconnectDelay.count() < 0)
		{
			throw ValidationError{"Reconnect delay must not be negative"};
		}

		if (connectTimeout.count() <= 0)
		{
			throw ValidationError{"Connect timeout must be positive"};
		}

		if (authTimeout.count() <= 0)
		{
			throw ValidationError{"Auth timeout must be positive"};
		}

		if (maxFrameSize < proto::FrameCodec::PrefixSize)
		{
			throw ValidationError{"Maximum frame size is too small: " + std::to_string(maxFrameSize)};
		}

		// protobuf parses payloads with int sized lengths
		if (maxFrameSize > static_cast<std::size_t>(std::numeric_limits<int>::max()))
		{
			throw ValidationError{"Maximum frame size is too big: " + std::to_string(maxFrameSize)};
		}
	}
}
