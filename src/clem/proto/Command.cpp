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

#include <ostream>

#include "clem/proto/Command.hpp"
#include "clem/proto/Message.hpp"


namespace clem
{
	namespace proto
	{
		namespace outbound
		{
			std::ostream& operator<<(std::ostream& os, const Command& command)
			{
				std::visit(Overloaded
				{
					[&](const outbound::Connect& c)
					{
						// auth code is not logged
						os << "Connect(auth=" << (c.authCode.has_value() ? "yes" : "no") << ")";
					},
					[&](const outbound::Disconnect&)     {os << "Disconnect";},
					[&](const outbound::Play&)           {os << "Play";},
					[&](const outbound::Pause&)          {os << "Pause";},
					[&](const outbound::Stop&)           {os << "Stop";},
					[&](const outbound::PlayPause&)      {os << "PlayPause";},
					[&](const outbound::Next&)           {os << "Next";},
					[&](const outbound::Previous&)       {os << "Previous";},
					[&](const outbound::SetVolume& c)    {os << "SetVolume(" << c.volume << ")";},
					[&](const outbound::OpenPlaylist& c) {os << "OpenPlaylist(" << c.playlistID << ")";},
					[&](const outbound::ChangeSong& c)   {os << "ChangeSong(" << c.playlistID << ", " << c.songIndex << ")";},
				}, command);

				return os;
			}
		}
	}
}
