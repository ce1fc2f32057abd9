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

#include <iosfwd>
#include <type_safe/optional.hpp>
#include <variant>


namespace clem
{
	namespace proto
	{
		namespace ts = type_safe;

		namespace outbound
		{
			// handshake; asks the player to start sending its state
			struct Connect
			{
				ts::optional<int> authCode{ts::nullopt};
				bool              sendPlaylistSongs{false};
				bool              downloader{false};
			};

			struct Disconnect {};
			struct Play {};
			struct Pause {};
			struct Stop {};
			struct PlayPause {};
			struct Next {};
			struct Previous {};

			// 0-100
			struct SetVolume
			{
				int volume;
			};

			struct OpenPlaylist
			{
				int playlistID;
			};

			struct ChangeSong
			{
				int playlistID;
				int songIndex;
			};
		}

		using Command = std::variant<
			outbound::Connect,
			outbound::Disconnect,
			outbound::Play,
			outbound::Pause,
			outbound::Stop,
			outbound::PlayPause,
			outbound::Next,
			outbound::Previous,
			outbound::SetVolume,
			outbound::OpenPlaylist,
			outbound::ChangeSong
		>;

		// declared in the namespace of the alternatives so it is found by argument dependent lookup
		namespace outbound
		{
			std::ostream& operator<<(std::ostream& os, const Command& command);
		}
	}
}
