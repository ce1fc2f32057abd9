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
#include <string>
#include <type_safe/optional.hpp>
#include <variant>
#include <vector>

#include "clem/PlayerState.hpp"


namespace clem
{
	namespace proto
	{
		namespace ts = type_safe;

		// protocol version stamped into every outgoing message
		constexpr int ProtocolVersion{21};

		namespace inbound
		{
			struct AuthResult
			{
				bool        accepted;
				std::string reason;
			};

			struct ServerInfo
			{
				std::string     version;
				TransportStatus status;
			};

			// marks the end of the initial data burst; fields are set only if the player sent them along
			struct FullSnapshot
			{
				ts::optional<Track>                 track{ts::nullopt};
				ts::optional<std::vector<Playlist>> playlists{ts::nullopt};
				ts::optional<TransportStatus>       status{ts::nullopt};
				ts::optional<int>                   volume{ts::nullopt};
			};

			struct TrackMetadata
			{
				Track track;
				int   position{0};
			};

			struct PositionTick
			{
				int position;
			};

			// raw value as received; clamping is up to the receiver
			struct VolumeChange
			{
				int volume;
			};

			struct TransportStatusChange
			{
				TransportStatus status;
			};

			struct PlaylistListing
			{
				std::vector<Playlist> playlists;
			};

			struct ActivePlaylistChanged
			{
				int playlistID;
			};

			struct ShuffleChange
			{
				ShuffleMode mode;
			};

			struct RepeatChange
			{
				RepeatMode mode;
			};

			struct KeepAlive {};

			struct ServerDisconnect
			{
				std::string reason;
			};

			struct Unhandled
			{
				int type;
			};
		}

		using Message = std::variant<
			inbound::AuthResult,
			inbound::ServerInfo,
			inbound::FullSnapshot,
			inbound::TrackMetadata,
			inbound::PositionTick,
			inbound::VolumeChange,
			inbound::TransportStatusChange,
			inbound::PlaylistListing,
			inbound::ActivePlaylistChanged,
			inbound::ShuffleChange,
			inbound::RepeatChange,
			inbound::KeepAlive,
			inbound::ServerDisconnect,
			inbound::Unhandled
		>;

		// used by variant visitors to combine lambdas
		template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
		template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

		// declared in the namespace of the alternatives so it is found by argument dependent lookup
		namespace inbound
		{
			std::ostream& operator<<(std::ostream& os, const Message& message);
		}
	}
}
