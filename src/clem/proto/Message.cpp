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

#include "clem/proto/Message.hpp"


namespace clem
{
	namespace proto
	{
		namespace inbound
		{
			std::ostream& operator<<(std::ostream& os, const Message& message)
			{
				std::visit(Overloaded
				{
					[&](const inbound::AuthResult& m)
					{
						os << "AuthResult(accepted=" << (m.accepted ? "yes" : "no") << ", reason=" << m.reason << ")";
					},
					[&](const inbound::ServerInfo& m)
					{
						os << "ServerInfo(version=" << m.version << ", state=" << toString(m.status) << ")";
					},
					[&](const inbound::FullSnapshot& m)
					{
						os << "FullSnapshot(track=" << (m.track.has_value() ? "yes" : "no")
						   << ", playlists=" << (m.playlists.has_value() ? m.playlists.value().size() : 0) << ")";
					},
					[&](const inbound::TrackMetadata& m)
					{
						os << "TrackMetadata(track=" << m.track << ", position=" << m.position << ")";
					},
					[&](const inbound::PositionTick& m)
					{
						os << "PositionTick(position=" << m.position << ")";
					},
					[&](const inbound::VolumeChange& m)
					{
						os << "VolumeChange(volume=" << m.volume << ")";
					},
					[&](const inbound::TransportStatusChange& m)
					{
						os << "TransportStatus(state=" << toString(m.status) << ")";
					},
					[&](const inbound::PlaylistListing& m)
					{
						os << "PlaylistListing(";
						for (auto& playlist : m.playlists)
						{
							os << playlist;
						}
						os << ")";
					},
					[&](const inbound::ActivePlaylistChanged& m)
					{
						os << "ActivePlaylistChanged(id=" << m.playlistID << ")";
					},
					[&](const inbound::ShuffleChange& m)
					{
						os << "Shuffle(mode=" << toString(m.mode) << ")";
					},
					[&](const inbound::RepeatChange& m)
					{
						os << "Repeat(mode=" << toString(m.mode) << ")";
					},
					[&](const inbound::KeepAlive&)
					{
						os << "KeepAlive";
					},
					[&](const inbound::ServerDisconnect& m)
					{
						os << "ServerDisconnect(reason=" << m.reason << ")";
					},
					[&](const inbound::Unhandled& m)
					{
						os << "Unhandled(type=" << m.type << ")";
					},
				}, message);

				return os;
			}
		}
	}
}
