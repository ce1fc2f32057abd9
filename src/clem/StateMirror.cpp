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
#include <chrono>

#include "clem/log/log.hpp"
#include "clem/StateMirror.hpp"


namespace clem
{
	StateMirror::StateMirror()
	: state{std::make_shared<const PlayerState>()} {}


	void StateMirror::apply(const proto::Message& message)
	{
		update([&](PlayerState& s)
		{
			std::visit(proto::Overloaded
			{
				[&](const proto::inbound::FullSnapshot& m)
				{
					// the player may announce the end of initial data without repeating it
					ts::with(m.track, [&](auto& track)
					{
						s.currentTrack = track;
					});
					ts::with(m.playlists, [&](auto& playlists)
					{
						applyPlaylists(s, playlists);
					});
					ts::with(m.status, [&](auto& status)
					{
						s.transportStatus = status;
					});
					ts::with(m.volume, [&](auto& volume)
					{
						s.volume = std::clamp(volume, 0, 100);
					});
					s.firstSnapshotReceived = true;
				},
				[&](const proto::inbound::TrackMetadata& m)
				{
					s.currentTrack  = m.track;
					s.trackPosition = std::max(m.position, 0);
				},
				[&](const proto::inbound::PositionTick& m)
				{
					s.trackPosition = std::max(m.position, 0);
				},
				[&](const proto::inbound::VolumeChange& m)
				{
					if (m.volume < 0 || m.volume > 100)
					{
						LOG(WARNING) << "Volume value out of range was received, clamping (volume=" << m.volume << ")";
					}
					s.volume = std::clamp(m.volume, 0, 100);
				},
				[&](const proto::inbound::TransportStatusChange& m)
				{
					s.transportStatus = m.status;
				},
				[&](const proto::inbound::ServerInfo& m)
				{
					s.version         = m.version;
					s.transportStatus = m.status;
				},
				[&](const proto::inbound::PlaylistListing& m)
				{
					applyPlaylists(s, m.playlists);
				},
				[&](const proto::inbound::ActivePlaylistChanged& m)
				{
					s.activePlaylistID = m.playlistID;
				},
				[&](const proto::inbound::ShuffleChange& m)
				{
					s.shuffleMode = m.mode;
				},
				[&](const proto::inbound::RepeatChange& m)
				{
					s.repeatMode = m.mode;
				},
				[&](const proto::inbound::KeepAlive&) {},
				[&](const proto::inbound::AuthResult&) {},
				[&](const proto::inbound::ServerDisconnect&) {},
				[&](const proto::inbound::Unhandled&)
				{
					s.unhandledMessages++;
				},
			}, message);

			s.lastUpdate = std::chrono::system_clock::now();
		});
	}


	void StateMirror::applyPlaylists(PlayerState& s, const std::vector<Playlist>& playlists)
	{
		s.playlists = playlists;

		auto found{std::find_if(playlists.begin(), playlists.end(), [](auto& playlist)
		{
			return playlist.active;
		})};
		if (found != playlists.end())
		{
			s.activePlaylistID = (*found).id;
		}
	}


	void StateMirror::reset()
	{
		std::lock_guard<std::mutex> lock{mutex};

		state = std::make_shared<const PlayerState>();
	}


	void StateMirror::setConnectionStatus(ConnectionStatus status)
	{
		update([&](PlayerState& s)
		{
			s.connectionStatus = status;
		});
	}


	StateMirror::StatePtr StateMirror::snapshot() const
	{
		std::lock_guard<std::mutex> lock{mutex};

		return state;
	}
}
