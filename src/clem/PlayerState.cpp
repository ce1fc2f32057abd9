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

#include "clem/PlayerState.hpp"


namespace clem
{
	bool operator==(const Track& lhs, const Track& rhs)
	{
		return lhs.id           == rhs.id
			&& lhs.index        == rhs.index
			&& lhs.title        == rhs.title
			&& lhs.artist       == rhs.artist
			&& lhs.albumArtist  == rhs.albumArtist
			&& lhs.album        == rhs.album
			&& lhs.genre        == rhs.genre
			&& lhs.year         == rhs.year
			&& lhs.trackNumber  == rhs.trackNumber
			&& lhs.disc         == rhs.disc
			&& lhs.length       == rhs.length
			&& lhs.prettyLength == rhs.prettyLength
			&& lhs.filename     == rhs.filename
			&& lhs.fileSize     == rhs.fileSize
			&& lhs.playCount    == rhs.playCount
			&& lhs.rating       == rhs.rating
			&& lhs.art          == rhs.art
			&& lhs.isLocal      == rhs.isLocal
			&& lhs.type         == rhs.type;
	}


	bool operator!=(const Track& lhs, const Track& rhs)
	{
		return !(lhs == rhs);
	}


	bool operator==(const Playlist& lhs, const Playlist& rhs)
	{
		return lhs.id        == rhs.id
			&& lhs.name      == rhs.name
			&& lhs.itemCount == rhs.itemCount
			&& lhs.active    == rhs.active
			&& lhs.closed    == rhs.closed;
	}


	bool operator!=(const Playlist& lhs, const Playlist& rhs)
	{
		return !(lhs == rhs);
	}


	const char* toString(TransportStatus status)
	{
		switch (status)
		{
			case TransportStatus::Stopped: return "Stopped";
			case TransportStatus::Playing: return "Playing";
			case TransportStatus::Paused:  return "Paused";
			default:                       return "Unknown";
		}
	}


	const char* toString(ConnectionStatus status)
	{
		switch (status)
		{
			case ConnectionStatus::Connecting:     return "Connecting";
			case ConnectionStatus::Authenticating: return "Authenticating";
			case ConnectionStatus::Connected:      return "Connected";
			default:                               return "Disconnected";
		}
	}


	const char* toString(ShuffleMode mode)
	{
		switch (mode)
		{
			case ShuffleMode::All:         return "All";
			case ShuffleMode::InsideAlbum: return "InsideAlbum";
			case ShuffleMode::Albums:      return "Albums";
			default:                       return "Off";
		}
	}


	const char* toString(RepeatMode mode)
	{
		switch (mode)
		{
			case RepeatMode::Track:    return "Track";
			case RepeatMode::Album:    return "Album";
			case RepeatMode::Playlist: return "Playlist";
			default:                   return "Off";
		}
	}


	std::ostream& operator<<(std::ostream& os, const Track& track)
	{
		// art is skipped on purpose as it is binary data
		return os << "{title='"    << track.title
				  << "', artist='" << track.artist
				  << "', album='"  << track.album
				  << "', genre='"  << track.genre
				  << "', year='"   << track.year
				  << "', length="  << track.length << " (" << track.prettyLength << ")"
				  << ", playcount=" << track.playCount
				  << ", rating="   << track.rating
				  << ", id="       << track.id
				  << ", index="    << track.index
				  << ", local="    << (track.isLocal ? "yes" : "no")
				  << ", file='"    << track.filename << "'}";
	}


	std::ostream& operator<<(std::ostream& os, const Playlist& playlist)
	{
		return os << "{id="       << playlist.id
				  << ", name='"   << playlist.name
				  << "', items="  << playlist.itemCount
				  << ", active="  << (playlist.active ? "yes" : "no")
				  << ", closed="  << (playlist.closed ? "yes" : "no") << "}";
	}


	std::ostream& operator<<(std::ostream& os, const PlayerState& state)
	{
		os << "Clementine(version=" << state.version.value_or(std::string{"?"})
		   << ", connection="       << toString(state.connectionStatus)
		   << ", state="            << toString(state.transportStatus);

		ts::with(state.volume, [&](auto& volume)
		{
			os << ", volume=" << volume;
		});
		ts::with(state.shuffleMode, [&](auto& mode)
		{
			os << ", shuffle=" << toString(mode);
		});
		ts::with(state.repeatMode, [&](auto& mode)
		{
			os << ", repeat=" << toString(mode);
		});
		ts::with(state.trackPosition, [&](auto& position)
		{
			os << ", position=" << position;
		});

		os << ", current_track=";
		if (state.currentTrack.has_value())
		{
			os << state.currentTrack.value();
		}
		else
		{
			os << "none";
		}

		return os << ")";
	}
}
