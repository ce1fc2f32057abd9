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

#include <chrono>
#include <cstddef>  // std::size_t
#include <cstdint>  // std::int64_t
#include <iosfwd>
#include <string>
#include <type_safe/optional.hpp>
#include <vector>


namespace clem
{
	namespace ts = type_safe;

	enum class TransportStatus
	{
		Unknown,
		Stopped,
		Playing,
		Paused,
	};

	enum class ConnectionStatus
	{
		Disconnected,
		Connecting,
		Authenticating,
		Connected,
	};

	enum class ShuffleMode
	{
		Off,
		All,
		InsideAlbum,
		Albums,
	};

	enum class RepeatMode
	{
		Off,
		Track,
		Album,
		Playlist,
	};

	struct Track
	{
		int          id{0};
		int          index{0};
		std::string  title;
		std::string  artist;
		std::string  albumArtist;
		std::string  album;
		std::string  genre;
		std::string  year;
		int          trackNumber{0};
		int          disc{0};
		int          length{0};
		std::string  prettyLength;
		std::string  filename;
		std::int64_t fileSize{0};
		int          playCount{0};
		float        rating{0};
		// opaque image data; it is kept as received and never decoded
		std::string  art;
		bool         isLocal{false};
		std::string  type;
	};

	bool operator==(const Track& lhs, const Track& rhs);
	bool operator!=(const Track& lhs, const Track& rhs);

	struct Playlist
	{
		int         id{0};
		std::string name;
		int         itemCount{0};
		bool        active{false};
		bool        closed{false};
	};

	bool operator==(const Playlist& lhs, const Playlist& rhs);
	bool operator!=(const Playlist& lhs, const Playlist& rhs);

	struct PlayerState
	{
		ts::optional<Track>                                   currentTrack{ts::nullopt};
		TransportStatus                                       transportStatus{TransportStatus::Unknown};
		ts::optional<int>                                     volume{ts::nullopt};
		ts::optional<int>                                     trackPosition{ts::nullopt};
		std::vector<Playlist>                                 playlists;
		ts::optional<int>                                     activePlaylistID{ts::nullopt};
		ts::optional<ShuffleMode>                             shuffleMode{ts::nullopt};
		ts::optional<RepeatMode>                              repeatMode{ts::nullopt};
		ts::optional<std::string>                             version{ts::nullopt};
		bool                                                  firstSnapshotReceived{false};
		ConnectionStatus                                      connectionStatus{ConnectionStatus::Disconnected};
		std::size_t                                           unhandledMessages{0};
		ts::optional<std::chrono::system_clock::time_point>   lastUpdate{ts::nullopt};
	};

	const char* toString(TransportStatus status);
	const char* toString(ConnectionStatus status);
	const char* toString(ShuffleMode mode);
	const char* toString(RepeatMode mode);

	std::ostream& operator<<(std::ostream& os, const Track& track);
	std::ostream& operator<<(std::ostream& os, const Playlist& playlist);
	std::ostream& operator<<(std::ostream& os, const PlayerState& state);
}
