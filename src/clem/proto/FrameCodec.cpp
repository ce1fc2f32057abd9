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

#include <string>

#include "clem/Exception.hpp"
#include "clem/log/log.hpp"
#include "clem/proto/FrameCodec.hpp"
#include "RemoteControlMessages.pb.h"


namespace clem
{
	namespace proto
	{
		namespace
		{
			TransportStatus toTransportStatus(pb::EngineState state)
			{
				switch (state)
				{
					case pb::Empty:
					case pb::Idle:    return TransportStatus::Stopped;
					case pb::Playing: return TransportStatus::Playing;
					case pb::Paused:  return TransportStatus::Paused;
					default:          return TransportStatus::Unknown;
				}
			}


			ShuffleMode toShuffleMode(pb::ShuffleMode mode)
			{
				switch (mode)
				{
					case pb::Shuffle_All:         return ShuffleMode::All;
					case pb::Shuffle_InsideAlbum: return ShuffleMode::InsideAlbum;
					case pb::Shuffle_Albums:      return ShuffleMode::Albums;
					default:                      return ShuffleMode::Off;
				}
			}


			RepeatMode toRepeatMode(pb::RepeatMode mode)
			{
				switch (mode)
				{
					case pb::Repeat_Track:    return RepeatMode::Track;
					case pb::Repeat_Album:    return RepeatMode::Album;
					case pb::Repeat_Playlist: return RepeatMode::Playlist;
					default:                  return RepeatMode::Off;
				}
			}


			std::string toString(pb::ReasonDisconnect reason)
			{
				switch (reason)
				{
					case pb::Server_Shutdown:    return "Server_Shutdown";
					case pb::Wrong_Auth_Code:    return "Wrong_Auth_Code";
					case pb::Not_Authenticated:  return "Not_Authenticated";
					case pb::Download_Forbidden: return "Download_Forbidden";
					default:                     return "Unknown";
				}
			}


			Track toTrack(const pb::SongMetadata& metadata)
			{
				auto track{Track{}};

				track.id           = metadata.id();
				track.index        = metadata.index();
				track.title        = metadata.title();
				track.artist       = metadata.artist();
				track.albumArtist  = metadata.albumartist();
				track.album        = metadata.album();
				track.genre        = metadata.genre();
				track.year         = metadata.pretty_year();
				track.trackNumber  = metadata.track();
				track.disc         = metadata.disc();
				track.length       = metadata.length();
				track.prettyLength = metadata.pretty_length();
				track.filename     = metadata.filename();
				track.fileSize     = metadata.file_size();
				track.playCount    = metadata.playcount();
				track.rating       = metadata.rating();
				track.art          = metadata.art();
				track.isLocal      = metadata.is_local();
				track.type         = metadata.type();

				return track;
			}


			std::vector<Playlist> toPlaylists(const pb::ResponsePlaylists& response)
			{
				auto playlists{std::vector<Playlist>{}};

				for (auto& playlist : response.playlist())
				{
					playlists.push_back(Playlist{playlist.id(), playlist.name(), playlist.item_count(), playlist.active(), playlist.closed()});
				}

				return playlists;
			}


			template<typename PredicateType>
			void requirePayload(PredicateType hasPayload, const char* type)
			{
				if (!hasPayload())
				{
					throw MalformedFrameError{std::string{"Message of type "} + type + " does not carry its payload"};
				}
			}


			Message toMessage(const pb::Message& message)
			{
				switch (message.type())
				{
					case pb::INFO:
						requirePayload([&] {return message.has_response_clementine_info();}, "INFO");
						return inbound::ServerInfo{message.response_clementine_info().version(), toTransportStatus(message.response_clementine_info().state())};

					case pb::CURRENT_METAINFO:
						requirePayload([&] {return message.has_response_current_metadata() && message.response_current_metadata().has_song_metadata();}, "CURRENT_METAINFO");
						return inbound::TrackMetadata{toTrack(message.response_current_metadata().song_metadata()), message.response_current_metadata().position()};

					case pb::UPDATE_TRACK_POSITION:
						requirePayload([&] {return message.has_response_update_track_position();}, "UPDATE_TRACK_POSITION");
						return inbound::PositionTick{message.response_update_track_position().position()};

					case pb::SET_VOLUME:
						requirePayload([&] {return message.has_request_set_volume();}, "SET_VOLUME");
						return inbound::VolumeChange{message.request_set_volume().volume()};

					case pb::PLAY:
						return inbound::TransportStatusChange{TransportStatus::Playing};

					case pb::PAUSE:
						return inbound::TransportStatusChange{TransportStatus::Paused};

					case pb::STOP:
						return inbound::TransportStatusChange{TransportStatus::Stopped};

					case pb::ENGINE_STATE_CHANGED:
						requirePayload([&] {return message.has_response_engine_state_changed();}, "ENGINE_STATE_CHANGED");
						return inbound::TransportStatusChange{toTransportStatus(message.response_engine_state_changed().state())};

					case pb::PLAYLISTS:
						requirePayload([&] {return message.has_response_playlists();}, "PLAYLISTS");
						return inbound::PlaylistListing{toPlaylists(message.response_playlists())};

					case pb::ACTIVE_PLAYLIST_CHANGED:
						requirePayload([&] {return message.has_response_active_changed();}, "ACTIVE_PLAYLIST_CHANGED");
						return inbound::ActivePlaylistChanged{message.response_active_changed().id()};

					case pb::SHUFFLE:
						requirePayload([&] {return message.has_shuffle();}, "SHUFFLE");
						return inbound::ShuffleChange{toShuffleMode(message.shuffle().shuffle_mode())};

					case pb::REPEAT:
						requirePayload([&] {return message.has_repeat();}, "REPEAT");
						return inbound::RepeatChange{toRepeatMode(message.repeat().repeat_mode())};

					case pb::KEEP_ALIVE:
						return inbound::KeepAlive{};

					case pb::FIRST_DATA_SENT_COMPLETE:
					{
						auto snapshot{inbound::FullSnapshot{}};

						if (message.has_response_current_metadata() && message.response_current_metadata().has_song_metadata())
						{
							snapshot.track = toTrack(message.response_current_metadata().song_metadata());
						}
						if (message.has_response_playlists())
						{
							snapshot.playlists = toPlaylists(message.response_playlists());
						}
						if (message.has_response_clementine_info())
						{
							snapshot.status = toTransportStatus(message.response_clementine_info().state());
						}
						if (message.has_request_set_volume())
						{
							snapshot.volume = message.request_set_volume().volume();
						}

						return snapshot;
					}

					case pb::DISCONNECT:
					{
						auto reason{message.response_disconnect().reason_disconnect()};

						if (reason == pb::Wrong_Auth_Code)
						{
							return inbound::AuthResult{false, toString(reason)};
						}

						return inbound::ServerDisconnect{message.has_response_disconnect() ? toString(reason) : std::string{"Unknown"}};
					}

					default:
						LOG(DEBUG) << "Unhandled message received (type=" << message.type() << ")";

						return inbound::Unhandled{static_cast<int>(message.type())};
				}
			}


			void setVersionAndType(pb::Message& message, pb::MsgType type)
			{
				message.set_version(ProtocolVersion);
				message.set_type(type);
			}


			void requireNonNegative(int value, const char* name)
			{
				if (value < 0)
				{
					throw ValidationError{std::string{"Invalid "} + name + " value: " + std::to_string(value)};
				}
			}
		}


		FrameCodec::BufferType FrameCodec::encode(const Command& command)
		{
			auto message{pb::Message{}};

			std::visit(Overloaded
			{
				[&](const outbound::Connect& connect)
				{
					setVersionAndType(message, pb::CONNECT);

					auto* request{message.mutable_request_connect()};
					ts::with(connect.authCode, [&](auto& authCode)
					{
						request->set_auth_code(authCode);
					});
					request->set_send_playlist_songs(connect.sendPlaylistSongs);
					request->set_downloader(connect.downloader);
				},
				[&](const outbound::Disconnect&) {setVersionAndType(message, pb::DISCONNECT);},
				[&](const outbound::Play&)       {setVersionAndType(message, pb::PLAY);},
				[&](const outbound::Pause&)      {setVersionAndType(message, pb::PAUSE);},
				[&](const outbound::Stop&)       {setVersionAndType(message, pb::STOP);},
				[&](const outbound::PlayPause&)  {setVersionAndType(message, pb::PLAYPAUSE);},
				[&](const outbound::Next&)       {setVersionAndType(message, pb::NEXT);},
				[&](const outbound::Previous&)   {setVersionAndType(message, pb::PREVIOUS);},
				[&](const outbound::SetVolume& setVolume)
				{
					if (setVolume.volume < 0 || setVolume.volume > 100)
					{
						throw ValidationError{"Volume must be within 0-100 range, provided: " + std::to_string(setVolume.volume)};
					}

					setVersionAndType(message, pb::SET_VOLUME);
					message.mutable_request_set_volume()->set_volume(setVolume.volume);
				},
				[&](const outbound::OpenPlaylist& openPlaylist)
				{
					requireNonNegative(openPlaylist.playlistID, "playlist id");

					setVersionAndType(message, pb::OPEN_PLAYLIST);
					message.mutable_request_open_playlist()->set_playlist_id(openPlaylist.playlistID);
				},
				[&](const outbound::ChangeSong& changeSong)
				{
					requireNonNegative(changeSong.playlistID, "playlist id");
					requireNonNegative(changeSong.songIndex, "song index");

					setVersionAndType(message, pb::CHANGE_SONG);
					message.mutable_request_change_song()->set_playlist_id(changeSong.playlistID);
					message.mutable_request_change_song()->set_song_index(changeSong.songIndex);
				},
			}, command);

			std::string payload;
			if (!message.SerializeToString(&payload))
			{
				throw Exception{"Could not serialize outgoing message"};
			}

			// preparing frame size in endianness-independent way
			auto size{static_cast<std::uint32_t>(payload.size())};
			auto frame{BufferType{}};
			frame.reserve(PrefixSize + payload.size());
			frame.push_back(static_cast<std::uint8_t>(255 & (size >> 24)));
			frame.push_back(static_cast<std::uint8_t>(255 & (size >> 16)));
			frame.push_back(static_cast<std::uint8_t>(255 & (size >> 8)));
			frame.push_back(static_cast<std::uint8_t>(255 & size));
			frame.insert(frame.end(), payload.begin(), payload.end());

			return frame;
		}


		ts::optional<Message> FrameCodec::extractMessage()
		{
			auto result{ts::optional<Message>{ts::nullopt}};

			if (buffer.size() < PrefixSize)
			{
				return result;
			}

			auto size{(static_cast<std::size_t>(buffer[0]) << 24)
					| (static_cast<std::size_t>(buffer[1]) << 16)
					| (static_cast<std::size_t>(buffer[2]) << 8)
					|  static_cast<std::size_t>(buffer[3])};

			// a corrupted length prefix must not make the buffer grow unbounded
			if (size > maxFrameSize)
			{
				throw MalformedFrameError{"Frame length " + std::to_string(size) + " exceeds maximum of " + std::to_string(maxFrameSize) + " bytes"};
			}

			if (buffer.size() < PrefixSize + size)
			{
				return result;
			}

			auto message{pb::Message{}};
			if (!message.ParseFromArray(buffer.data() + PrefixSize, static_cast<int>(size)))
			{
				throw MalformedFrameError{"Could not parse frame payload (size=" + std::to_string(size) + ")"};
			}

			// removing the frame before conversion so a bad payload does not leave it behind
			buffer.erase(buffer.begin(), buffer.begin() + PrefixSize + size);

			result = toMessage(message);

			return result;
		}
	}
}
