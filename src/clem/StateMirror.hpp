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

#include <memory>
#include <mutex>
#include <type_safe/optional.hpp>
#include <vector>

#include "clem/PlayerState.hpp"
#include "clem/proto/Message.hpp"


namespace clem
{
	namespace ts = type_safe;

	// Local copy of the player state.
	//
	// Every logical update builds a new immutable PlayerState and swaps it in, so a snapshot
	// obtained by a reader is never modified afterwards and never contains a half-applied message.
	class StateMirror
	{
		public:
			using StatePtr = std::shared_ptr<const PlayerState>;

			StateMirror();

			// using Rule Of Zero
		   ~StateMirror() = default;
			StateMirror(const StateMirror&) = delete;             // non-copyable
			StateMirror& operator=(const StateMirror&) = delete;  // non-assignable
			StateMirror(StateMirror&& rhs) = delete;              // non-movable
			StateMirror& operator=(StateMirror&& rhs) = delete;   // non-movable-assignable

			void apply(const proto::Message& message);

			// drops everything received so far; used when a new session is established
			void reset();

			void setConnectionStatus(ConnectionStatus status);

			StatePtr snapshot() const;

			inline ConnectionStatus getConnectionStatus() const
			{
				return snapshot()->connectionStatus;
			}

			inline ts::optional<Track> getCurrentTrack() const
			{
				return snapshot()->currentTrack;
			}

			inline std::vector<Playlist> getPlaylists() const
			{
				return snapshot()->playlists;
			}

			inline ts::optional<int> getTrackPosition() const
			{
				return snapshot()->trackPosition;
			}

			inline TransportStatus getTransportStatus() const
			{
				return snapshot()->transportStatus;
			}

			inline ts::optional<int> getVolume() const
			{
				return snapshot()->volume;
			}

			inline bool isFirstSnapshotReceived() const
			{
				return snapshot()->firstSnapshotReceived;
			}

		protected:
			// active playlist id is taken from the entry flagged active, whichever message carried the listing
			static void applyPlaylists(PlayerState& s, const std::vector<Playlist>& playlists);

			template<typename ModifierType>
			void update(ModifierType modifier)
			{
				std::lock_guard<std::mutex> lock{mutex};

				auto statePtr{std::make_shared<PlayerState>(*state)};
				modifier(*statePtr);
				state = std::move(statePtr);
			}

		private:
			mutable std::mutex mutex;
			StatePtr           state;
	};
}
