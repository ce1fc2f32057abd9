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

#include <atomic>
#include <chrono>
#include <conwrap2/Processor.hpp>
#include <cstddef>  // std::size_t
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <scope_guard.hpp>
#include <string>
#include <thread>
#include <type_safe/optional.hpp>
#include <vector>

#include "clem/log/log.hpp"
#include "clem/Parameters.hpp"
#include "clem/PlayerState.hpp"
#include "clem/proto/Command.hpp"
#include "clem/proto/Message.hpp"
#include "clem/StateMirror.hpp"
#include "clem/Supervisor.hpp"
#include "clem/SupervisorBase.hpp"


namespace clem
{
	namespace ts = type_safe;

	// Caller facing surface: lifecycle, commands and reads.
	//
	// Connect attempts, reconnect timers and teardown run on a dedicated processor thread;
	// commands and reads run on the caller's thread and never wait for data from the player.
	template<typename ConnectionType>
	class Client
	{
		public:
			using SupervisorType        = Supervisor<ConnectionType>;
			using ConnectionFactoryType = typename SupervisorType::ConnectionFactoryType;
			using MessageCallbackType   = typename SupervisorType::MessageCallbackType;
			using Processor             = conwrap2::Processor<std::unique_ptr<SupervisorBase>>;

			// throws ValidationError if parameters are not valid
			explicit Client(Parameters pa, ConnectionFactoryType cf = []
			{
				return std::make_unique<ConnectionType>();
			})
			: parameters{std::move(pa)}
			{
				parameters.validate();

				processorPtr = std::make_unique<Processor>([&, cf = std::move(cf)](auto processorProxy)
				{
					// saving a pointer so thread-safe methods can be called without the processor
					supervisorPtr = new SupervisorType{processorProxy, std::ref(mirror), parameters, cf, [&](const proto::Message& message)
					{
						onMessage(message);
					}};

					return std::unique_ptr<SupervisorBase>{supervisorPtr};
				});

				LOG(DEBUG) << "Client object was created (id=" << this << ")";
			}

			~Client()
			{
				stop();

				// processor must be destroyed FIRST as the supervisor refers to the mirror
				processorPtr.reset();

				LOG(DEBUG) << "Client object was deleted (id=" << this << ")";
			}

			Client(const Client&) = delete;             // non-copyable
			Client& operator=(const Client&) = delete;  // non-assignable
			Client(Client&& rhs) = delete;              // non-movable
			Client& operator=(Client&& rhs) = delete;   // non-move-assignable

			inline bool changeSong(int playlistID, int songIndex)
			{
				return send(proto::outbound::ChangeSong{playlistID, songIndex});
			}

			inline std::size_t getConnectAttempts() const
			{
				return supervisorPtr->getConnectAttempts();
			}

			inline ConnectionStatus getConnectionStatus() const
			{
				return mirror.getConnectionStatus();
			}

			inline ts::optional<Track> getCurrentTrack() const
			{
				return mirror.getCurrentTrack();
			}

			inline std::string getLastError() const
			{
				return supervisorPtr->getLastError();
			}

			inline const Parameters& getParameters() const
			{
				return parameters;
			}

			inline std::vector<Playlist> getPlaylists() const
			{
				return mirror.getPlaylists();
			}

			inline ts::optional<int> getTrackPosition() const
			{
				return mirror.getTrackPosition();
			}

			inline TransportStatus getTransportStatus() const
			{
				return mirror.getTransportStatus();
			}

			inline ts::optional<int> getVolume() const
			{
				return mirror.getVolume();
			}

			inline bool isConnected() const
			{
				return mirror.getConnectionStatus() == ConnectionStatus::Connected;
			}

			inline bool isFirstSnapshotReceived() const
			{
				return mirror.isFirstSnapshotReceived();
			}

			inline bool isRunning() const
			{
				return supervisorPtr->isRunning();
			}

			inline bool next()
			{
				return send(proto::outbound::Next{});
			}

			inline bool openPlaylist(int playlistID)
			{
				return send(proto::outbound::OpenPlaylist{playlistID});
			}

			inline bool pause()
			{
				return send(proto::outbound::Pause{});
			}

			inline bool play()
			{
				return send(proto::outbound::Play{});
			}

			inline bool playPause()
			{
				return send(proto::outbound::PlayPause{});
			}

			inline bool previous()
			{
				return send(proto::outbound::Previous{});
			}

			// throws ValidationError for invalid arguments even if not connected
			inline bool send(const proto::Command& command)
			{
				return supervisorPtr->send(command);
			}

			// invoked on the receive thread after the message was applied to the mirror
			inline void setMessageCallback(MessageCallbackType callback)
			{
				std::lock_guard<std::mutex> lock{callbackMutex};

				messageCallback = std::move(callback);
			}

			inline bool setVolume(int volume)
			{
				return send(proto::outbound::SetVolume{volume});
			}

			inline StateMirror::StatePtr snapshot() const
			{
				return mirror.snapshot();
			}

			// returns once the first connect attempt is over; rethrows its error unless a retry was scheduled
			void start()
			{
				auto promise{std::promise<void>{}};
				auto future{promise.get_future()};

				processorPtr->process([&, promise = std::move(promise)]() mutable
				{
					try
					{
						supervisorPtr->start();
						promise.set_value();
					}
					catch (...)
					{
						// passing the error to the caller's thread
						promise.set_exception(std::current_exception());
					}
				});

				future.get();
			}

			// idempotent; once it returned the old session does not write to the mirror anymore,
			// unless it is called from the message callback: then teardown completes after the callback returns
			void stop()
			{
				// a blocked connect attempt would delay the processor so it is interrupted from here
				supervisorPtr->interrupt();

				// teardown joins the receive thread, so it cannot be awaited from the receive thread
				if (callbackThreadID == std::this_thread::get_id())
				{
					processorPtr->process([&]
					{
						supervisorPtr->stop();
					});
					return;
				}

				auto promise{std::promise<void>{}};
				auto future{promise.get_future()};

				processorPtr->process([&, promise = std::move(promise)]() mutable
				{
					supervisorPtr->stop();
					promise.set_value();
				});

				if (future.wait_for(parameters.getStopTimeout()) != std::future_status::ready)
				{
					LOG(WARNING) << "Client was not stopped within " << parameters.getStopTimeout().count() << " ms (id=" << this << ")";
				}
			}

			inline bool stopPlayback()
			{
				return send(proto::outbound::Stop{});
			}

		protected:
			void onMessage(const proto::Message& message)
			{
				MessageCallbackType callback;
				{
					std::lock_guard<std::mutex> lock{callbackMutex};
					callback = messageCallback;
				}

				if (callback)
				{
					callbackThreadID = std::this_thread::get_id();
					::util::scope_guard onExit = [&]
					{
						callbackThreadID = std::thread::id{};
					};

					callback(message);
				}
			}

		private:
			Parameters                   parameters;
			StateMirror                  mirror;
			std::mutex                   callbackMutex;
			MessageCallbackType          messageCallback;
			std::atomic<std::thread::id> callbackThreadID{std::thread::id{}};
			SupervisorType*              supervisorPtr{nullptr};
			std::unique_ptr<Processor>   processorPtr;
	};
}
