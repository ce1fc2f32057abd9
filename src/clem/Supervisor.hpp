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
#include <conwrap2/ProcessorProxy.hpp>
#include <conwrap2/Timer.hpp>
#include <cstddef>  // std::size_t
#include <functional>
#include <memory>
#include <mutex>
#include <scope_guard.hpp>
#include <string>
#include <type_safe/optional_ref.hpp>

#include "clem/Exception.hpp"
#include "clem/log/log.hpp"
#include "clem/Parameters.hpp"
#include "clem/proto/Command.hpp"
#include "clem/proto/FrameCodec.hpp"
#include "clem/Session.hpp"
#include "clem/StateMirror.hpp"
#include "clem/SupervisorBase.hpp"


namespace clem
{
	namespace ts = type_safe;

	// Keeps at most one Session alive and replaces it after the connection is lost.
	//
	// start(), stop() and all reconnect work run on the processor thread; interrupt(), send() and
	// the getters may be called from any thread. A session is never disconnected while sessionMutex
	// is held, so a message callback sending commands cannot deadlock with teardown.
	template<typename ConnectionType>
	class Supervisor : public SupervisorBase
	{
		public:
			using SessionType           = Session<ConnectionType>;
			using ConnectionFactoryType = std::function<std::unique_ptr<ConnectionType>()>;
			using MessageCallbackType   = typename SessionType::MessageCallbackType;

			Supervisor(conwrap2::ProcessorProxy<std::unique_ptr<SupervisorBase>> pp, std::reference_wrapper<StateMirror> mi, Parameters pa, ConnectionFactoryType cf, MessageCallbackType mc = nullptr)
			: processorProxy{pp}
			, mirror{mi}
			, parameters{std::move(pa)}
			, connectionFactory{std::move(cf)}
			, messageCallback{std::move(mc)}
			{
				LOG(DEBUG) << "Supervisor object was created (id=" << this << ")";
			}

			// using Rule Of Zero
			virtual ~Supervisor()
			{
				// canceling deferred reconnect if any
				ts::with(reconnectTimer, [&](auto& timer)
				{
					timer.cancel();
				});

				closeSession();

				LOG(DEBUG) << "Supervisor object was deleted (id=" << this << ")";
			}

			Supervisor(const Supervisor&) = delete;             // non-copyable
			Supervisor& operator=(const Supervisor&) = delete;  // non-assignable
			Supervisor(Supervisor&& rhs) = delete;              // non-movable
			Supervisor& operator=(Supervisor&& rhs) = delete;   // non-move-assignable

			inline std::size_t getConnectAttempts() const
			{
				return connectAttempts;
			}

			inline std::string getLastError() const
			{
				std::lock_guard<std::mutex> lock{errorMutex};

				return lastError;
			}

			// thread-safe; unblocks a pending connect attempt and prevents new ones
			void interrupt()
			{
				running = false;

				auto sessionPtr{getSession()};
				if (sessionPtr)
				{
					sessionPtr->disconnect();
				}
			}

			virtual bool isRunning() const override
			{
				return running;
			}

			// thread-safe; returns false if there is no connected session and strict policy is off
			bool send(const proto::Command& command)
			{
				auto result{false};

				auto sessionPtr{getSession()};
				if (sessionPtr)
				{
					result = sessionPtr->send(command);
				}
				else
				{
					// arguments are validated regardless of connection state
					auto frame{proto::FrameCodec::encode(command)};

					if (parameters.isStrictCommands())
					{
						throw CommandOnDisconnectedSessionError{"Client is not started"};
					}

					LOG(WARNING) << "Command was not sent as client is not started (command=" << command << ", size=" << frame.size() << ")";
				}

				return result;
			}

			// performs the first connect attempt; throws if it failed and no retry is going to happen
			virtual void start() override
			{
				if (running)
				{
					LOG(WARNING) << "Supervisor is already running (id=" << this << ")";
					return;
				}
				running = true;

				// running flag must not stay set if the error is passed to the caller
				::util::scope_guard_failure onError = [&]
				{
					running = false;
				};

				try
				{
					connect();
				}
				catch (const TransportError& error)
				{
					setLastError(error.what());

					if (!parameters.isReconnect() || !running)
					{
						throw;
					}

					LOG(WARNING) << error.what();
					scheduleReconnect();
				}
				catch (const Exception& error)
				{
					setLastError(error.what());
					throw;
				}
			}

			virtual void stop() override
			{
				running = false;

				ts::with(reconnectTimer, [&](auto& timer)
				{
					timer.cancel();
				});
				reconnectTimer.reset();

				closeSession();

				LOG(DEBUG) << "Supervisor was stopped (id=" << this << ")";
			}

		protected:
			void closeSession()
			{
				std::shared_ptr<SessionType> sessionPtr;
				{
					std::lock_guard<std::mutex> lock{sessionMutex};
					sessionPtr = std::move(currentSessionPtr);
				}

				// after disconnect there is no receive thread left to write to the mirror
				if (sessionPtr)
				{
					sessionPtr->disconnect();
				}
			}

			void connect()
			{
				closeSession();

				connectAttempts++;
				auto sessionGeneration{++generation};
				auto sessionPtr{std::make_shared<SessionType>(connectionFactory(), mirror, parameters, [&, sessionGeneration](auto&)
				{
					// receive thread must not wait for the processor
					processorProxy.process([&, sessionGeneration]
					{
						onSessionClosed(sessionGeneration);
					});
				}, messageCallback)};

				// close notification of a failed attempt is handled by the caller of connect()
				::util::scope_guard_failure onError = [&]
				{
					generation++;
				};

				{
					std::lock_guard<std::mutex> lock{sessionMutex};

					// checked under the lock so that interrupt() either sees this session or prevents it
					if (!running)
					{
						throw TransportError{"Supervisor was stopped"};
					}

					// readers keep their old snapshots; new ones start from a fresh record
					mirror.get().reset();
					currentSessionPtr = sessionPtr;
				}

				LOG(DEBUG) << "Connect attempt " << connectAttempts.load() << " (id=" << this << ")";

				sessionPtr->connect();
			}

			std::shared_ptr<SessionType> getSession() const
			{
				std::lock_guard<std::mutex> lock{sessionMutex};

				return currentSessionPtr;
			}

			void onSessionClosed(unsigned long sessionGeneration)
			{
				// late notification from an already replaced session
				if (sessionGeneration != generation || !running)
				{
					return;
				}

				setLastError("Connection to the player was lost");

				if (parameters.isReconnect())
				{
					LOG(WARNING) << "Connection to the player was lost, reconnecting in " << parameters.getReconnectDelay().count() << " ms";

					scheduleReconnect();
				}
				else
				{
					// nothing is going to bring the connection back so start() has to be able to run again
					running = false;

					LOG(WARNING) << "Connection to the player was lost";
				}
			}

			void reconnect()
			{
				if (!running)
				{
					return;
				}

				try
				{
					connect();
				}
				catch (const AuthRejectedError& error)
				{
					// auth code will not become valid by retrying
					running = false;
					setLastError(error.what());

					LOG(ERROR) << error << "; reconnecting was stopped";
				}
				catch (const Exception& error)
				{
					setLastError(error.what());

					if (running)
					{
						LOG(WARNING) << error.what() << "; reconnecting in " << parameters.getReconnectDelay().count() << " ms";

						scheduleReconnect();
					}
				}
				catch (const std::exception& error)
				{
					running = false;
					setLastError(error.what());

					LOG(ERROR) << error.what();
				}
			}

			void scheduleReconnect()
			{
				if (reconnectTimer.has_value())
				{
					return;
				}

				reconnectTimer = ts::ref(processorProxy.processWithDelay([&]
				{
					reconnectTimer.reset();
					reconnect();
				}, parameters.getReconnectDelay()));
			}

			void setLastError(std::string error)
			{
				std::lock_guard<std::mutex> lock{errorMutex};

				lastError = std::move(error);
			}

		private:
			conwrap2::ProcessorProxy<std::unique_ptr<SupervisorBase>> processorProxy;
			std::reference_wrapper<StateMirror>                       mirror;
			Parameters                                                parameters;
			ConnectionFactoryType                                     connectionFactory;
			MessageCallbackType                                       messageCallback;
			std::atomic<bool>                                         running{false};
			std::atomic<unsigned long>                                generation{0};
			std::atomic<std::size_t>                                  connectAttempts{0};
			mutable std::mutex                                        sessionMutex;
			std::shared_ptr<SessionType>                              currentSessionPtr;
			mutable std::mutex                                        errorMutex;
			std::string                                               lastError;
			ts::optional_ref<conwrap2::Timer>                         reconnectTimer{ts::nullopt};
	};
}
