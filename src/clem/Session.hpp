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
#include <condition_variable>
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint8_t
#include <functional>
#include <memory>
#include <mutex>
#include <scope_guard.hpp>
#include <thread>
#include <type_safe/optional.hpp>
#include <vector>

#include "clem/Exception.hpp"
#include "clem/log/log.hpp"
#include "clem/Parameters.hpp"
#include "clem/PlayerState.hpp"
#include "clem/proto/Command.hpp"
#include "clem/proto/FrameCodec.hpp"
#include "clem/proto/Message.hpp"
#include "clem/StateMirror.hpp"
#include "clem/util/StateMachine.hpp"


namespace clem
{
	namespace ts = type_safe;

	// One transport connection plus the thread receiving from it.
	//
	// The receive thread is started as soon as the transport is open so that the reply to the
	// handshake goes through the same decoding pipeline as any other message. All decoded
	// messages are applied to the mirror in the order they arrived.
	template<typename ConnectionType>
	class Session
	{
		protected:
			enum Event
			{
				ConnectEvent,
				OpenEvent,
				AuthenticateEvent,
				CloseEvent,
			};

			enum State
			{
				DisconnectedState,
				ConnectingState,
				AuthenticatingState,
				ConnectedState,
			};

		public:
			// invoked on the receive thread whenever the receive loop exits
			using CloseCallbackType   = std::function<void(Session&)>;
			using MessageCallbackType = std::function<void(const proto::Message&)>;

			static constexpr std::size_t ReadBufferSize{4096};

			Session(std::unique_ptr<ConnectionType> co, std::reference_wrapper<StateMirror> mi, Parameters pa, CloseCallbackType cc = nullptr, MessageCallbackType mc = nullptr)
			: connectionPtr{std::move(co)}
			, mirror{mi}
			, parameters{std::move(pa)}
			, codec{parameters.getMaxFrameSize()}
			, closeCallback{std::move(cc)}
			, messageCallback{std::move(mc)}
			, stateMachine
			{
				DisconnectedState,  // initial state
				{   // transition table definition
					{ConnectEvent,      DisconnectedState,   ConnectingState,     [&](auto event) {onStatusChange(ConnectionStatus::Connecting);},     [&] {return !closed;}},
					{OpenEvent,         ConnectingState,     AuthenticatingState, [&](auto event) {onStatusChange(ConnectionStatus::Authenticating);}, nullptr},
					{AuthenticateEvent, AuthenticatingState, ConnectedState,      [&](auto event) {onStatusChange(ConnectionStatus::Connected);},      nullptr},
					{CloseEvent,        ConnectingState,     DisconnectedState,   [&](auto event) {onStatusChange(ConnectionStatus::Disconnected);},   nullptr},
					{CloseEvent,        AuthenticatingState, DisconnectedState,   [&](auto event) {onStatusChange(ConnectionStatus::Disconnected);},   nullptr},
					{CloseEvent,        ConnectedState,      DisconnectedState,   [&](auto event) {onStatusChange(ConnectionStatus::Disconnected);},   nullptr},
					{CloseEvent,        DisconnectedState,   DisconnectedState,   nullptr,                                                             nullptr},
				}
			}
			{
				LOG(DEBUG) << "Session object was created (id=" << this << ")";
			}

			~Session()
			{
				disconnect();

				// the last reference may be released by the receive thread itself
				std::lock_guard<std::mutex> lock{threadMutex};
				if (receiveThread.joinable())
				{
					receiveThread.detach();
				}

				LOG(DEBUG) << "Session object was deleted (id=" << this << ")";
			}

			Session(const Session&) = delete;             // non-copyable
			Session& operator=(const Session&) = delete;  // non-assignable
			Session(Session&& rhs) = delete;              // non-movable
			Session& operator=(Session&& rhs) = delete;   // non-movable-assignable

			// blocks until the session is Connected; throws TransportError, AuthTimeoutError or AuthRejectedError
			void connect()
			{
				{
					std::lock_guard<std::mutex> lock{stateMutex};

					// session can not be reused once it was closed
					if (!stateMachine.processEvent(ConnectEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << "Invalid session state while processing Connect event (id=" << this << ")";
					}))
					{
						throw TransportError{"Session is already connected or was closed"};
					}
				}

				// any failure leaves the session disconnected with the receive thread joined
				::util::scope_guard_failure onFailure = [&]
				{
					disconnect();
				};

				LOG(INFO) << "Connecting to " << parameters.getHost() << ":" << parameters.getPort() << "...";

				connectionPtr->open(parameters.getHost(), parameters.getPort(), parameters.getConnectTimeout());
				if (!processEvent(OpenEvent))
				{
					throw TransportError{"Session was closed while connecting"};
				}

				{
					std::lock_guard<std::mutex> lock{threadMutex};
					receiveThread = std::thread{[&]
					{
						receive();
					}};
				}

				// handshake is required even without auth code as it makes the player start sending its state
				write(proto::FrameCodec::encode(proto::outbound::Connect{parameters.getAuthCode(), false, false}));

				if (parameters.getAuthCode().has_value())
				{
					waitForAuthentication();
				}

				if (!processEvent(AuthenticateEvent))
				{
					throw TransportError{"Connection was closed during handshake"};
				}

				LOG(INFO) << "Connected to " << parameters.getHost() << ":" << parameters.getPort() << " (id=" << this << ")";
			}

			// safe to call from any thread at any time, including repeatedly
			void disconnect()
			{
				if (getStatus() == ConnectionStatus::Connected)
				{
					// saying good-bye so the player does not wait for a timeout
					try
					{
						write(proto::FrameCodec::encode(proto::outbound::Disconnect{}));
					}
					catch (const Exception& error)
					{
						LOG(DEBUG) << "Could not send disconnect message (id=" << this << ", error=" << error.what() << ")";
					}
				}

				close();

				if (joinReceiveThread())
				{
					// a handshake may still be written by the connecting thread
					std::lock_guard<std::mutex> lock{writeMutex};
					connectionPtr->close();
				}
			}

			inline auto& getConnection()
			{
				return *connectionPtr;
			}

			inline ConnectionStatus getStatus() const
			{
				std::lock_guard<std::mutex> lock{stateMutex};

				switch (stateMachine.state)
				{
					case ConnectingState:     return ConnectionStatus::Connecting;
					case AuthenticatingState: return ConnectionStatus::Authenticating;
					case ConnectedState:      return ConnectionStatus::Connected;
					default:                  return ConnectionStatus::Disconnected;
				}
			}

			inline bool isConnected() const
			{
				return getStatus() == ConnectionStatus::Connected;
			}

			// returns false if the command could not be sent; invalid arguments always throw ValidationError
			bool send(const proto::Command& command)
			{
				// encoding first so an invalid command never depends on connection state
				auto frame{proto::FrameCodec::encode(command)};
				auto result{false};

				if (isConnected())
				{
					try
					{
						write(frame);
						result = true;

						LOG(DEBUG) << "Command was sent (id=" << this << ", command=" << command << ")";
					}
					catch (const TransportError& error)
					{
						LOG(WARNING) << "Could not send command, closing the connection (id=" << this << ", command=" << command << ", error=" << error.what() << ")";

						// the receive thread will notice and report the session as closed
						connectionPtr->stop();
					}
				}

				if (!result)
				{
					if (parameters.isStrictCommands())
					{
						throw CommandOnDisconnectedSessionError{"Session is not connected"};
					}

					LOG(WARNING) << "Command was not sent as session is not connected (id=" << this << ", command=" << command << ")";
				}

				return result;
			}

		protected:
			void close()
			{
				// it will unblock the receive thread
				connectionPtr->stop();

				{
					std::lock_guard<std::mutex> lock{stateMutex};

					closed = true;
					stateMachine.processEvent(CloseEvent, [&](auto event, auto state)
					{
						LOG(DEBUG) << "Close event was skipped (id=" << this << ", state=" << state << ")";
					});
				}

				// waking up connect() if it waits for the player to authenticate
				authCondition.notify_all();
			}

			// returns true if there is no receive thread running anymore
			bool joinReceiveThread()
			{
				auto result{true};

				std::lock_guard<std::mutex> lock{threadMutex};
				if (receiveThread.joinable())
				{
					if (receiveThread.get_id() != std::this_thread::get_id())
					{
						receiveThread.join();
					}
					else
					{
						result = false;
					}
				}

				return result;
			}

			void onMessage(proto::Message&& message)
			{
				std::visit(proto::Overloaded
				{
					[&](const proto::inbound::AuthResult& m)
					{
						if (!m.accepted)
						{
							LOG(WARNING) << "Player rejected authentication (id=" << this << ", reason=" << m.reason << ")";
						}

						setAuthAccepted(m.accepted);
					},
					[&](const proto::inbound::ServerInfo& m)
					{
						LOG(INFO) << "Player version " << m.version << " (id=" << this << ")";

						// the player starts sending its state only to authenticated clients
						setAuthAccepted(true);
					},
					[&](const proto::inbound::ServerDisconnect& m)
					{
						LOG(WARNING) << "Player is closing the connection (id=" << this << ", reason=" << m.reason << ")";
					},
					[&](const auto&) {},
				}, message);

				mirror.get().apply(message);

				if (messageCallback)
				{
					messageCallback(message);
				}
			}

			void onReceiveExit()
			{
				close();

				LOG(INFO) << "Session was closed (id=" << this << ")";

				if (closeCallback)
				{
					closeCallback(*this);
				}
			}

			void onStatusChange(ConnectionStatus status)
			{
				mirror.get().setConnectionStatus(status);

				LOG(DEBUG) << "Session status was changed (id=" << this << ", status=" << toString(status) << ")";
			}

			bool processEvent(Event event)
			{
				std::lock_guard<std::mutex> lock{stateMutex};

				return stateMachine.processEvent(event, [&](auto event, auto state)
				{
					LOG(DEBUG) << "Event was skipped in the current session state (id=" << this << ", event=" << event << ", state=" << state << ")";
				});
			}

			void receive()
			{
				// every way out of this loop must be visible to readers of connection status
				::util::scope_guard onExit = [&]
				{
					onReceiveExit();
				};

				try
				{
					auto buffer{std::vector<std::uint8_t>(ReadBufferSize)};

					for (auto size{connectionPtr->read(buffer.data(), buffer.size())}; size > 0; size = connectionPtr->read(buffer.data(), buffer.size()))
					{
						codec.decode(buffer.data(), size, [&](auto&& message)
						{
							onMessage(std::move(message));
						});
					}

					LOG(DEBUG) << "Connection was closed (id=" << this << ")";
				}
				catch (const MalformedFrameError& error)
				{
					LOG(ERROR) << "Malformed frame received, closing the connection (id=" << this << ", error=" << error.what() << ")";
				}
				catch (const Exception& error)
				{
					LOG(ERROR) << error;
				}
				catch (const std::exception& error)
				{
					LOG(ERROR) << "Error while receiving data (id=" << this << ", error=" << error.what() << ")";
				}
			}

			void setAuthAccepted(bool accepted)
			{
				{
					std::lock_guard<std::mutex> lock{stateMutex};

					if (stateMachine.state != AuthenticatingState || authAccepted.has_value())
					{
						return;
					}
					authAccepted = accepted;
				}

				authCondition.notify_all();
			}

			void waitForAuthentication()
			{
				std::unique_lock<std::mutex> lock{stateMutex};

				auto completed{authCondition.wait_for(lock, parameters.getAuthTimeout(), [&]
				{
					return authAccepted.has_value() || stateMachine.state == DisconnectedState;
				})};

				if (!completed)
				{
					throw AuthTimeoutError{"Player did not reply to authentication within " + std::to_string(parameters.getAuthTimeout().count()) + " ms"};
				}

				if (!authAccepted.has_value())
				{
					throw TransportError{"Connection was closed during authentication"};
				}

				if (!authAccepted.value())
				{
					throw AuthRejectedError{"Player rejected the auth code"};
				}
			}

			void write(const proto::FrameCodec::BufferType& frame)
			{
				// frames from different threads must not interleave
				std::lock_guard<std::mutex> lock{writeMutex};

				connectionPtr->write(frame.data(), frame.size());
			}

		private:
			std::unique_ptr<ConnectionType>       connectionPtr;
			std::reference_wrapper<StateMirror>   mirror;
			Parameters                            parameters;
			proto::FrameCodec                     codec;
			CloseCallbackType                     closeCallback;
			MessageCallbackType                   messageCallback;
			util::StateMachine<Event, State>      stateMachine;
			mutable std::mutex                    stateMutex;
			std::condition_variable               authCondition;
			ts::optional<bool>                    authAccepted{ts::nullopt};
			bool                                  closed{false};
			std::mutex                            writeMutex;
			std::mutex                            threadMutex;
			std::thread                           receiveThread;
	};
}
