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

#include <system_error>

#include "clem/conn/tcp/Connection.hpp"
#include "clem/Exception.hpp"
#include "clem/log/log.hpp"


namespace clem
{
	namespace conn
	{
		namespace tcp
		{
			Connection::Connection()
			: nativeSocket{context}
			{
				LOG(DEBUG) << "Connection object was created (id=" << this << ")";
			}


			Connection::~Connection()
			{
				stop();
				close();

				LOG(DEBUG) << "Connection object was deleted (id=" << this << ")";
			}


			void Connection::close()
			{
				std::lock_guard<std::mutex> lock{lifecycleMutex};

				// pending open() closes the socket itself once connect operation is over
				if (!connecting && nativeSocket.is_open())
				{
					auto error{std::error_code{}};
					nativeSocket.close(error);

					if (error)
					{
						LOG(WARNING) << "Error while closing socket (id=" << this << ", error='" << error.message() << "')";
					}
				}
			}


			void Connection::open(const std::string& host, unsigned int port, std::chrono::milliseconds timeout)
			{
				auto error{std::error_code{}};
				auto resolver{asio::ip::tcp::resolver{context}};
				auto endpoints{resolver.resolve(host, std::to_string(port), error)};

				if (error)
				{
					throw TransportError{"Could not resolve host '" + host + "': " + error.message()};
				}

				{
					std::lock_guard<std::mutex> lock{lifecycleMutex};

					if (stopped)
					{
						throw TransportError{"Connection was stopped before connecting to " + host + ":" + std::to_string(port)};
					}
					connecting = true;
				}

				// the only handler is the connect completion, so running the context drives the connect attempt
				auto completed{false};
				asio::async_connect(nativeSocket, endpoints, [&](const std::error_code& e, const asio::ip::tcp::endpoint&)
				{
					completed = true;
					error     = e;
				});
				context.restart();
				context.run_for(timeout);

				auto timedOut{!completed};
				if (timedOut)
				{
					// aborting connect attempt and waiting for its handler so no operation refers to this frame
					auto e{std::error_code{}};
					nativeSocket.close(e);
					context.run();
				}

				{
					std::lock_guard<std::mutex> lock{lifecycleMutex};

					connecting = false;
					if (stopped || timedOut || error)
					{
						auto e{std::error_code{}};
						nativeSocket.close(e);
					}
				}

				if (stopped)
				{
					throw TransportError{"Connection was stopped while connecting to " + host + ":" + std::to_string(port)};
				}
				if (timedOut)
				{
					throw TransportError{"Could not connect to " + host + ":" + std::to_string(port) + " within " + std::to_string(timeout.count()) + " ms"};
				}
				if (error)
				{
					throw TransportError{"Could not connect to " + host + ":" + std::to_string(port) + ": " + error.message()};
				}

				// making sure keep-alive packets are sent and commands are not delayed by Nagle's algorithm
				nativeSocket.set_option(asio::socket_base::keep_alive{true}, error);
				if (error)
				{
					LOG(WARNING) << "Could not enable keep-alive (id=" << this << ", error='" << error.message() << "')";
				}
				nativeSocket.set_option(asio::ip::tcp::no_delay{true}, error);
				if (error)
				{
					LOG(WARNING) << "Could not disable Nagle's algorithm (id=" << this << ", error='" << error.message() << "')";
				}

				LOG(DEBUG) << "Connection was opened (id=" << this << ", host=" << host << ", port=" << port << ")";
			}


			std::size_t Connection::read(std::uint8_t* buffer, std::size_t size)
			{
				auto error{std::error_code{}};
				auto result{nativeSocket.read_some(asio::buffer(buffer, size), error)};

				if (error)
				{
					result = 0;

					// socket shut down by stop() or closed by the peer is not an error
					if (!stopped && error != asio::error::eof)
					{
						throw TransportError{"Could not receive data: " + error.message()};
					}
				}

				return result;
			}


			void Connection::stop()
			{
				std::lock_guard<std::mutex> lock{lifecycleMutex};

				stopped = true;

				if (connecting)
				{
					// socket is closed on the thread running connect operation, which aborts it
					asio::post(context, [&]
					{
						auto error{std::error_code{}};
						nativeSocket.close(error);
					});
				}
				else if (nativeSocket.is_open())
				{
					// it will unblock pending read operation
					auto error{std::error_code{}};
					nativeSocket.shutdown(asio::socket_base::shutdown_both, error);

					if (error && error != asio::error::not_connected)
					{
						LOG(DEBUG) << "Error while shutting down socket (id=" << this << ", error='" << error.message() << "')";
					}
				}
			}


			std::size_t Connection::write(const void* data, std::size_t size)
			{
				if (stopped)
				{
					throw TransportError{"Could not send data as connection was stopped"};
				}

				auto error{std::error_code{}};
				auto result{asio::write(nativeSocket, asio::const_buffer(data, size), error)};

				if (error)
				{
					throw TransportError{"Could not send data: " + error.message()};
				}

				return result;
			}
		}
	}
}
