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

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint8_t
#include <mutex>
#include <string>


namespace clem
{
	namespace conn
	{
		namespace tcp
		{
			// Blocking TCP client connection.
			//
			// open(), close(), read() and write() belong to the thread owning the connection, except that
			// read() and write() may be used by two different threads (one each direction); stop() may be
			// called from any thread and aborts a pending open() or unblocks a pending read().
			class Connection
			{
				public:
					Connection();
					~Connection();

					Connection(const Connection&) = delete;             // non-copyable
					Connection& operator=(const Connection&) = delete;  // non-assignable
					Connection(Connection&& rhs) = delete;              // non-movable
					Connection& operator=(Connection&& rhs) = delete;   // non-movable-assignable

					void close();

					// throws TransportError if host cannot be resolved, connection is refused, it did not
					// complete within timeout or stop() was called meanwhile
					void open(const std::string& host, unsigned int port, std::chrono::milliseconds timeout);

					// returns 0 when the peer closed the connection or stop() was called
					std::size_t read(std::uint8_t* buffer, std::size_t size);

					void stop();

					std::size_t write(const void* data, std::size_t size);

				private:
					asio::io_context      context;
					asio::ip::tcp::socket nativeSocket;
					std::mutex            lifecycleMutex;
					bool                  connecting{false};
					std::atomic<bool>     stopped{false};
			};
		}
	}
}
