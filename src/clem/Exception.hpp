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

#include <ostream>
#include <stdexcept>
#include <string>


namespace clem
{
	class Exception : public std::runtime_error
	{
		public:
			explicit Exception(const std::string& e)
			: std::runtime_error{e} {}

			explicit Exception(const char* e)
			: std::runtime_error{std::string{e}} {}

			// using Rule Of Zero
			virtual ~Exception() = default;
			Exception(const Exception&) = default;
			Exception& operator=(const Exception&) = default;
			Exception(Exception&& rhs) = default;
			Exception& operator=(Exception&& rhs) = default;
	};

	// connection refused, reset or closed by the peer
	class TransportError : public Exception
	{
		public:
			using Exception::Exception;
	};

	class AuthTimeoutError : public Exception
	{
		public:
			using Exception::Exception;
	};

	class AuthRejectedError : public Exception
	{
		public:
			using Exception::Exception;
	};

	// byte level desync or a payload which is not a protocol message
	class MalformedFrameError : public Exception
	{
		public:
			using Exception::Exception;
	};

	class CommandOnDisconnectedSessionError : public Exception
	{
		public:
			using Exception::Exception;
	};

	// invalid parameters or command arguments provided by the caller
	class ValidationError : public Exception
	{
		public:
			using Exception::Exception;
	};

	std::ostream& operator<< (std::ostream& os, const Exception& exception);
}
