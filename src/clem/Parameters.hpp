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
#include <string>
#include <type_safe/optional.hpp>

#include "clem/proto/FrameCodec.hpp"


namespace clem
{
	namespace ts = type_safe;

	class Parameters
	{
		public:
			Parameters() = default;

			Parameters(std::string h, unsigned int p, ts::optional<int> a, bool r)
			: host{std::move(h)}
			, port{p}
			, authCode{a}
			, reconnect{r} {}

			// using Rule Of Zero
		   ~Parameters() = default;
			Parameters(const Parameters&) = default;
			Parameters& operator=(const Parameters&) = default;
			Parameters(Parameters&& rhs) = default;
			Parameters& operator=(Parameters&& rhs) = default;

			inline const ts::optional<int>& getAuthCode() const
			{
				return authCode;
			}

			inline std::chrono::milliseconds getAuthTimeout() const
			{
				return authTimeout;
			}

			inline std::chrono::milliseconds getConnectTimeout() const
			{
				return connectTimeout;
			}

			inline const std::string& getHost() const
			{
				return host;
			}

			inline std::size_t getMaxFrameSize() const
			{
				return maxFrameSize;
			}

			inline unsigned int getPort() const
			{
				return port;
			}

			inline std::chrono::milliseconds getReconnectDelay() const
			{
				return reconnectDelay;
			}

			inline std::chrono::milliseconds getStopTimeout() const
			{
				return stopTimeout;
			}

			inline bool isReconnect() const
			{
				return reconnect;
			}

			inline bool isStrictCommands() const
			{
				return strictCommands;
			}

			inline void setAuthCode(ts::optional<int> a)
			{
				authCode = a;
			}

			inline void setAuthTimeout(std::chrono::milliseconds t)
			{
				authTimeout = t;
			}

			inline void setConnectTimeout(std::chrono::milliseconds t)
			{
				connectTimeout = t;
			}

			inline void setHost(std::string h)
			{
				host = std::move(h);
			}

			inline void setMaxFrameSize(std::size_t m)
			{
				maxFrameSize = m;
			}

			inline void setPort(unsigned int p)
			{
				port = p;
			}

			inline void setReconnect(bool r)
			{
				reconnect = r;
			}

			inline void setReconnectDelay(std::chrono::milliseconds d)
			{
				reconnectDelay = d;
			}

			inline void setStopTimeout(std::chrono::milliseconds t)
			{
				stopTimeout = t;
			}

			inline void setStrictCommands(bool s)
			{
				strictCommands = s;
			}

			// throws ValidationError describing the first invalid parameter
			void validate() const;

		private:
			std::string               host{"localhost"};
			unsigned int              port{5500};
			ts::optional<int>         authCode{ts::nullopt};
			bool                      reconnect{false};
			std::chrono::milliseconds reconnectDelay{std::chrono::seconds{15}};
			std::chrono::milliseconds connectTimeout{std::chrono::seconds{5}};
			std::chrono::milliseconds authTimeout{std::chrono::seconds{5}};
			std::chrono::milliseconds stopTimeout{std::chrono::seconds{5}};
			std::size_t               maxFrameSize{proto::FrameCodec::DefaultMaxFrameSize};
			// if set then commands sent while disconnected throw instead of returning false
			bool                      strictCommands{false};
	};
}
