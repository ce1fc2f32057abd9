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

#include <cstddef>  // std::size_t
#include <cstdint>  // std::u..._t types
#include <scope_guard.hpp>
#include <type_safe/optional.hpp>
#include <vector>

#include "clem/proto/Command.hpp"
#include "clem/proto/Message.hpp"


namespace clem
{
	namespace proto
	{
		namespace ts = type_safe;

		// Frame = 4 bytes big-endian payload length followed by serialized protobuf Message
		class FrameCodec
		{
			public:
				using BufferType = std::vector<std::uint8_t>;

				static constexpr std::size_t PrefixSize{4};
				static constexpr std::size_t DefaultMaxFrameSize{16 * 1024 * 1024};

				explicit FrameCodec(std::size_t m = DefaultMaxFrameSize)
				: maxFrameSize{m} {}

				// using Rule Of Zero
			   ~FrameCodec() = default;
				FrameCodec(const FrameCodec&) = default;
				FrameCodec& operator=(const FrameCodec&) = default;
				FrameCodec(FrameCodec&& rhs) = default;
				FrameCodec& operator=(FrameCodec&& rhs) = default;

				// invokes handler for every complete frame; incomplete tail is kept until the next call
				template<typename HandlerType>
				void decode(const std::uint8_t* data, std::size_t size, HandlerType handler)
				{
					// there is no way to resynchronize a byte stream after a bad frame
					::util::scope_guard_failure onException = [&]
					{
						buffer.clear();
					};

					buffer.insert(buffer.end(), data, data + size);

					for (auto message{extractMessage()}; message.has_value(); message = extractMessage())
					{
						handler(std::move(message.value()));
					}
				}

				static BufferType encode(const Command& command);

				inline auto getBufferedSize() const
				{
					return buffer.size();
				}

				inline auto getMaxFrameSize() const
				{
					return maxFrameSize;
				}

			protected:
				ts::optional<Message> extractMessage();

			private:
				std::size_t maxFrameSize;
				BufferType  buffer;
		};
	}
}
