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


namespace clem
{
	// Type-erased resource owned by the lifecycle processor; all methods are called on the processor thread
	class SupervisorBase
	{
		public:
			// using Rule Of Zero
			SupervisorBase() = default;
			virtual ~SupervisorBase() = default;
			SupervisorBase(const SupervisorBase&) = delete;             // non-copyable
			SupervisorBase& operator=(const SupervisorBase&) = delete;  // non-assignable
			SupervisorBase(SupervisorBase&& rhs) = default;
			SupervisorBase& operator=(SupervisorBase&& rhs) = default;

			virtual bool isRunning() const = 0;
			virtual void start() = 0;
			virtual void stop() = 0;
	};
}
