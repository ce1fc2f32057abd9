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

#include <algorithm>
#include <functional>
#include <vector>


namespace clem
{
	namespace util
	{
		template <typename EventType, typename StateType>
		struct Transition
		{
			EventType                       event;
			StateType                       fromState;
			StateType                       toState;
			std::function<void(EventType)>  action;
			std::function<bool()>           guard;
		};

		// Table driven state machine; not thread-safe, callers provide locking
		template <typename EventType, typename StateType>
		struct StateMachine
		{
			StateType                                     state;
			std::vector<Transition<EventType, StateType>> transitions;

			// returns false if there is no transition for the event or its guard rejected it
			template <typename ErrorHandlerType>
			bool processEvent(EventType event, ErrorHandlerType errorHandler)
			{
				auto result{false};
				auto found = std::find_if(transitions.begin(), transitions.end(), [&](const auto& transition)
				{
					return (transition.fromState == state && transition.event == event);
				});

				if (found == transitions.end())
				{
					errorHandler(event, state);
				}
				else if (!(*found).guard || (*found).guard())
				{
					// state is changed before the action so the action observes the target state
					state = (*found).toState;
					if ((*found).action)
					{
						(*found).action(event);
					}
					result = true;
				}

				return result;
			}
		};
	}
}
