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

#include <g3log/g3log.hpp>
#include <g3log/loglevels.hpp>


// g3log does not provide ERROR level out of the box; it is enabled in main()
const LEVELS ERROR{WARNING.value + 1, {"ERROR"}};
