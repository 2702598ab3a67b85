/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2021 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstdint>

#include <jau/environment.hpp>

#include "CarlinkEnv.hpp"

using namespace carlink;

CarlinkEnv::CarlinkEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("carlink").debug ),
  exploding( jau::environment::getExplodingProperties("carlink") ),
  CONNECT_TIMEOUT_SEC( jau::environment::getInt32Property("carlink.connect.timeout", 60, 1 /* min */, 3600 /* max */) ),
  TASK_RING_CAPACITY( jau::environment::getInt32Property("carlink.ringsize", 128, 64 /* min */, 1024 /* max */) ),
  ASSOCIATION_NAME_LENGTH( jau::environment::getInt32Property("carlink.assoc.namelen", 8, 4 /* min */, 8 /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("carlink.debug.event", false) )
{
}
