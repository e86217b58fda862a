/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
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

#include <jau/debug.hpp>

#include "BTBEnv.hpp"

using namespace bt_bricks;

BTBEnv::BTBEnv() noexcept
: exploding( jau::environment::getExplodingProperties("bt_bricks") ),
  SCAN_TIMEOUT( jau::environment::getInt32Property("bt_bricks.scan.timeout", 10000, 500 /* min */, INT32_MAX /* max */) ),
  CONNECT_TIMEOUT( jau::environment::getInt32Property("bt_bricks.connect.timeout", 10000, 1500 /* min */, INT32_MAX /* max */) ),
  DISCONNECT_TIMEOUT( jau::environment::getInt32Property("bt_bricks.disconnect.timeout", 3000, 500 /* min */, INT32_MAX /* max */) ),
  GATT_TARGET_MTU( jau::environment::getInt32Property("bt_bricks.gatt.mtu", 256, 23 /* min */, 517 /* max */) ),
  PERIPHERAL_MAX_CONNECTIONS( jau::environment::getInt32Property("bt_bricks.peripheral.max_connections", 3, 1 /* min */, 8 /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("bt_bricks.debug.event", false) )
{
}
