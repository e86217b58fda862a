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

#ifndef BT_BRICKS_ENV_HPP_
#define BT_BRICKS_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>

namespace bt_bricks {

    /**
     * bt_bricks singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class BTBEnv : public jau::root_environment {
        private:
            BTBEnv() noexcept;

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Duration of one scan session in milliseconds, defaults to 10s.
             * <p>
             * Environment variable is 'bt_bricks.scan.timeout'.
             * </p>
             */
            const int32_t SCAN_TIMEOUT;

            /**
             * Bound in milliseconds for a central connect attempt to reach READY,
             * including scanning, defaults to 10s.
             * <p>
             * Environment variable is 'bt_bricks.connect.timeout'.
             * </p>
             */
            const int32_t CONNECT_TIMEOUT;

            /**
             * Bound in milliseconds for the radio to confirm a requested disconnect,
             * before the connection is torn down locally, defaults to 3s.
             * <p>
             * Environment variable is 'bt_bricks.disconnect.timeout'.
             * </p>
             */
            const int32_t DISCONNECT_TIMEOUT;

            /**
             * Target MTU requested on READY connections, defaults to 256.
             * <p>
             * Environment variable is 'bt_bricks.gatt.mtu'.
             * </p>
             */
            const int32_t GATT_TARGET_MTU;

            /**
             * Maximum number of simultaneous connections served in peripheral role, defaults to 3.
             * <p>
             * Environment variable is 'bt_bricks.peripheral.max_connections'.
             * </p>
             */
            const int32_t PERIPHERAL_MAX_CONNECTIONS;

            /**
             * Debug all routed radio events and registry triggers.
             * <p>
             * Environment variable is 'bt_bricks.debug.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static BTBEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static BTBEnv e;
                return e;
            }
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_ENV_HPP_ */
