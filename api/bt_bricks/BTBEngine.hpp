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

#ifndef BT_BRICKS_ENGINE_HPP_
#define BT_BRICKS_ENGINE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>

#include "BTBTypes.hpp"
#include "BTBEnv.hpp"
#include "RadioEvent.hpp"
#include "RadioControl.hpp"
#include "CallbackRegistry.hpp"
#include "ConnectionTable.hpp"
#include "DiscoveryEngine.hpp"
#include "EventRouter.hpp"
#include "ConnectionManager.hpp"

namespace bt_bricks {

    /**
     * Connection and event correlation engine of one radio.
     *
     * Owns the CallbackRegistry, ConnectionTable, DiscoveryEngine and EventRouter
     * and correlates system and GATT events with the ConnectionManager owning the connection.
     *
     * The radio subsystem delivers all its events via sendEvent().
     *
     * An incoming central connection is owned by the first advertising PeripheralConnectionManager
     * and served by all started ones, i.e. writes route to the manager registering the written value handle.
     *
     * Attached managers are not owned and must outlive their attachment, see detach().
     *
     * Single threaded use only.
     */
    class BTBEngine {
        private:
            const BTBEnv & env;
            RadioControl & radio;
            CallbackRegistry registry;
            ConnectionTable table;
            DiscoveryEngine discovery;
            EventRouter router;
            jau::darray<ConnectionManager*> managers;

            bool isAttached(const ConnectionManager * mgr) const noexcept;

            void contextClosed(const ConnectionContextRef& ctx, const uint8_t reason) noexcept;

            void systemEvent(const RadioEvent& e) noexcept;
            void gattClientEvent(const RadioEvent& e) noexcept;
            void gattServerEvent(const RadioEvent& e) noexcept;

            void peripheralConnected(const RadioEvtConnected& e) noexcept;
            void centralConnected(const RadioEvtConnected& e) noexcept;

        public:
            BTBEngine(RadioControl & radio_);

            ~BTBEngine() noexcept;

            BTBEngine(const BTBEngine&) = delete;
            void operator=(const BTBEngine&) = delete;

            RadioControl & getRadio() noexcept { return radio; }
            CallbackRegistry & getRegistry() noexcept { return registry; }
            ConnectionTable & getTable() noexcept { return table; }
            DiscoveryEngine & getDiscovery() noexcept { return discovery; }
            EventRouter & getRouter() noexcept { return router; }

            /**
             * Attaches the given manager, which must have been created with this instance's
             * RadioControl and ConnectionTable.
             * @return true if attached, false if already attached
             * @throws jau::IllegalArgumentException if the manager has been created with a foreign table
             */
            bool attach(ConnectionManager & mgr);

            /**
             * Detaches the given manager, tearing down all its live connections.
             * @return true if detached
             */
            bool detach(ConnectionManager & mgr) noexcept;

            jau::nsize_t getManagerCount() const noexcept { return managers.size(); }

            /** Typed event entry point, see EventRouter::sendEvent(std::unique_ptr<RadioEvent>) */
            BTBStatusCode sendEvent(std::unique_ptr<RadioEvent> event) noexcept {
                return router.sendEvent(std::move(event));
            }

            /** Raw event entry point, see EventRouter::sendEvent(const uint8_t*, const jau::nsize_t) */
            BTBStatusCode sendEvent(const uint8_t * buffer, const jau::nsize_t buffer_size) noexcept {
                return router.sendEvent(buffer, buffer_size);
            }

            /**
             * Cooperative timeout processing of all attached managers.
             * @param now current monotonic time in milliseconds, see jau::getCurrentMilliseconds()
             */
            void checkTimeouts(const uint64_t now) noexcept;

            /** Cooperative timeout processing using jau::getCurrentMilliseconds() */
            void checkTimeouts() noexcept;

            std::string toString() const noexcept;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_ENGINE_HPP_ */
