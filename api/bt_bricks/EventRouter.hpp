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

#ifndef BT_BRICKS_EVENT_ROUTER_HPP_
#define BT_BRICKS_EVENT_ROUTER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <array>
#include <deque>

#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "BTBTypes.hpp"
#include "BTBEnv.hpp"
#include "RadioEvent.hpp"

namespace bt_bricks {

    /**
     * Radio event callback, registered per EventClass.
     *
     * The event reference is only valid during the callback.
     */
    typedef jau::function<void(const RadioEvent&)> RadioEventCallback;
    typedef jau::darray<RadioEventCallback> RadioEventCallbackList;

    /**
     * Single entry point of all radio events.
     *
     * Each event is classified by its RadioEvent::getEventClass()
     * and forwarded to all callbacks registered for its class.
     *
     * Events are dispatched strictly in arrival order, one at a time.
     * An event submitted while a dispatch is running, e.g. by a RadioControl
     * completing a command synchronously within the callback, is queued
     * and dispatched after the current one completed.
     *
     * Events of EventClass::NONE are logged and dropped.
     *
     * Single threaded use only.
     */
    class EventRouter {
        private:
            const BTBEnv & env;
            std::array<RadioEventCallbackList, EVENT_CLASS_COUNT> callbackLists;
            std::deque<std::unique_ptr<RadioEvent>> pending;
            bool dispatching;
            uint64_t dispatchedCount;
            uint64_t droppedCount;

            BTBStatusCode dispatch(const RadioEvent & event) noexcept;

        public:
            EventRouter() noexcept;

            EventRouter(const EventRouter&) = delete;
            void operator=(const EventRouter&) = delete;

            /**
             * Appends the given callback for the given EventClass.
             * @throws jau::IllegalArgumentException for EventClass::NONE or a null callback
             */
            void addEventCallback(const EventClass ec, const RadioEventCallback & cb);

            /**
             * Removes all callbacks of the given EventClass equal to the given one.
             * @return number of removed callbacks
             */
            jau::nsize_t removeEventCallback(const EventClass ec, const RadioEventCallback & cb) noexcept;

            jau::nsize_t getEventCallbackCount(const EventClass ec) const noexcept;

            /**
             * Dispatches the given event, or queues it if a dispatch is in progress.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::UNKNOWN_EVENT if the event has been dropped
             */
            BTBStatusCode sendEvent(std::unique_ptr<RadioEvent> event) noexcept;

            /**
             * Decodes the given raw radio event packet and dispatches it, see sendEvent(std::unique_ptr<RadioEvent>).
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::UNKNOWN_EVENT if the event has been dropped
             *         or BTBStatusCode::INVALID_PARAMS for a malformed packet, which is dropped as well.
             */
            BTBStatusCode sendEvent(const uint8_t * buffer, const jau::nsize_t buffer_size) noexcept;

            bool isDispatching() const noexcept { return dispatching; }

            uint64_t getDispatchedCount() const noexcept { return dispatchedCount; }
            uint64_t getDroppedCount() const noexcept { return droppedCount; }

            std::string toString() const noexcept;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_EVENT_ROUTER_HPP_ */
