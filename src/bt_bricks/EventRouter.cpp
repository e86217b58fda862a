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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "EventRouter.hpp"

using namespace bt_bricks;

EventRouter::EventRouter() noexcept
: env(BTBEnv::get()), callbackLists(), pending(), dispatching(false), dispatchedCount(0), droppedCount(0)
{ }

void EventRouter::addEventCallback(const EventClass ec, const RadioEventCallback & cb) {
    if( EventClass::NONE == ec || EVENT_CLASS_COUNT <= number(ec) ) {
        throw jau::IllegalArgumentException("Invalid event class "+to_string(ec), E_FILE_LINE);
    }
    if( cb.is_null() ) {
        throw jau::IllegalArgumentException("Null callback for event class "+to_string(ec), E_FILE_LINE);
    }
    callbackLists[number(ec)].push_back(cb);
}

jau::nsize_t EventRouter::removeEventCallback(const EventClass ec, const RadioEventCallback & cb) noexcept {
    if( EVENT_CLASS_COUNT <= number(ec) ) {
        return 0;
    }
    RadioEventCallbackList & list = callbackLists[number(ec)];
    jau::nsize_t count = 0;
    for(auto it = list.begin(); it != list.end(); ) {
        if ( *it == cb ) {
            it = list.erase(it);
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

jau::nsize_t EventRouter::getEventCallbackCount(const EventClass ec) const noexcept {
    if( EVENT_CLASS_COUNT <= number(ec) ) {
        return 0;
    }
    return callbackLists[number(ec)].size();
}

BTBStatusCode EventRouter::dispatch(const RadioEvent & event) noexcept {
    const EventClass ec = event.getEventClass();
    if( EventClass::NONE == ec ) {
        droppedCount++;
        WORDY_PRINT("EventRouter::dispatch: %s, dropped %s", to_string(BTBStatusCode::UNKNOWN_EVENT).c_str(), event.toString().c_str());
        return BTBStatusCode::UNKNOWN_EVENT;
    }
    // callbacks may add or remove callbacks
    const RadioEventCallbackList list = callbackLists[number(ec)];
    int invokeCount = 0;
    for(const RadioEventCallback & cb : list) {
        try {
            cb(event);
        } catch (std::exception &e) {
            ERR_PRINT("EventRouter::dispatch %d/%zu: %s: Caught exception %s",
                    invokeCount+1, (size_t)list.size(), event.toString().c_str(), e.what());
        }
        invokeCount++;
    }
    dispatchedCount++;
    COND_PRINT(env.DEBUG_EVENT, "EventRouter::dispatch: %s: Event %s -> %d/%zu callbacks",
            to_string(ec).c_str(), event.toString().c_str(), invokeCount, (size_t)list.size());
    (void)invokeCount;
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode EventRouter::sendEvent(std::unique_ptr<RadioEvent> event) noexcept {
    if( nullptr == event ) {
        return BTBStatusCode::INVALID_PARAMS;
    }
    if( dispatching ) {
        if( EventClass::NONE == event->getEventClass() ) {
            droppedCount++;
            WORDY_PRINT("EventRouter::sendEvent: %s, dropped %s", to_string(BTBStatusCode::UNKNOWN_EVENT).c_str(), event->toString().c_str());
            return BTBStatusCode::UNKNOWN_EVENT;
        }
        COND_PRINT(env.DEBUG_EVENT, "EventRouter::sendEvent: Queued %s, pending %zu", event->toString().c_str(), pending.size()+1);
        pending.push_back( std::move(event) );
        return BTBStatusCode::SUCCESS;
    }
    dispatching = true;
    const BTBStatusCode res = dispatch(*event);
    event = nullptr;
    while( !pending.empty() ) {
        std::unique_ptr<RadioEvent> next = std::move( pending.front() );
        pending.pop_front();
        dispatch(*next);
    }
    dispatching = false;
    return res;
}

BTBStatusCode EventRouter::sendEvent(const uint8_t * buffer, const jau::nsize_t buffer_size) noexcept {
    std::unique_ptr<RadioEvent> event;
    try {
        event = RadioEvent::getSpecialized(buffer, buffer_size);
    } catch (std::exception &e) {
        droppedCount++;
        WARN_PRINT("EventRouter::sendEvent: Dropped malformed event, size %zu: %s",
                (size_t)buffer_size, e.what());
        return BTBStatusCode::INVALID_PARAMS;
    }
    return sendEvent( std::move(event) );
}

std::string EventRouter::toString() const noexcept {
    std::string cbs;
    for(jau::nsize_t i=1; i<EVENT_CLASS_COUNT; ++i) {
        if( 1 < i ) {
            cbs.append(", ");
        }
        cbs.append(to_string(static_cast<EventClass>(i))+" "+std::to_string(callbackLists[i].size()));
    }
    return "EventRouter[callbacks["+cbs+"], dispatched "+std::to_string(dispatchedCount)+
           ", dropped "+std::to_string(droppedCount)+", pending "+std::to_string(pending.size())+"]";
}
