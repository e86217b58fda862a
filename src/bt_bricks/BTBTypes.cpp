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
#include <cstdint>

#include <jau/debug.hpp>

#include "BTBTypes.hpp"

using namespace bt_bricks;

#define BTB_STATUS_CODE(X) \
        X(SUCCESS) \
        X(ALREADY_SCANNING) \
        X(NOT_FOUND) \
        X(CONNECT_TIMEOUT) \
        X(INCOMPLETE_SERVICE) \
        X(PAYLOAD_TOO_LARGE) \
        X(UNKNOWN_EVENT) \
        X(DOUBLE_TEARDOWN) \
        X(BUSY) \
        X(NOT_CONNECTED) \
        X(CONNECTION_LOST) \
        X(RADIO_ERROR) \
        X(INVALID_PARAMS) \
        X(CONNECTION_LIMIT) \
        X(INTERNAL_FAILURE) \
        X(UNKNOWN)

#define BTB_STATUS_CODE_CASE_TO_STRING(V) case BTBStatusCode::V: return #V;

std::string bt_bricks::to_string(const BTBStatusCode ec) noexcept {
    switch(ec) {
    BTB_STATUS_CODE(BTB_STATUS_CODE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BTBStatusCode";
}

std::string bt_bricks::to_string(const BTRole v) noexcept {
    switch(v) {
        case BTRole::None: return "None";
        case BTRole::Central: return "Central";
        case BTRole::Peripheral: return "Peripheral";
    }
    return "Unknown BTRole";
}

#define CONN_STATE_ENUM(X) \
        X(IDLE) \
        X(SCANNING) \
        X(CONNECTING) \
        X(DISCOVERING_SERVICES) \
        X(DISCOVERING_CHARACTERISTICS) \
        X(READY) \
        X(DISCONNECTING) \
        X(CLOSED)

#define CONN_STATE_CASE_TO_STRING(V) case ConnState::V: return #V;

std::string bt_bricks::to_string(const ConnState v) noexcept {
    switch(v) {
    CONN_STATE_ENUM(CONN_STATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ConnState";
}

std::string bt_bricks::to_string(const ProtocolTag v) noexcept {
    switch(v) {
        case ProtocolTag::NONE: return "NONE";
        case ProtocolTag::UART: return "UART";
        case ProtocolTag::HUB: return "HUB";
        case ProtocolTag::MIDI: return "MIDI";
    }
    return "Unknown ProtocolTag";
}

std::string bt_bricks::to_string(const CharRole v) noexcept {
    switch(v) {
        case CharRole::RX: return "RX";
        case CharRole::TX: return "TX";
        case CharRole::CTRL: return "CTRL";
        case CharRole::MIDI: return "MIDI";
    }
    return "Unknown CharRole";
}

#define CHAR_DECL_PROPS_ENUM(X) \
        X(Broadcast) \
        X(Read) \
        X(WriteNoAck) \
        X(WriteWithAck) \
        X(Notify) \
        X(Indicate) \
        X(AuthSignedWrite) \
        X(ExtProps)

#define CASE_PROP_TO_STRING(V) case GattCharProps::V: return #V;

static std::string _getPropertyBitValStr(const GattCharProps prop) noexcept {
    switch(prop) {
        CHAR_DECL_PROPS_ENUM(CASE_PROP_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown property";
}

std::string bt_bricks::to_string(const GattCharProps mask) noexcept {
    const uint8_t one = 1;
    bool has_pre = false;
    std::string out("[");
    for(int i=0; i<8; i++) {
        const GattCharProps propertyBit = static_cast<GattCharProps>( one << i );
        if( has_any(mask, propertyBit) ) {
            if( has_pre ) { out.append(", "); }
            out.append(_getPropertyBitValStr(propertyBit));
            has_pre = true;
        }
    }
    out.append("]");
    return out;
}
