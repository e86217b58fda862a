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

#ifndef BT_BRICKS_TYPES_HPP_
#define BT_BRICKS_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/int_types.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * BTBTypes.hpp Module for common bt_bricks types:
 *
 * - BTBException
 * - BTBStatusCode incl. std::error_code integration
 * - BTRole, ConnState, ProtocolTag, CharRole
 * - GattCharProps
 *
 */
namespace bt_bricks {

    /** \addtogroup BTBCommon
     *
     *  @{
     */

    class BTBException : public jau::RuntimeException {
        public:
        BTBException(std::string const m, const char* file, int line) noexcept
        : RuntimeException("BTBException", m, file, line) {}

        BTBException(const char *m, const char* file, int line) noexcept
        : RuntimeException("BTBException", m, file, line) {}
    };

    /** Connection handle value of a context not yet bound to a radio connection. */
    inline constexpr const uint16_t INVALID_CONN_HANDLE = 0xffff;

    /**
     * Outcome of all bt_bricks operations.
     *
     * Radio-control failures are never passed through raw,
     * they are mapped to RADIO_ERROR.
     */
    enum class BTBStatusCode : uint8_t {
        SUCCESS             = 0x00,
        /** A scan session is already active. */
        ALREADY_SCANNING    = 0x01,
        /** Scan completed without a match, or no live context for the given handle. */
        NOT_FOUND           = 0x02,
        /** Connect attempt exceeded its configured bound. */
        CONNECT_TIMEOUT     = 0x03,
        /** Required service or characteristic role missing at the peer. */
        INCOMPLETE_SERVICE  = 0x04,
        /** Encoded advertising payload exceeds the maximum advertising length. */
        PAYLOAD_TOO_LARGE   = 0x05,
        /** Radio event of unknown kind, logged and dropped. */
        UNKNOWN_EVENT       = 0x06,
        /** Repeated teardown of an already torn down handle, logged and ignored. */
        DOUBLE_TEARDOWN     = 0x07,
        /** Operation refused in current state, e.g. connect while connecting. */
        BUSY                = 0x08,
        NOT_CONNECTED       = 0x09,
        /** Connection dropped before reaching READY. */
        CONNECTION_LOST     = 0x0A,
        /** Radio-control command failed. */
        RADIO_ERROR         = 0x0B,
        INVALID_PARAMS      = 0x0C,
        CONNECTION_LIMIT    = 0x0D,
        INTERNAL_FAILURE    = 0xfe,
        UNKNOWN             = 0xff
    };
    constexpr uint8_t number(const BTBStatusCode rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BTBStatusCode ec) noexcept;

    class BTBStatusCodeCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "BTB"; }
            std::string message(int condition) const override {
                return "BTB::"+to_string( static_cast<BTBStatusCode>(condition) );
            }
            static BTBStatusCodeCategory& get() {
                static BTBStatusCodeCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( BTBStatusCode e ) noexcept {
      return std::error_code( number(e), BTBStatusCodeCategory::get() );
    }

    /**
     * Link layer role of the local device for one connection.
     */
    enum class BTRole : uint8_t {
        /** Undefined role. */
        None       = 0,
        /** Central role, discovering remote devices and initiating connection. */
        Central    = 1,
        /** Peripheral role, advertising and waiting for connections to accept. */
        Peripheral = 2
    };
    constexpr uint8_t number(const BTRole rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BTRole v) noexcept;

    /**
     * Connection state, shared by all protocol connection managers.
     *
     * Values are ordered, a context only advances to a higher state.
     * Peripheral connections skip SCANNING, CONNECTING and both discovery states.
     */
    enum class ConnState : uint8_t {
        IDLE                        = 0,
        SCANNING                    = 1,
        CONNECTING                  = 2,
        DISCOVERING_SERVICES        = 3,
        DISCOVERING_CHARACTERISTICS = 4,
        READY                       = 5,
        DISCONNECTING               = 6,
        /** Terminal, a fresh connect starts a new context. */
        CLOSED                      = 7
    };
    constexpr uint8_t number(const ConnState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr bool operator <(const ConnState lhs, const ConnState rhs) noexcept {
        return number(lhs) < number(rhs);
    }
    constexpr bool operator <=(const ConnState lhs, const ConnState rhs) noexcept {
        return number(lhs) <= number(rhs);
    }
    std::string to_string(const ConnState v) noexcept;

    /** Wire protocol served by a connection manager. */
    enum class ProtocolTag : uint8_t {
        NONE  = 0,
        /** UART-like data stream, Nordic UART service */
        UART  = 1,
        /** Vendor hub control protocol */
        HUB   = 2,
        /** MIDI over BLE */
        MIDI  = 3
    };
    constexpr uint8_t number(const ProtocolTag rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ProtocolTag v) noexcept;

    /**
     * Role of a characteristic within a protocol's service.
     *
     * RX and TX are named from the server's perspective:
     * the client writes to RX and receives notifications on TX.
     */
    enum class CharRole : uint8_t {
        RX    = 0,
        TX    = 1,
        CTRL  = 2,
        MIDI  = 3
    };
    constexpr uint8_t number(const CharRole rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Number of CharRole values, sizing per-role tables. */
    inline constexpr const jau::nsize_t CHAR_ROLE_COUNT = 4;

    std::string to_string(const CharRole v) noexcept;

    /**
     * GATT characteristic property bits, as declared by a server
     * and reported by characteristic discovery.
     */
    enum class GattCharProps : uint8_t {
        NONE            = 0,
        Broadcast       = (1 << 0),
        Read            = (1 << 1),
        WriteNoAck      = (1 << 2),
        WriteWithAck    = (1 << 3),
        Notify          = (1 << 4),
        Indicate        = (1 << 5),
        AuthSignedWrite = (1 << 6),
        ExtProps        = (1 << 7)
    };
    constexpr uint8_t number(const GattCharProps rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr GattCharProps operator |(const GattCharProps lhs, const GattCharProps rhs) noexcept {
        return static_cast<GattCharProps> ( number(lhs) | number(rhs) );
    }
    constexpr GattCharProps operator &(const GattCharProps lhs, const GattCharProps rhs) noexcept {
        return static_cast<GattCharProps> ( number(lhs) & number(rhs) );
    }
    constexpr bool has_any(const GattCharProps mask, const GattCharProps bits) noexcept {
        return GattCharProps::NONE != ( mask & bits );
    }
    std::string to_string(const GattCharProps mask) noexcept;

    /**@}*/

} // namespace bt_bricks

namespace std
{
    /** \addtogroup BTBCommon
     *
     *  @{
     */

    template <>
    struct is_error_code_enum<bt_bricks::BTBStatusCode> : true_type {};

    /**@}*/
}

#endif /* BT_BRICKS_TYPES_HPP_ */
