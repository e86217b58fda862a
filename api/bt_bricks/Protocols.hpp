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

#ifndef BT_BRICKS_PROTOCOLS_HPP_
#define BT_BRICKS_PROTOCOLS_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/uuid.hpp>

#include "BTBTypes.hpp"
#include "RadioControl.hpp"

namespace bt_bricks {

    /**
     * Characteristic of a ProtocolConfig.
     */
    struct CharSpec {
        CharRole role;
        std::shared_ptr<const jau::uuid_t> uuid;
        GattCharProps properties;
        /** Central role: connection fails with BTBStatusCode::INCOMPLETE_SERVICE if not discovered. */
        bool required;

        bool isNotifiable() const noexcept { return has_any(properties, GattCharProps::Notify | GattCharProps::Indicate); }
        bool isWritable() const noexcept { return has_any(properties, GattCharProps::WriteNoAck | GattCharProps::WriteWithAck); }

        std::string toString() const noexcept;
    };

    /**
     * Static description of one protocol, driving a ConnectionManager.
     *
     * Central role: the service and characteristics to be discovered.
     * Peripheral role: the local GATT layout to be registered and advertised.
     */
    struct ProtocolConfig {
        ProtocolTag tag;
        std::shared_ptr<const jau::uuid_t> service_uuid;
        jau::darray<CharSpec> chars;
        /** Central role: match the advertised name in addition to the service UUID */
        bool match_name;

        /** Returns the CharSpec of the given role or nullptr */
        const CharSpec* findChar(const CharRole role) const noexcept;

        /** Returns the CharSpec with an equivalent UUID or nullptr */
        const CharSpec* findChar(const jau::uuid_t& uuid) const noexcept;

        /** Returns the local GATT characteristic declarations, in chars order. */
        jau::darray<GattCharDecl> getCharDecls() const noexcept;

        std::string toString() const noexcept;
    };

    /**
     * Nordic UART Service
     */
    namespace UARTService {
        /** 6E400001-B5A3-F393-E0A9-E50E24DCCA9E */
        std::shared_ptr<const jau::uuid_t> serviceUUID() noexcept;
        /** 6E400002-B5A3-F393-E0A9-E50E24DCCA9E, written by the central */
        std::shared_ptr<const jau::uuid_t> rxUUID() noexcept;
        /** 6E400003-B5A3-F393-E0A9-E50E24DCCA9E, notified by the peripheral */
        std::shared_ptr<const jau::uuid_t> txUUID() noexcept;

        ProtocolConfig centralConfig() noexcept;
        ProtocolConfig peripheralConfig() noexcept;
    }

    /**
     * Vendor HUB service, a single control characteristic for commands and notifications.
     */
    namespace HubService {
        /** 00001623-1212-EFDE-1623-785FEABCD123 */
        std::shared_ptr<const jau::uuid_t> serviceUUID() noexcept;
        /** 00001624-1212-EFDE-1623-785FEABCD123 */
        std::shared_ptr<const jau::uuid_t> ctrlUUID() noexcept;

        ProtocolConfig centralConfig() noexcept;
    }

    /**
     * BLE MIDI service
     */
    namespace MIDIService {
        /** 03B80E5A-EDE8-4B33-A751-6CE34EC4C700 */
        std::shared_ptr<const jau::uuid_t> serviceUUID() noexcept;
        /** 7772E5DB-3868-4112-A1A9-F2669D106BF3 */
        std::shared_ptr<const jau::uuid_t> ioUUID() noexcept;

        ProtocolConfig peripheralConfig() noexcept;
    }

} // namespace bt_bricks

#endif /* BT_BRICKS_PROTOCOLS_HPP_ */
