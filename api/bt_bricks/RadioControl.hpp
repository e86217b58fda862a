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

#ifndef BT_BRICKS_RADIO_CONTROL_HPP_
#define BT_BRICKS_RADIO_CONTROL_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "BTBTypes.hpp"
#include "BTAddress.hpp"

namespace bt_bricks {

    /**
     * Characteristic declaration of a local GATT service,
     * registered in peripheral role.
     */
    struct GattCharDecl {
        std::shared_ptr<const jau::uuid_t> uuid;
        GattCharProps properties;

        std::string toString() const noexcept {
            return "CharDecl[uuid "+uuid->toUUID128String()+", props "+to_string(properties)+"]";
        }
    };

    /**
     * Command interface towards the radio subsystem.
     *
     * All commands are asynchronous, their results are delivered as radio events
     * via EventRouter::sendEvent().
     * An implementation may deliver resulting events synchronously within the command call.
     *
     * A returned status other than BTBStatusCode::SUCCESS denotes a refused command,
     * implementations map their native error codes to BTBStatusCode::RADIO_ERROR
     * unless a more specific code applies.
     */
    class RadioControl {
        public:
            virtual ~RadioControl() noexcept {}

            /**
             * Start scanning for advertising peers.
             * @param duration_ms scan duration, after which RadioEvtScanDone is delivered
             */
            virtual BTBStatusCode startScan(const int32_t duration_ms) noexcept = 0;

            /** Stop scanning, RadioEvtScanDone is delivered. */
            virtual BTBStatusCode stopScan() noexcept = 0;

            /** Connect to the given peer in central role, RadioEvtConnected with Opcode::PERIPHERAL_CONNECT follows. */
            virtual BTBStatusCode connect(const BDAddressAndType& peer) noexcept = 0;

            /** Cancel a pending connect() */
            virtual BTBStatusCode cancelConnect() noexcept = 0;

            virtual BTBStatusCode disconnect(const uint16_t conn_handle) noexcept = 0;

            /** Discover the peer's primary service of the given UUID. */
            virtual BTBStatusCode discoverServices(const uint16_t conn_handle, const jau::uuid_t& service_uuid) noexcept = 0;

            /** Discover all characteristics within the given attribute handle range. */
            virtual BTBStatusCode discoverCharacteristics(const uint16_t conn_handle,
                                                          const uint16_t start_handle, const uint16_t end_handle) noexcept = 0;

            /** Write the peer's attribute value, RadioEvtWriteDone follows if with_response. */
            virtual BTBStatusCode gattcWrite(const uint16_t conn_handle, const uint16_t value_handle,
                                             const jau::TROOctets& value, const bool with_response) noexcept = 0;

            /** Notify the peer about a local attribute value. */
            virtual BTBStatusCode gattsNotify(const uint16_t conn_handle, const uint16_t value_handle,
                                              const jau::TROOctets& value) noexcept = 0;

            /** Request an MTU exchange, RadioEvtMtuExchanged follows. */
            virtual BTBStatusCode exchangeMTU(const uint16_t conn_handle, const uint16_t mtu) noexcept = 0;

            /**
             * Register a local GATT service.
             * @param service_uuid service UUID
             * @param chars characteristic declarations
             * @param value_handles receives the value handle per declaration, in declaration order
             */
            virtual BTBStatusCode registerService(const jau::uuid_t& service_uuid,
                                                  const jau::darray<GattCharDecl>& chars,
                                                  jau::darray<uint16_t>& value_handles) noexcept = 0;

            /**
             * Start connectable undirected advertising.
             * @param interval_us advertising interval
             * @param adv_data encoded advertising payload, see AdvPayload::encode()
             */
            virtual BTBStatusCode startAdvertising(const int32_t interval_us, const jau::TROOctets& adv_data) noexcept = 0;

            virtual BTBStatusCode stopAdvertising() noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_RADIO_CONTROL_HPP_ */
