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

#ifndef BT_BRICKS_RADIO_EVENT_HPP_
#define BT_BRICKS_RADIO_EVENT_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "BTBTypes.hpp"
#include "BTAddress.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Radio events as delivered by the radio subsystem, one packet per hardware event:
 *
 * <pre>
 *   opcode     : u16
 *   param_size : u16
 *   params     : param_size bytes
 * </pre>
 *
 * All multi-byte values are little endian.
 * Opcode numbering follows the MicroPython ubluetooth IRQ event codes.
 */
namespace bt_bricks {

    class RadioEventException : public BTBException {
        public:
            RadioEventException(std::string const m, const char* file, int line) noexcept
            : BTBException(m, file, line) {}
    };

    /**
     * Class of a radio event, selecting the subsystem owning it.
     */
    enum class EventClass : uint8_t {
        /** Unknown event kind, dropped. */
        NONE        = 0,
        /** Scan results and scan completion, owned by DiscoveryEngine. */
        SCAN        = 1,
        /** GATT client discovery, notifications and write completion. */
        GATT_CLIENT = 2,
        /** GATT server write requests. */
        GATT_SERVER = 3,
        /** Connect, disconnect and MTU exchange. */
        SYSTEM      = 4
    };
    constexpr uint8_t number(const EventClass rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Number of EventClass values, sizing per-class listener tables. */
    inline constexpr const jau::nsize_t EVENT_CLASS_COUNT = 5;

    std::string to_string(const EventClass v) noexcept;

    class RadioEvent
    {
        public:
            enum class Opcode : uint16_t {
                INVALID                      = 0x0000,
                /** A central connected to us, we are in peripheral role. */
                CENTRAL_CONNECT              = 0x0001,
                CENTRAL_DISCONNECT           = 0x0002,
                GATTS_WRITE                  = 0x0003,
                SCAN_RESULT                  = 0x0005,
                SCAN_DONE                    = 0x0006,
                /** We connected to a peripheral, we are in central role. */
                PERIPHERAL_CONNECT           = 0x0007,
                PERIPHERAL_DISCONNECT        = 0x0008,
                GATTC_SERVICE_RESULT         = 0x0009,
                GATTC_SERVICE_DONE           = 0x000A,
                GATTC_CHARACTERISTIC_RESULT  = 0x000B,
                GATTC_CHARACTERISTIC_DONE    = 0x000C,
                GATTC_WRITE_DONE             = 0x0011,
                GATTC_NOTIFY                 = 0x0012,
                MTU_EXCHANGED                = 0x0015
            };
            static constexpr uint16_t number(const Opcode rhs) noexcept {
                return static_cast<uint16_t>(rhs);
            }
            static std::string getOpcodeString(const Opcode opc) noexcept;

            /** Returns the EventClass of the given opcode, EventClass::NONE for an unknown opcode. */
            static EventClass getEventClass(const Opcode opc) noexcept;

            /** Packet header size: opcode and param_size. */
            static constexpr const jau::nsize_t HEADER_SIZE = 4;

        protected:
            jau::POctets pdu;
            uint64_t ts_creation;

            static void checkOpcode(const Opcode has, const Opcode exp);
            static void checkOpcode(const Opcode has, const Opcode exp1, const Opcode exp2);

            virtual std::string baseString() const noexcept {
                return "opcode "+getOpcodeString(getOpcode());
            }
            virtual std::string valueString() const noexcept {
                const jau::nsize_t d_sz = getParamSize();
                const std::string d_str = d_sz > 0 ? jau::bytesHexString(pdu.get_ptr_nc(HEADER_SIZE), 0, d_sz, true /* lsbFirst */) : "";
                return "param[size "+std::to_string(d_sz)+", data "+d_str+"]";
            }

        public:
            static Opcode getOpcode(const uint8_t * buffer) noexcept {
                return static_cast<Opcode>( jau::get_uint16(buffer, jau::lb_endian::little) );
            }

            /**
             * Return a newly created specialized instance pointer to base class.
             *
             * An unknown opcode results in a plain RadioEvent instance.
             *
             * @throws jau::IndexOutOfBoundsException or RadioEventException on malformed buffer
             */
            static std::unique_ptr<RadioEvent> getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size);

            /** Persistent memory, w/ ownership. */
            RadioEvent(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size);

            RadioEvent(const Opcode opc, const jau::nsize_t param_size);

            RadioEvent(const RadioEvent &o) = default;
            RadioEvent(RadioEvent &&o) = default;
            RadioEvent& operator=(const RadioEvent &o) = delete;
            RadioEvent& operator=(RadioEvent &&o) = delete;

            virtual ~RadioEvent() noexcept {}

            uint64_t getTimestamp() const noexcept { return ts_creation; }

            Opcode getOpcode() const noexcept { return static_cast<Opcode>( pdu.get_uint16_nc(0) ); }
            jau::nsize_t getParamSize() const noexcept { return pdu.get_uint16_nc(2); }
            jau::nsize_t getTotalSize() const noexcept { return pdu.size(); }

            EventClass getEventClass() const noexcept { return getEventClass(getOpcode()); }

            const jau::TROOctets & getPDU() const noexcept { return pdu; }

            std::string toString() const noexcept {
                return "RadioEvt["+baseString()+", "+valueString()+"]";
            }
    };

    /**
     * Event meta class for events starting with a connection handle.
     */
    class RadioEvtConnMeta : public RadioEvent
    {
        protected:
            std::string baseString() const noexcept override {
                return RadioEvent::baseString()+", handle "+jau::to_hexstring(getConnHandle());
            }

        public:
            RadioEvtConnMeta(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size)
            : RadioEvent(buffer, buffer_len, 2+exp_param_size) {}

            RadioEvtConnMeta(const Opcode opc, const uint16_t handle, const jau::nsize_t param_size)
            : RadioEvent(opc, 2+param_size)
            {
                pdu.put_uint16_nc(HEADER_SIZE, handle);
            }

            uint16_t getConnHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE); }
    };

    /**
     * CENTRAL_CONNECT or PERIPHERAL_CONNECT
     * <pre>
     * handle:u16, addr_type:u8, addr:6
     * </pre>
     */
    class RadioEvtConnected : public RadioEvtConnMeta
    {
        protected:
            std::string baseString() const noexcept override {
                return RadioEvtConnMeta::baseString()+", address "+getAddressAndType().toString();
            }

        public:
            RadioEvtConnected(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 1+6)
            {
                checkOpcode(getOpcode(), Opcode::CENTRAL_CONNECT, Opcode::PERIPHERAL_CONNECT);
            }

            RadioEvtConnected(const Opcode opc, const uint16_t handle, const BDAddressAndType& addressAndType)
            : RadioEvtConnMeta(opc, handle, 1+6)
            {
                checkOpcode(opc, Opcode::CENTRAL_CONNECT, Opcode::PERIPHERAL_CONNECT);
                pdu.put_uint8_nc(HEADER_SIZE+2, number(addressAndType.type));
                pdu.put_eui48_nc(HEADER_SIZE+3, addressAndType.address);
            }

            /** Returns the local role of this connection. */
            BTRole getRole() const noexcept {
                return Opcode::PERIPHERAL_CONNECT == getOpcode() ? BTRole::Central : BTRole::Peripheral;
            }

            BDAddressAndType getAddressAndType() const noexcept {
                return BDAddressAndType( pdu.get_eui48_nc(HEADER_SIZE+3), to_BDAddressType( pdu.get_uint8_nc(HEADER_SIZE+2) ) );
            }
    };

    /**
     * CENTRAL_DISCONNECT or PERIPHERAL_DISCONNECT
     * <pre>
     * handle:u16, addr_type:u8, addr:6, reason:u8
     * </pre>
     */
    class RadioEvtDisconnected : public RadioEvtConnMeta
    {
        protected:
            std::string baseString() const noexcept override {
                return RadioEvtConnMeta::baseString()+", address "+getAddressAndType().toString()+
                       ", reason "+jau::to_hexstring(getReason());
            }

        public:
            RadioEvtDisconnected(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 1+6+1)
            {
                checkOpcode(getOpcode(), Opcode::CENTRAL_DISCONNECT, Opcode::PERIPHERAL_DISCONNECT);
            }

            RadioEvtDisconnected(const Opcode opc, const uint16_t handle, const BDAddressAndType& addressAndType, const uint8_t reason)
            : RadioEvtConnMeta(opc, handle, 1+6+1)
            {
                checkOpcode(opc, Opcode::CENTRAL_DISCONNECT, Opcode::PERIPHERAL_DISCONNECT);
                pdu.put_uint8_nc(HEADER_SIZE+2, number(addressAndType.type));
                pdu.put_eui48_nc(HEADER_SIZE+3, addressAndType.address);
                pdu.put_uint8_nc(HEADER_SIZE+9, reason);
            }

            BDAddressAndType getAddressAndType() const noexcept {
                return BDAddressAndType( pdu.get_eui48_nc(HEADER_SIZE+3), to_BDAddressType( pdu.get_uint8_nc(HEADER_SIZE+2) ) );
            }

            /** Radio specific disconnect reason code, informational only. */
            uint8_t getReason() const noexcept { return pdu.get_uint8_nc(HEADER_SIZE+9); }
    };

    /**
     * Event meta class for events carrying a connection handle, an attribute value handle and opaque data:
     * GATTS_WRITE and GATTC_NOTIFY.
     * <pre>
     * handle:u16, value_handle:u16, data...
     * </pre>
     */
    class RadioEvtAttrValue : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                const jau::nsize_t d_sz = getValueSize();
                const std::string d_str = d_sz > 0 ? jau::bytesHexString(pdu.get_ptr_nc(HEADER_SIZE+4), 0, d_sz, true /* lsbFirst */) : "";
                return "value_handle "+jau::to_hexstring(getValueHandle())+", value[size "+std::to_string(d_sz)+", data "+d_str+"]";
            }

        public:
            RadioEvtAttrValue(const Opcode opc, const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 2)
            {
                checkOpcode(getOpcode(), opc);
            }

            RadioEvtAttrValue(const Opcode opc, const uint16_t handle, const uint16_t value_handle,
                              const uint8_t* data, const jau::nsize_t data_len)
            : RadioEvtConnMeta(opc, handle, 2+data_len)
            {
                pdu.put_uint16_nc(HEADER_SIZE+2, value_handle);
                if( 0 < data_len ) {
                    pdu.put_bytes_nc(HEADER_SIZE+4, data, data_len);
                }
            }

            uint16_t getValueHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
            jau::nsize_t getValueSize() const noexcept { return getParamSize()-4; }

            /** Returns a non-owning view of the attribute value, valid during this instance's lifetime. */
            jau::TROOctets getValue() const noexcept {
                const jau::nsize_t sz = getValueSize();
                return jau::TROOctets(sz > 0 ? pdu.get_ptr_nc(HEADER_SIZE+4) : nullptr, sz, jau::lb_endian::little);
            }
    };

    class RadioEvtGattsWrite : public RadioEvtAttrValue
    {
        public:
            RadioEvtGattsWrite(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtAttrValue(Opcode::GATTS_WRITE, buffer, buffer_len) {}

            RadioEvtGattsWrite(const uint16_t handle, const uint16_t value_handle, const uint8_t* data, const jau::nsize_t data_len)
            : RadioEvtAttrValue(Opcode::GATTS_WRITE, handle, value_handle, data, data_len) {}
    };

    class RadioEvtNotify : public RadioEvtAttrValue
    {
        public:
            RadioEvtNotify(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtAttrValue(Opcode::GATTC_NOTIFY, buffer, buffer_len) {}

            RadioEvtNotify(const uint16_t handle, const uint16_t value_handle, const uint8_t* data, const jau::nsize_t data_len)
            : RadioEvtAttrValue(Opcode::GATTC_NOTIFY, handle, value_handle, data, data_len) {}
    };

    /**
     * SCAN_RESULT
     * <pre>
     * addr_type:u8, addr:6, adv_type:u8, rssi:i8, adv_data...
     * </pre>
     */
    class RadioEvtScanResult : public RadioEvent
    {
        private:
            static constexpr const jau::nsize_t ADV_DATA_OFFSET = HEADER_SIZE+1+6+1+1;

        protected:
            std::string baseString() const noexcept override {
                return RadioEvent::baseString()+", address "+getAddressAndType().toString()+
                       ", adv_type "+jau::to_hexstring(getAdvType())+", rssi "+std::to_string(getRSSI());
            }
            std::string valueString() const noexcept override {
                const jau::nsize_t d_sz = getAdvDataSize();
                const std::string d_str = d_sz > 0 ? jau::bytesHexString(pdu.get_ptr_nc(ADV_DATA_OFFSET), 0, d_sz, true /* lsbFirst */) : "";
                return "adv_data[size "+std::to_string(d_sz)+", data "+d_str+"]";
            }

        public:
            RadioEvtScanResult(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvent(buffer, buffer_len, 1+6+1+1)
            {
                checkOpcode(getOpcode(), Opcode::SCAN_RESULT);
            }

            RadioEvtScanResult(const BDAddressAndType& addressAndType, const uint8_t adv_type, const int8_t rssi,
                               const uint8_t* adv_data, const jau::nsize_t adv_data_len)
            : RadioEvent(Opcode::SCAN_RESULT, 1+6+1+1+adv_data_len)
            {
                pdu.put_uint8_nc(HEADER_SIZE, number(addressAndType.type));
                pdu.put_eui48_nc(HEADER_SIZE+1, addressAndType.address);
                pdu.put_uint8_nc(HEADER_SIZE+7, adv_type);
                pdu.put_int8_nc(HEADER_SIZE+8, rssi);
                if( 0 < adv_data_len ) {
                    pdu.put_bytes_nc(ADV_DATA_OFFSET, adv_data, adv_data_len);
                }
            }

            BDAddressAndType getAddressAndType() const noexcept {
                return BDAddressAndType( pdu.get_eui48_nc(HEADER_SIZE+1), to_BDAddressType( pdu.get_uint8_nc(HEADER_SIZE) ) );
            }
            uint8_t getAdvType() const noexcept { return pdu.get_uint8_nc(HEADER_SIZE+7); }
            int8_t getRSSI() const noexcept { return pdu.get_int8_nc(HEADER_SIZE+8); }

            jau::nsize_t getAdvDataSize() const noexcept { return getParamSize()-(ADV_DATA_OFFSET-HEADER_SIZE); }
            const uint8_t* getAdvData() const noexcept { return getAdvDataSize() > 0 ? pdu.get_ptr_nc(ADV_DATA_OFFSET) : nullptr; }
    };

    class RadioEvtScanDone : public RadioEvent
    {
        public:
            RadioEvtScanDone(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvent(buffer, buffer_len, 0)
            {
                checkOpcode(getOpcode(), Opcode::SCAN_DONE);
            }

            RadioEvtScanDone()
            : RadioEvent(Opcode::SCAN_DONE, 0) {}
    };

    /**
     * GATTC_SERVICE_RESULT
     * <pre>
     * handle:u16, start_handle:u16, end_handle:u16, uuid (2, 4 or 16 bytes)
     * </pre>
     */
    class RadioEvtServiceResult : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                return "range ["+jau::to_hexstring(getStartHandle())+".."+jau::to_hexstring(getEndHandle())+
                       "], uuid "+getUUID()->toUUID128String();
            }

        public:
            RadioEvtServiceResult(const uint8_t* buffer, const jau::nsize_t buffer_len);

            RadioEvtServiceResult(const uint16_t handle, const uint16_t start_handle, const uint16_t end_handle, const jau::uuid_t& uuid);

            uint16_t getStartHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
            uint16_t getEndHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+4); }

            std::shared_ptr<const jau::uuid_t> getUUID() const {
                return pdu.get_uuid(HEADER_SIZE+6, jau::uuid_t::toTypeSize( static_cast<jau::nsize_t>( getParamSize()-6 ) ) );
            }
    };

    /**
     * GATTC_CHARACTERISTIC_RESULT
     * <pre>
     * handle:u16, def_handle:u16, value_handle:u16, properties:u8, uuid (2, 4 or 16 bytes)
     * </pre>
     */
    class RadioEvtCharResult : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                return "def_handle "+jau::to_hexstring(getDefHandle())+", value_handle "+jau::to_hexstring(getValueHandle())+
                       ", props "+jau::to_hexstring(getProperties())+", uuid "+getUUID()->toUUID128String();
            }

        public:
            RadioEvtCharResult(const uint8_t* buffer, const jau::nsize_t buffer_len);

            RadioEvtCharResult(const uint16_t handle, const uint16_t def_handle, const uint16_t value_handle,
                               const uint8_t properties, const jau::uuid_t& uuid);

            uint16_t getDefHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
            uint16_t getValueHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+4); }
            uint8_t getProperties() const noexcept { return pdu.get_uint8_nc(HEADER_SIZE+6); }

            std::shared_ptr<const jau::uuid_t> getUUID() const {
                return pdu.get_uuid(HEADER_SIZE+7, jau::uuid_t::toTypeSize( static_cast<jau::nsize_t>( getParamSize()-7 ) ) );
            }
    };

    /**
     * GATTC_SERVICE_DONE or GATTC_CHARACTERISTIC_DONE
     * <pre>
     * handle:u16, status:u16
     * </pre>
     */
    class RadioEvtDiscoveryDone : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                return "status "+jau::to_hexstring(getStatus());
            }

        public:
            RadioEvtDiscoveryDone(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 2)
            {
                checkOpcode(getOpcode(), Opcode::GATTC_SERVICE_DONE, Opcode::GATTC_CHARACTERISTIC_DONE);
            }

            RadioEvtDiscoveryDone(const Opcode opc, const uint16_t handle, const uint16_t status)
            : RadioEvtConnMeta(opc, handle, 2)
            {
                checkOpcode(opc, Opcode::GATTC_SERVICE_DONE, Opcode::GATTC_CHARACTERISTIC_DONE);
                pdu.put_uint16_nc(HEADER_SIZE+2, status);
            }

            uint16_t getStatus() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
    };

    /**
     * GATTC_WRITE_DONE
     * <pre>
     * handle:u16, value_handle:u16, status:u16
     * </pre>
     */
    class RadioEvtWriteDone : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                return "value_handle "+jau::to_hexstring(getValueHandle())+", status "+jau::to_hexstring(getStatus());
            }

        public:
            RadioEvtWriteDone(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 4)
            {
                checkOpcode(getOpcode(), Opcode::GATTC_WRITE_DONE);
            }

            RadioEvtWriteDone(const uint16_t handle, const uint16_t value_handle, const uint16_t status)
            : RadioEvtConnMeta(Opcode::GATTC_WRITE_DONE, handle, 4)
            {
                pdu.put_uint16_nc(HEADER_SIZE+2, value_handle);
                pdu.put_uint16_nc(HEADER_SIZE+4, status);
            }

            uint16_t getValueHandle() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
            uint16_t getStatus() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+4); }
    };

    /**
     * MTU_EXCHANGED
     * <pre>
     * handle:u16, mtu:u16
     * </pre>
     */
    class RadioEvtMtuExchanged : public RadioEvtConnMeta
    {
        protected:
            std::string valueString() const noexcept override {
                return "mtu "+std::to_string(getMTU());
            }

        public:
            RadioEvtMtuExchanged(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : RadioEvtConnMeta(buffer, buffer_len, 2)
            {
                checkOpcode(getOpcode(), Opcode::MTU_EXCHANGED);
            }

            RadioEvtMtuExchanged(const uint16_t handle, const uint16_t mtu)
            : RadioEvtConnMeta(Opcode::MTU_EXCHANGED, handle, 2)
            {
                pdu.put_uint16_nc(HEADER_SIZE+2, mtu);
            }

            uint16_t getMTU() const noexcept { return pdu.get_uint16_nc(HEADER_SIZE+2); }
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_RADIO_EVENT_HPP_ */
