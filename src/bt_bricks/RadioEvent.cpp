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

#include "RadioEvent.hpp"

using namespace bt_bricks;

std::string bt_bricks::to_string(const EventClass v) noexcept {
    switch(v) {
        case EventClass::NONE: return "NONE";
        case EventClass::SCAN: return "SCAN";
        case EventClass::GATT_CLIENT: return "GATT_CLIENT";
        case EventClass::GATT_SERVER: return "GATT_SERVER";
        case EventClass::SYSTEM: return "SYSTEM";
    }
    return "Unknown EventClass";
}

#define RADIO_EVENT_ENUM(X) \
    X(INVALID) \
    X(CENTRAL_CONNECT) \
    X(CENTRAL_DISCONNECT) \
    X(GATTS_WRITE) \
    X(SCAN_RESULT) \
    X(SCAN_DONE) \
    X(PERIPHERAL_CONNECT) \
    X(PERIPHERAL_DISCONNECT) \
    X(GATTC_SERVICE_RESULT) \
    X(GATTC_SERVICE_DONE) \
    X(GATTC_CHARACTERISTIC_RESULT) \
    X(GATTC_CHARACTERISTIC_DONE) \
    X(GATTC_WRITE_DONE) \
    X(GATTC_NOTIFY) \
    X(MTU_EXCHANGED)

#define RADIO_EVENT_CASE_TO_STRING(V) case Opcode::V: return #V;

std::string RadioEvent::getOpcodeString(const Opcode opc) noexcept {
    switch(opc) {
        RADIO_EVENT_ENUM(RADIO_EVENT_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown Opcode "+jau::to_hexstring(number(opc));
}

EventClass RadioEvent::getEventClass(const Opcode opc) noexcept {
    switch(opc) {
        case Opcode::SCAN_RESULT:
            [[fallthrough]];
        case Opcode::SCAN_DONE:
            return EventClass::SCAN;

        case Opcode::GATTC_SERVICE_RESULT:
            [[fallthrough]];
        case Opcode::GATTC_SERVICE_DONE:
            [[fallthrough]];
        case Opcode::GATTC_CHARACTERISTIC_RESULT:
            [[fallthrough]];
        case Opcode::GATTC_CHARACTERISTIC_DONE:
            [[fallthrough]];
        case Opcode::GATTC_WRITE_DONE:
            [[fallthrough]];
        case Opcode::GATTC_NOTIFY:
            return EventClass::GATT_CLIENT;

        case Opcode::GATTS_WRITE:
            return EventClass::GATT_SERVER;

        case Opcode::CENTRAL_CONNECT:
            [[fallthrough]];
        case Opcode::CENTRAL_DISCONNECT:
            [[fallthrough]];
        case Opcode::PERIPHERAL_CONNECT:
            [[fallthrough]];
        case Opcode::PERIPHERAL_DISCONNECT:
            [[fallthrough]];
        case Opcode::MTU_EXCHANGED:
            return EventClass::SYSTEM;

        default:
            return EventClass::NONE;
    }
}

void RadioEvent::checkOpcode(const Opcode has, const Opcode exp)
{
    if( has != exp ) {
        throw RadioEventException("Has opcode "+jau::to_hexstring(number(has))+
                         ", not matching "+jau::to_hexstring(number(exp)), E_FILE_LINE);
    }
}

void RadioEvent::checkOpcode(const Opcode has, const Opcode exp1, const Opcode exp2)
{
    if( has != exp1 && has != exp2 ) {
        throw RadioEventException("Has opcode "+jau::to_hexstring(number(has))+
                         ", not matching "+jau::to_hexstring(number(exp1))+" or "+jau::to_hexstring(number(exp2)), E_FILE_LINE);
    }
}

RadioEvent::RadioEvent(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size)
: pdu(buffer, buffer_len, jau::lb_endian::little),
  ts_creation(jau::getCurrentMilliseconds())
{
    if( HEADER_SIZE > buffer_len ) {
        throw jau::IndexOutOfBoundsException(HEADER_SIZE, buffer_len, E_FILE_LINE);
    }
    const jau::nsize_t paramSize = getParamSize();
    if( HEADER_SIZE+paramSize > buffer_len ) {
        throw jau::IndexOutOfBoundsException(HEADER_SIZE+paramSize, buffer_len, E_FILE_LINE);
    }
    if( exp_param_size > paramSize ) {
        throw jau::IndexOutOfBoundsException(exp_param_size, paramSize, E_FILE_LINE);
    }
}

RadioEvent::RadioEvent(const Opcode opc, const jau::nsize_t param_size)
: pdu(HEADER_SIZE+param_size, jau::lb_endian::little),
  ts_creation(jau::getCurrentMilliseconds())
{
    if( 0xffff < param_size ) {
        throw jau::IllegalArgumentException("param_size "+std::to_string(param_size)+" > 0xffff", E_FILE_LINE);
    }
    pdu.put_uint16_nc(0, number(opc));
    pdu.put_uint16_nc(2, static_cast<uint16_t>(param_size));
}

static void checkUUIDSize(const jau::nsize_t uuid_sz) {
    if( 2 != uuid_sz && 4 != uuid_sz && 16 != uuid_sz ) {
        throw RadioEventException("Invalid UUID size "+std::to_string(uuid_sz), E_FILE_LINE);
    }
}

RadioEvtServiceResult::RadioEvtServiceResult(const uint8_t* buffer, const jau::nsize_t buffer_len)
: RadioEvtConnMeta(buffer, buffer_len, 2+2+2)
{
    checkOpcode(getOpcode(), Opcode::GATTC_SERVICE_RESULT);
    checkUUIDSize(getParamSize()-6);
}

RadioEvtServiceResult::RadioEvtServiceResult(const uint16_t handle, const uint16_t start_handle, const uint16_t end_handle, const jau::uuid_t& uuid)
: RadioEvtConnMeta(Opcode::GATTC_SERVICE_RESULT, handle, 2+2+uuid.getTypeSizeInt())
{
    pdu.put_uint16_nc(HEADER_SIZE+2, start_handle);
    pdu.put_uint16_nc(HEADER_SIZE+4, end_handle);
    uuid.put(pdu.get_wptr_nc(HEADER_SIZE+6), jau::lb_endian::little);
}

RadioEvtCharResult::RadioEvtCharResult(const uint8_t* buffer, const jau::nsize_t buffer_len)
: RadioEvtConnMeta(buffer, buffer_len, 2+2+1+2)
{
    checkOpcode(getOpcode(), Opcode::GATTC_CHARACTERISTIC_RESULT);
    checkUUIDSize(getParamSize()-7);
}

RadioEvtCharResult::RadioEvtCharResult(const uint16_t handle, const uint16_t def_handle, const uint16_t value_handle,
                                       const uint8_t properties, const jau::uuid_t& uuid)
: RadioEvtConnMeta(Opcode::GATTC_CHARACTERISTIC_RESULT, handle, 2+2+1+uuid.getTypeSizeInt())
{
    pdu.put_uint16_nc(HEADER_SIZE+2, def_handle);
    pdu.put_uint16_nc(HEADER_SIZE+4, value_handle);
    pdu.put_uint8_nc(HEADER_SIZE+6, properties);
    uuid.put(pdu.get_wptr_nc(HEADER_SIZE+7), jau::lb_endian::little);
}

std::unique_ptr<RadioEvent> RadioEvent::getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size) {
    if( nullptr == buffer || HEADER_SIZE > buffer_size ) {
        throw jau::IndexOutOfBoundsException(HEADER_SIZE, buffer_size, E_FILE_LINE);
    }
    const RadioEvent::Opcode opc = getOpcode(buffer);
    switch( opc ) {
        case Opcode::CENTRAL_CONNECT:
            [[fallthrough]];
        case Opcode::PERIPHERAL_CONNECT:
            return std::make_unique<RadioEvtConnected>(buffer, buffer_size);
        case Opcode::CENTRAL_DISCONNECT:
            [[fallthrough]];
        case Opcode::PERIPHERAL_DISCONNECT:
            return std::make_unique<RadioEvtDisconnected>(buffer, buffer_size);
        case Opcode::GATTS_WRITE:
            return std::make_unique<RadioEvtGattsWrite>(buffer, buffer_size);
        case Opcode::SCAN_RESULT:
            return std::make_unique<RadioEvtScanResult>(buffer, buffer_size);
        case Opcode::SCAN_DONE:
            return std::make_unique<RadioEvtScanDone>(buffer, buffer_size);
        case Opcode::GATTC_SERVICE_RESULT:
            return std::make_unique<RadioEvtServiceResult>(buffer, buffer_size);
        case Opcode::GATTC_SERVICE_DONE:
            [[fallthrough]];
        case Opcode::GATTC_CHARACTERISTIC_DONE:
            return std::make_unique<RadioEvtDiscoveryDone>(buffer, buffer_size);
        case Opcode::GATTC_CHARACTERISTIC_RESULT:
            return std::make_unique<RadioEvtCharResult>(buffer, buffer_size);
        case Opcode::GATTC_WRITE_DONE:
            return std::make_unique<RadioEvtWriteDone>(buffer, buffer_size);
        case Opcode::GATTC_NOTIFY:
            return std::make_unique<RadioEvtNotify>(buffer, buffer_size);
        case Opcode::MTU_EXCHANGED:
            return std::make_unique<RadioEvtMtuExchanged>(buffer, buffer_size);
        default:
            return std::make_unique<RadioEvent>(buffer, buffer_size, 0);
    }
}
