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

#include "Protocols.hpp"

using namespace bt_bricks;

static const jau::uuid128_t UARTServiceUUID = jau::uuid128_t("6e400001-b5a3-f393-e0a9-e50e24dcca9e");
static const jau::uuid128_t UARTRxUUID      = jau::uuid128_t("6e400002-b5a3-f393-e0a9-e50e24dcca9e");
static const jau::uuid128_t UARTTxUUID      = jau::uuid128_t("6e400003-b5a3-f393-e0a9-e50e24dcca9e");

static const jau::uuid128_t HubServiceUUID  = jau::uuid128_t("00001623-1212-efde-1623-785feabcd123");
static const jau::uuid128_t HubCtrlUUID     = jau::uuid128_t("00001624-1212-efde-1623-785feabcd123");

static const jau::uuid128_t MIDIServiceUUID = jau::uuid128_t("03b80e5a-ede8-4b33-a751-6ce34ec4c700");
static const jau::uuid128_t MIDIIoUUID      = jau::uuid128_t("7772e5db-3868-4112-a1a9-f2669d106bf3");

std::string CharSpec::toString() const noexcept {
    return "CharSpec["+to_string(role)+", uuid "+uuid->toUUID128String()+", props "+to_string(properties)+
           ", required "+std::to_string(required)+"]";
}

const CharSpec* ProtocolConfig::findChar(const CharRole role) const noexcept {
    for(const CharSpec& c : chars) {
        if( role == c.role ) {
            return &c;
        }
    }
    return nullptr;
}

const CharSpec* ProtocolConfig::findChar(const jau::uuid_t& uuid) const noexcept {
    for(const CharSpec& c : chars) {
        if( c.uuid->equivalent(uuid) ) {
            return &c;
        }
    }
    return nullptr;
}

jau::darray<GattCharDecl> ProtocolConfig::getCharDecls() const noexcept {
    jau::darray<GattCharDecl> res;
    for(const CharSpec& c : chars) {
        res.push_back( GattCharDecl { c.uuid, c.properties } );
    }
    return res;
}

std::string ProtocolConfig::toString() const noexcept {
    std::string cs;
    for(const CharSpec& c : chars) {
        cs.append(", "+c.toString());
    }
    return "Protocol["+to_string(tag)+", service "+service_uuid->toUUID128String()+", match_name "+std::to_string(match_name)+cs+"]";
}

std::shared_ptr<const jau::uuid_t> UARTService::serviceUUID() noexcept { return std::make_shared<const jau::uuid128_t>(UARTServiceUUID); }
std::shared_ptr<const jau::uuid_t> UARTService::rxUUID() noexcept { return std::make_shared<const jau::uuid128_t>(UARTRxUUID); }
std::shared_ptr<const jau::uuid_t> UARTService::txUUID() noexcept { return std::make_shared<const jau::uuid128_t>(UARTTxUUID); }

ProtocolConfig UARTService::centralConfig() noexcept {
    ProtocolConfig c { ProtocolTag::UART, serviceUUID(), jau::darray<CharSpec>(), true };
    c.chars.push_back( CharSpec { CharRole::RX, rxUUID(), GattCharProps::WriteNoAck | GattCharProps::WriteWithAck, true } );
    c.chars.push_back( CharSpec { CharRole::TX, txUUID(), GattCharProps::Notify, true } );
    return c;
}

ProtocolConfig UARTService::peripheralConfig() noexcept {
    // same layout, the central writes RX and we notify TX
    ProtocolConfig c = centralConfig();
    c.match_name = false;
    return c;
}

std::shared_ptr<const jau::uuid_t> HubService::serviceUUID() noexcept { return std::make_shared<const jau::uuid128_t>(HubServiceUUID); }
std::shared_ptr<const jau::uuid_t> HubService::ctrlUUID() noexcept { return std::make_shared<const jau::uuid128_t>(HubCtrlUUID); }

ProtocolConfig HubService::centralConfig() noexcept {
    ProtocolConfig c { ProtocolTag::HUB, serviceUUID(), jau::darray<CharSpec>(), false };
    c.chars.push_back( CharSpec { CharRole::CTRL, ctrlUUID(),
                                  GattCharProps::WriteNoAck | GattCharProps::WriteWithAck | GattCharProps::Notify, true } );
    return c;
}

std::shared_ptr<const jau::uuid_t> MIDIService::serviceUUID() noexcept { return std::make_shared<const jau::uuid128_t>(MIDIServiceUUID); }
std::shared_ptr<const jau::uuid_t> MIDIService::ioUUID() noexcept { return std::make_shared<const jau::uuid128_t>(MIDIIoUUID); }

ProtocolConfig MIDIService::peripheralConfig() noexcept {
    ProtocolConfig c { ProtocolTag::MIDI, serviceUUID(), jau::darray<CharSpec>(), false };
    c.chars.push_back( CharSpec { CharRole::MIDI, ioUUID(),
                                  GattCharProps::Read | GattCharProps::WriteNoAck | GattCharProps::Notify, true } );
    return c;
}
