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
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>

#include <cinttypes>

#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include <bt_bricks/BTBEngine.hpp>

using namespace bt_bricks;
using namespace jau;

/** \file
 * This _btb_replay00_ example feeds recorded raw radio events, one per line as hex bytes,
 * into a BTBEngine driving a UART central and a UART peripheral.
 * Radio commands issued by the managers are printed to stderr.
 */

/**
 * RadioControl accepting all commands, logging them.
 */
class LoggingRadio : public RadioControl {
    private:
        uint16_t next_value_handle = 0x0010;

        static BTBStatusCode log(const std::string& msg) noexcept {
            fprintf_td(stderr, "Radio: %s\n", msg.c_str());
            return BTBStatusCode::SUCCESS;
        }

    public:
        BTBStatusCode startScan(const int32_t duration_ms) noexcept override {
            return log("startScan "+std::to_string(duration_ms)+" ms");
        }
        BTBStatusCode stopScan() noexcept override {
            return log("stopScan");
        }
        BTBStatusCode connect(const BDAddressAndType& peer) noexcept override {
            return log("connect "+peer.toString());
        }
        BTBStatusCode cancelConnect() noexcept override {
            return log("cancelConnect");
        }
        BTBStatusCode disconnect(const uint16_t conn_handle) noexcept override {
            return log("disconnect "+to_hexstring(conn_handle));
        }
        BTBStatusCode discoverServices(const uint16_t conn_handle, const jau::uuid_t& service_uuid) noexcept override {
            return log("discoverServices "+to_hexstring(conn_handle)+", "+service_uuid.toUUID128String());
        }
        BTBStatusCode discoverCharacteristics(const uint16_t conn_handle,
                                              const uint16_t start_handle, const uint16_t end_handle) noexcept override {
            return log("discoverCharacteristics "+to_hexstring(conn_handle)+", ["+to_hexstring(start_handle)+".."+to_hexstring(end_handle)+"]");
        }
        BTBStatusCode gattcWrite(const uint16_t conn_handle, const uint16_t value_handle,
                                 const jau::TROOctets& value, const bool with_response) noexcept override {
            return log("gattcWrite "+to_hexstring(conn_handle)+", "+to_hexstring(value_handle)+", rsp "+std::to_string(with_response)+
                       ", "+value.toString());
        }
        BTBStatusCode gattsNotify(const uint16_t conn_handle, const uint16_t value_handle,
                                  const jau::TROOctets& value) noexcept override {
            return log("gattsNotify "+to_hexstring(conn_handle)+", "+to_hexstring(value_handle)+", "+value.toString());
        }
        BTBStatusCode exchangeMTU(const uint16_t conn_handle, const uint16_t mtu) noexcept override {
            return log("exchangeMTU "+to_hexstring(conn_handle)+", "+std::to_string(mtu));
        }
        BTBStatusCode registerService(const jau::uuid_t& service_uuid,
                                      const jau::darray<GattCharDecl>& chars,
                                      jau::darray<uint16_t>& value_handles) noexcept override {
            value_handles.clear();
            for(const GattCharDecl & c : chars) {
                // declaration, value and descriptor
                value_handles.push_back(next_value_handle);
                log("registerService "+service_uuid.toUUID128String()+": "+c.toString()+" -> "+to_hexstring(next_value_handle));
                next_value_handle += 3;
            }
            return BTBStatusCode::SUCCESS;
        }
        BTBStatusCode startAdvertising(const int32_t interval_us, const jau::TROOctets& adv_data) noexcept override {
            return log("startAdvertising "+std::to_string(interval_us)+" us, "+adv_data.toString());
        }
        BTBStatusCode stopAdvertising() noexcept override {
            return log("stopAdvertising");
        }
        std::string toString() const noexcept override {
            return "LoggingRadio[next_vh "+to_hexstring(next_value_handle)+"]";
        }
};

static std::string central_name = "mpy-uart";
static std::string peripheral_name;

/** Parses whitespace separated hex bytes, returns false on a malformed token. */
static bool parseHexLine(const std::string& line, std::vector<uint8_t>& out) {
    out.clear();
    std::size_t i = 0;
    while( i < line.size() ) {
        while( i < line.size() && ( ' ' == line[i] || '\t' == line[i] ) ) {
            ++i;
        }
        if( i >= line.size() ) {
            break;
        }
        const std::size_t j = line.find_first_of(" \t", i);
        const std::string token = line.substr(i, std::string::npos == j ? std::string::npos : j-i);
        char * end = nullptr;
        const unsigned long v = std::strtoul(token.c_str(), &end, 16);
        if( end == token.c_str() || '\0' != *end || v > 0xff ) {
            return false;
        }
        out.push_back( static_cast<uint8_t>(v) );
        i = std::string::npos == j ? line.size() : j;
    }
    return true;
}

static bool replay(const std::string& fname) {
    std::ifstream in(fname);
    if( !in.is_open() ) {
        fprintf_td(stderr, "Replay: Failed to open %s\n", fname.c_str());
        return false;
    }
    LoggingRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager central(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    PeripheralConnectionManager peripheral(radio, engine.getTable(), UARTService::peripheralConfig());
    engine.attach(central);
    engine.attach(peripheral);

    peripheral.onConnect( ConnectCallback( [](const uint16_t h, const BDAddressAndType& peer) {
        fprintf_td(stderr, "Peripheral: Connected %s, %s\n", to_hexstring(h).c_str(), peer.toString().c_str());
    } ) );
    peripheral.onReceive(CharRole::RX, ReceiveCallback( [&peripheral](const uint16_t h, const jau::TROOctets& v) {
        fprintf_td(stderr, "Peripheral: Received %s: %s\n", to_hexstring(h).c_str(), v.toString().c_str());
        // echo
        const BTBStatusCode res = peripheral.send(CharRole::TX, v);
        if( BTBStatusCode::SUCCESS != res ) {
            fprintf_td(stderr, "Peripheral: Echo failed %s\n", to_string(res).c_str());
        }
    } ) );

    // central callbacks are bound to the READY connection
    BTBStatusCode res = central.connect(central_name, 0, ConnectCompletion( [&central](const BTBStatusCode s, const uint16_t h) {
        fprintf_td(stderr, "Central: Connect %s, handle %s\n", to_string(s).c_str(), to_hexstring(h).c_str());
        if( BTBStatusCode::SUCCESS != s ) {
            return;
        }
        BTBStatusCode r = central.onReceive(CharRole::TX, ReceiveCallback( [](const uint16_t h2, const jau::TROOctets& v) {
            fprintf_td(stderr, "Central: Received %s: %s\n", to_hexstring(h2).c_str(), v.toString().c_str());
        } ) );
        if( BTBStatusCode::SUCCESS == r ) {
            r = central.onDisconnect( DisconnectCallback( [](const uint16_t h2, const uint8_t reason) {
                fprintf_td(stderr, "Central: Disconnected %s, reason %s\n", to_hexstring(h2).c_str(), to_hexstring(reason).c_str());
            } ) );
        }
        if( BTBStatusCode::SUCCESS != r ) {
            fprintf_td(stderr, "Central: Callback registration failed %s\n", to_string(r).c_str());
        }
    } ) );
    fprintf_td(stderr, "Central: connect '%s': %s\n", central_name.c_str(), to_string(res).c_str());
    if( peripheral_name.size() > 0 ) {
        res = peripheral.start(peripheral_name);
        fprintf_td(stderr, "Peripheral: start '%s': %s\n", peripheral_name.c_str(), to_string(res).c_str());
    }

    std::string line;
    std::vector<uint8_t> buffer;
    int lineno = 0;
    while( std::getline(in, line) ) {
        ++lineno;
        if( line.empty() || '#' == line[0] ) {
            continue;
        }
        if( !parseHexLine(line, buffer) ) {
            fprintf_td(stderr, "Replay: %s:%d: Malformed line '%s'\n", fname.c_str(), lineno, line.c_str());
            continue;
        }
        res = engine.sendEvent(buffer.data(), buffer.size());
        fprintf_td(stderr, "Replay: %s:%d: %s\n", fname.c_str(), lineno, to_string(res).c_str());
        engine.checkTimeouts();
    }
    fprintf_td(stderr, "Replay: %s\n", engine.toString().c_str());
    return true;
}

int main(int argc, char *argv[])
{
    std::string fname;

    for(int i=1; i<argc; i++) {
        if( !strcmp("-btb_debug", argv[i]) && argc > (i+1) ) {
            setenv("bt_bricks.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-btb_verbose", argv[i]) && argc > (i+1) ) {
            setenv("bt_bricks.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-central", argv[i]) && argc > (i+1) ) {
            central_name = std::string(argv[++i]);
        } else if( !strcmp("-peripheral", argv[i]) && argc > (i+1) ) {
            peripheral_name = std::string(argv[++i]);
        } else if( !strcmp("-file", argv[i]) && argc > (i+1) ) {
            fname = std::string(argv[++i]);
        }
    }
    fprintf_td(stderr, "Run with '-file <event_log> [-central <name>] [-peripheral <name>] "
                    "[-btb_verbose true|false] "
                    "[-btb_debug true|false|event] "
                    "\n");
    if( fname.empty() ) {
        return 1;
    }
    fprintf_td(stderr, "central %s\n", central_name.c_str());
    fprintf_td(stderr, "peripheral %s\n", peripheral_name.c_str());

    fprintf_td(stderr, "****** REPLAY start\n");
    const bool ok = replay(fname);
    fprintf_td(stderr, "****** REPLAY end\n");
    return ok ? 0 : 1;
}
