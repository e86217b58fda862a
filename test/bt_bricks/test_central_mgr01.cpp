#include <iostream>
#include <cinttypes>
#include <cstring>
#include <vector>
#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include <jau/basic_types.hpp>

#include <bt_bricks/BTBEngine.hpp>

#include "MockRadio.hpp"

using namespace bt_bricks;
using namespace bt_bricks_test;

struct ConnectOutcome {
    int count = 0;
    BTBStatusCode status = BTBStatusCode::UNKNOWN;
    uint16_t conn_handle = 0;

    ConnectCompletion callback() {
        return ConnectCompletion( [this](const BTBStatusCode s, const uint16_t h) {
            count++;
            status = s;
            conn_handle = h;
        } );
    }
};

// UART peer service layout
static const uint16_t SVC_START = 0x000c;
static const uint16_t SVC_END   = 0x0011;
static const uint16_t RX_VH     = 0x000e;
static const uint16_t TX_VH     = 0x0010;

static void feedScanResult(BTBEngine& engine, const BDAddressAndType& addr, const std::string& name,
                           const std::shared_ptr<const jau::uuid_t>& service) {
    REQUIRE( BTBStatusCode::SUCCESS == engine.sendEvent( makeScanResult(addr, name, service) ) );
}

static void feedConnected(BTBEngine& engine, const uint16_t handle, const BDAddressAndType& addr) {
    REQUIRE( BTBStatusCode::SUCCESS == engine.sendEvent( std::make_unique<RadioEvtConnected>(RadioEvent::Opcode::PERIPHERAL_CONNECT, handle, addr) ) );
}

static void feedDisconnected(BTBEngine& engine, const uint16_t handle, const BDAddressAndType& addr, const uint8_t reason) {
    REQUIRE( BTBStatusCode::SUCCESS == engine.sendEvent( std::make_unique<RadioEvtDisconnected>(RadioEvent::Opcode::PERIPHERAL_DISCONNECT, handle, addr, reason) ) );
}

static void feedUARTService(BTBEngine& engine, const uint16_t handle) {
    engine.sendEvent( std::make_unique<RadioEvtServiceResult>(handle, 0x0001, 0x0005, jau::uuid16_t(0x1800)) );
    engine.sendEvent( std::make_unique<RadioEvtServiceResult>(handle, SVC_START, SVC_END, *UARTService::serviceUUID()) );
    engine.sendEvent( std::make_unique<RadioEvtDiscoveryDone>(RadioEvent::Opcode::GATTC_SERVICE_DONE, handle, 0) );
}

static void feedUARTChars(BTBEngine& engine, const uint16_t handle, const bool with_tx) {
    engine.sendEvent( std::make_unique<RadioEvtCharResult>(handle, RX_VH-1, RX_VH,
            number(GattCharProps::WriteNoAck | GattCharProps::WriteWithAck), *UARTService::rxUUID()) );
    if( with_tx ) {
        engine.sendEvent( std::make_unique<RadioEvtCharResult>(handle, TX_VH-1, TX_VH,
                number(GattCharProps::Notify), *UARTService::txUUID()) );
    }
    engine.sendEvent( std::make_unique<RadioEvtDiscoveryDone>(RadioEvent::Opcode::GATTC_CHARACTERISTIC_DONE, handle, 0) );
}

/** Drives the given UART central manager from IDLE to READY. */
static void connectUART(BTBEngine& engine, MockRadio& radio, CentralConnectionManager& mgr, ConnectOutcome& outcome,
                        const uint16_t handle, const BDAddressAndType& addr) {
    REQUIRE( BTBStatusCode::SUCCESS == mgr.connect("robot", 0, outcome.callback()) );
    feedScanResult(engine, addr, "robot", UARTService::serviceUUID());
    REQUIRE( ConnState::CONNECTING == mgr.getState() );
    feedConnected(engine, handle, addr);
    REQUIRE( ConnState::DISCOVERING_SERVICES == mgr.getState() );
    feedUARTService(engine, handle);
    REQUIRE( ConnState::DISCOVERING_CHARACTERISTICS == mgr.getState() );
    radio.clear();
    feedUARTChars(engine, handle, true);
    REQUIRE( ConnState::READY == mgr.getState() );
}

TEST_CASE( "CentralConnectionManager Test 01 Scan and Connect", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    REQUIRE( true == engine.attach(uart) );
    REQUIRE( false == engine.attach(uart) );
    ConnectOutcome outcome;

    REQUIRE( ConnState::IDLE == uart.getState() );
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
    REQUIRE( ConnState::SCANNING == uart.getState() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::START_SCAN) );
    REQUIRE( std::min(BTBEnv::get().CONNECT_TIMEOUT, BTBEnv::get().SCAN_TIMEOUT) == radio.last(MockRadio::Cmd::START_SCAN)->duration );
    REQUIRE( BTBStatusCode::BUSY == uart.connect("robot", 0, outcome.callback()) );

    feedScanResult(engine, makeAddress(0x01), "other", UARTService::serviceUUID());
    REQUIRE( ConnState::SCANNING == uart.getState() );
    feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());

    REQUIRE( ConnState::CONNECTING == uart.getState() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::STOP_SCAN) );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::CONNECT) );
    REQUIRE( makeAddress(0x02) == radio.last(MockRadio::Cmd::CONNECT)->peer );
    REQUIRE( "robot" == uart.getPeerName() );
    REQUIRE( INVALID_CONN_HANDLE == uart.getConnHandle() );
    REQUIRE( 0 == outcome.count );

    feedConnected(engine, 0x0040, makeAddress(0x02));
    REQUIRE( ConnState::DISCOVERING_SERVICES == uart.getState() );
    REQUIRE( 0x0040 == uart.getConnHandle() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::DISCOVER_SERVICES) );

    feedUARTService(engine, 0x0040);
    REQUIRE( ConnState::DISCOVERING_CHARACTERISTICS == uart.getState() );
    REQUIRE( SVC_START == radio.last(MockRadio::Cmd::DISCOVER_CHARS)->value_handle );
    REQUIRE( SVC_END == radio.last(MockRadio::Cmd::DISCOVER_CHARS)->end_handle );

    radio.clear();
    feedUARTChars(engine, 0x0040, true);
    REQUIRE( ConnState::READY == uart.getState() );
    REQUIRE( true == uart.isReady() );
    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::SUCCESS == outcome.status );
    REQUIRE( 0x0040 == outcome.conn_handle );
    REQUIRE( RX_VH == uart.getValueHandle(CharRole::RX) );
    REQUIRE( TX_VH == uart.getValueHandle(CharRole::TX) );

    // notifications of TX enabled via its client configuration descriptor
    REQUIRE( 1 == radio.count(MockRadio::Cmd::GATTC_WRITE) );
    const MockRadio::Command* cccd = radio.last(MockRadio::Cmd::GATTC_WRITE);
    REQUIRE( TX_VH+1 == cccd->value_handle );
    REQUIRE( true == cccd->with_response );
    const std::vector<uint8_t> cccd_notify = { 0x01, 0x00 };
    REQUIRE( cccd_notify == cccd->data );

    REQUIRE( 1 == radio.count(MockRadio::Cmd::EXCHANGE_MTU) );
    REQUIRE( BTBEnv::get().GATT_TARGET_MTU == radio.last(MockRadio::Cmd::EXCHANGE_MTU)->mtu );

    // application callbacks are bound to the READY connection
    REQUIRE( 0 == engine.getRegistry().count(0x0040) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onReceive(CharRole::TX, ReceiveCallback( [](const uint16_t h, const jau::TROOctets& v) {
        (void)h;
        (void)v;
    } ) ) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onWriteDone( WriteDoneCallback( [](const uint16_t h, const uint16_t vh, const uint16_t status) {
        (void)h;
        (void)vh;
        (void)status;
    } ) ) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onDisconnect( DisconnectCallback( [](const uint16_t h, const uint8_t reason) {
        (void)h;
        (void)reason;
    } ) ) );
    // NOTIFY, WRITE_DONE and DISCONNECT
    REQUIRE( 3 == engine.getRegistry().count(0x0040) );
    std::cout << uart.toString() << std::endl;
    std::cout << engine.toString() << std::endl;
}

TEST_CASE( "CentralConnectionManager Test 02 Notify, Send and Disconnect", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);
    ConnectOutcome outcome;
    std::vector<uint8_t> received;
    int write_done_count = 0, disconnect_count = 0;
    uint8_t disconnect_reason = 0;

    const ReceiveCallback on_receive( [&](const uint16_t h, const jau::TROOctets& v) {
        REQUIRE( 0x0040 == h );
        received.insert(received.end(), v.get_ptr(), v.get_ptr()+v.size());
    } );
    const WriteDoneCallback on_write_done( [&](const uint16_t h, const uint16_t vh, const uint16_t status) {
        REQUIRE( 0x0040 == h );
        REQUIRE( RX_VH == vh );
        REQUIRE( 0 == status );
        write_done_count++;
    } );
    const DisconnectCallback on_disconnect( [&](const uint16_t h, const uint8_t reason) {
        REQUIRE( 0x0040 == h );
        disconnect_reason = reason;
        disconnect_count++;
    } );

    const jau::TROOctets empty(nullptr, 0, jau::lb_endian::little);
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.send(CharRole::RX, empty) );
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.onReceive(CharRole::TX, on_receive) );
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.onWriteDone(on_write_done) );
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.onDisconnect(on_disconnect) );

    connectUART(engine, radio, uart, outcome, 0x0040, makeAddress(0x02));
    radio.clear();
    REQUIRE( BTBStatusCode::SUCCESS == uart.onReceive(CharRole::TX, on_receive) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onWriteDone(on_write_done) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onDisconnect(on_disconnect) );
    // RX is write only
    REQUIRE( BTBStatusCode::INVALID_PARAMS == uart.onReceive(CharRole::RX, on_receive) );

    const uint8_t hello[] = { 'h', 'e', 'l', 'l', 'o' };
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    const std::vector<uint8_t> hello_v(hello, hello+sizeof(hello));
    REQUIRE( hello_v == received );
    // unknown value handle and unknown connection are ignored
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, 0x0030, hello, sizeof(hello)) );
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0041, TX_VH, hello, sizeof(hello)) );
    REQUIRE( 5 == received.size() );

    // default MTU 23 transfers 20 bytes per write
    std::vector<uint8_t> payload(50);
    for(size_t i=0; i<payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i);
    }
    const jau::TROOctets value(payload.data(), payload.size(), jau::lb_endian::little);
    REQUIRE( BTBStatusCode::SUCCESS == uart.send(CharRole::RX, value) );
    {
        const std::vector<MockRadio::Command> writes = radio.all(MockRadio::Cmd::GATTC_WRITE);
        REQUIRE( 3 == writes.size() );
        REQUIRE( 20 == writes[0].data.size() );
        REQUIRE( 20 == writes[1].data.size() );
        REQUIRE( 10 == writes[2].data.size() );
        REQUIRE( RX_VH == writes[2].value_handle );
        REQUIRE( false == writes[2].with_response );
        REQUIRE( 40 == writes[2].data[0] );
    }

    engine.sendEvent( std::make_unique<RadioEvtMtuExchanged>(0x0040, 185) );
    REQUIRE( 185 == uart.getMTU() );
    radio.clear();
    REQUIRE( BTBStatusCode::SUCCESS == uart.send(CharRole::RX, value, true) );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::GATTC_WRITE) );
    REQUIRE( true == radio.last(MockRadio::Cmd::GATTC_WRITE)->with_response );

    // empty value is one empty write
    radio.clear();
    REQUIRE( BTBStatusCode::SUCCESS == uart.send(CharRole::RX, empty) );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::GATTC_WRITE) );

    engine.sendEvent( std::make_unique<RadioEvtWriteDone>(0x0040, RX_VH, 0) );
    REQUIRE( 1 == write_done_count );

    // role not served by this protocol
    REQUIRE( BTBStatusCode::INVALID_PARAMS == uart.send(CharRole::MIDI, value) );

    radio.setResult(MockRadio::Cmd::GATTC_WRITE, BTBStatusCode::INTERNAL_FAILURE);
    REQUIRE( BTBStatusCode::RADIO_ERROR == uart.send(CharRole::RX, value) );
    radio.setResult(MockRadio::Cmd::GATTC_WRITE, BTBStatusCode::SUCCESS);

    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x13);
    REQUIRE( 1 == disconnect_count );
    REQUIRE( 0x13 == disconnect_reason );
    REQUIRE( ConnState::CLOSED == uart.getState() );
    REQUIRE( INVALID_CONN_HANDLE == uart.getConnHandle() );
    REQUIRE( 0 == engine.getRegistry().size() );
    REQUIRE( 0 == engine.getTable().size() );
    REQUIRE( 1 == outcome.count );

    // repeated disconnect event
    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x13);
    REQUIRE( 1 == disconnect_count );

    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    REQUIRE( 5 == received.size() );
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.send(CharRole::RX, value) );
    REQUIRE( BTBStatusCode::NOT_CONNECTED == uart.disconnect() );
}

TEST_CASE( "CentralConnectionManager Test 03 Incomplete Service", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);
    ConnectOutcome outcome;

    SECTION( "missing characteristic" ) {
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
        feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
        feedConnected(engine, 0x0040, makeAddress(0x02));
        feedUARTService(engine, 0x0040);
        feedUARTChars(engine, 0x0040, false /* with_tx */);
    }
    SECTION( "missing service" ) {
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
        feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
        feedConnected(engine, 0x0040, makeAddress(0x02));
        engine.sendEvent( std::make_unique<RadioEvtServiceResult>(0x0040, 0x0001, 0x0005, jau::uuid16_t(0x1800)) );
        engine.sendEvent( std::make_unique<RadioEvtDiscoveryDone>(RadioEvent::Opcode::GATTC_SERVICE_DONE, 0x0040, 0) );
        REQUIRE( 0 == radio.count(MockRadio::Cmd::DISCOVER_CHARS) );
    }
    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::INCOMPLETE_SERVICE == outcome.status );
    REQUIRE( INVALID_CONN_HANDLE == outcome.conn_handle );
    REQUIRE( ConnState::DISCONNECTING == uart.getState() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::DISCONNECT) );
    REQUIRE( 0x0040 == radio.last(MockRadio::Cmd::DISCONNECT)->conn_handle );

    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x16);
    REQUIRE( ConnState::CLOSED == uart.getState() );
    REQUIRE( 1 == outcome.count );
    REQUIRE( 0 == engine.getTable().size() );
    REQUIRE( 0 == engine.getRegistry().size() );
}

TEST_CASE( "CentralConnectionManager Test 04 Reconnect Isolation", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);
    ConnectOutcome outcome1, outcome2;

    // cancel while connecting
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome1.callback()) );
    feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
    REQUIRE( ConnState::CONNECTING == uart.getState() );
    const uint32_t first_id = uart.getContext()->getId();
    REQUIRE( BTBStatusCode::SUCCESS == uart.disconnect() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::CANCEL_CONNECT) );
    REQUIRE( ConnState::CLOSED == uart.getState() );
    REQUIRE( 0 == engine.getTable().size() );

    // fresh context for the next attempt
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome2.callback()) );
    REQUIRE( ConnState::SCANNING == uart.getState() );

    // late connect-accept of the cancelled attempt is refused
    radio.clear();
    feedConnected(engine, 0x0040, makeAddress(0x02));
    REQUIRE( 1 == radio.count(MockRadio::Cmd::DISCONNECT) );
    REQUIRE( 0x0040 == radio.last(MockRadio::Cmd::DISCONNECT)->conn_handle );
    REQUIRE( ConnState::SCANNING == uart.getState() );
    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x16);

    feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
    REQUIRE( first_id != uart.getContext()->getId() );
    feedConnected(engine, 0x0041, makeAddress(0x02));
    feedUARTService(engine, 0x0041);
    feedUARTChars(engine, 0x0041, true);

    REQUIRE( true == uart.isReady() );
    REQUIRE( 0 == outcome1.count );
    REQUIRE( 1 == outcome2.count );
    REQUIRE( BTBStatusCode::SUCCESS == outcome2.status );
    REQUIRE( 0x0041 == outcome2.conn_handle );

    REQUIRE( BTBStatusCode::SUCCESS == uart.disconnect() );
    REQUIRE( ConnState::DISCONNECTING == uart.getState() );
    feedDisconnected(engine, 0x0041, makeAddress(0x02), 0x16);

    // cancel while scanning drops the completion
    ConnectOutcome outcome3;
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome3.callback()) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.disconnect() );
    REQUIRE( ConnState::IDLE == uart.getState() );
    REQUIRE( false == engine.getDiscovery().isScanning() );
    engine.sendEvent( std::make_unique<RadioEvtScanDone>() );
    REQUIRE( 0 == outcome3.count );
}

TEST_CASE( "CentralConnectionManager Test 05 Connect Timeout", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);

    SECTION( "while scanning" ) {
        ConnectOutcome outcome;
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 1000, outcome.callback()) );
        REQUIRE( 1000 == radio.last(MockRadio::Cmd::START_SCAN)->duration );
        engine.checkTimeouts();
        REQUIRE( 0 == outcome.count );

        engine.checkTimeouts( jau::getCurrentMilliseconds() + 2000 );
        REQUIRE( 1 == outcome.count );
        REQUIRE( BTBStatusCode::CONNECT_TIMEOUT == outcome.status );
        REQUIRE( ConnState::IDLE == uart.getState() );
        REQUIRE( false == engine.getDiscovery().isScanning() );

        engine.checkTimeouts( jau::getCurrentMilliseconds() + 4000 );
        engine.sendEvent( std::make_unique<RadioEvtScanDone>() );
        REQUIRE( 1 == outcome.count );
    }
    SECTION( "while connecting" ) {
        ConnectOutcome outcome;
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 1000, outcome.callback()) );
        feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
        REQUIRE( ConnState::CONNECTING == uart.getState() );

        engine.checkTimeouts( jau::getCurrentMilliseconds() + 2000 );
        REQUIRE( 1 == outcome.count );
        REQUIRE( BTBStatusCode::CONNECT_TIMEOUT == outcome.status );
        REQUIRE( 1 == radio.count(MockRadio::Cmd::CANCEL_CONNECT) );
        REQUIRE( ConnState::CLOSED == uart.getState() );

        // late connect-accept is refused, completion does not fire again
        feedConnected(engine, 0x0040, makeAddress(0x02));
        REQUIRE( 1 == radio.count(MockRadio::Cmd::DISCONNECT) );
        engine.checkTimeouts( jau::getCurrentMilliseconds() + 4000 );
        REQUIRE( 1 == outcome.count );
    }
    SECTION( "while discovering" ) {
        ConnectOutcome outcome;
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 1000, outcome.callback()) );
        feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
        feedConnected(engine, 0x0040, makeAddress(0x02));

        engine.checkTimeouts( jau::getCurrentMilliseconds() + 2000 );
        REQUIRE( 1 == outcome.count );
        REQUIRE( BTBStatusCode::CONNECT_TIMEOUT == outcome.status );
        REQUIRE( ConnState::DISCONNECTING == uart.getState() );

        // discovery results after the timeout are ignored
        feedUARTService(engine, 0x0040);
        REQUIRE( 0 == radio.count(MockRadio::Cmd::DISCOVER_CHARS) );
        feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x16);
        REQUIRE( ConnState::CLOSED == uart.getState() );
        REQUIRE( 1 == outcome.count );
    }
    SECTION( "connection lost before ready" ) {
        ConnectOutcome outcome;
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 1000, outcome.callback()) );
        feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
        feedConnected(engine, 0x0040, makeAddress(0x02));
        feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x08);
        REQUIRE( 1 == outcome.count );
        REQUIRE( BTBStatusCode::CONNECTION_LOST == outcome.status );

        engine.checkTimeouts( jau::getCurrentMilliseconds() + 2000 );
        REQUIRE( 1 == outcome.count );
    }
    SECTION( "disconnect not confirmed" ) {
        ConnectOutcome outcome;
        int disconnect_count = 0;
        connectUART(engine, radio, uart, outcome, 0x0040, makeAddress(0x02));
        REQUIRE( BTBStatusCode::SUCCESS == uart.onDisconnect( DisconnectCallback( [&](const uint16_t h, const uint8_t reason) {
            REQUIRE( 0x0040 == h );
            REQUIRE( 0 == reason );
            disconnect_count++;
        } ) ) );
        REQUIRE( BTBStatusCode::SUCCESS == uart.disconnect() );
        REQUIRE( ConnState::DISCONNECTING == uart.getState() );
        REQUIRE( BTBStatusCode::BUSY == uart.connect("robot", 0, outcome.callback()) );

        engine.checkTimeouts();
        REQUIRE( ConnState::DISCONNECTING == uart.getState() );

        engine.checkTimeouts( jau::getCurrentMilliseconds() + BTBEnv::get().DISCONNECT_TIMEOUT + 1000 );
        REQUIRE( ConnState::CLOSED == uart.getState() );
        REQUIRE( 1 == disconnect_count );
        REQUIRE( 0 == engine.getTable().size() );
        REQUIRE( 0 == engine.getRegistry().size() );
        REQUIRE( 1 == outcome.count );

        // late radio event is a double teardown
        feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x16);
        REQUIRE( 1 == disconnect_count );
        REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
        REQUIRE( ConnState::SCANNING == uart.getState() );
    }
}

TEST_CASE( "CentralConnectionManager Test 06 Radio Failures", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);
    ConnectOutcome outcome;

    radio.setResult(MockRadio::Cmd::START_SCAN, BTBStatusCode::INTERNAL_FAILURE);
    REQUIRE( BTBStatusCode::RADIO_ERROR == uart.connect("robot", 0, outcome.callback()) );
    REQUIRE( ConnState::IDLE == uart.getState() );
    REQUIRE( 0 == outcome.count );
    radio.setResult(MockRadio::Cmd::START_SCAN, BTBStatusCode::SUCCESS);

    radio.setResult(MockRadio::Cmd::CONNECT, BTBStatusCode::INTERNAL_FAILURE);
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
    feedScanResult(engine, makeAddress(0x02), "robot", UARTService::serviceUUID());
    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::RADIO_ERROR == outcome.status );
    REQUIRE( ConnState::CLOSED == uart.getState() );
    REQUIRE( 0 == engine.getTable().size() );

    // manager is reusable
    radio.setResult(MockRadio::Cmd::CONNECT, BTBStatusCode::SUCCESS);
    REQUIRE( BTBStatusCode::SUCCESS == uart.connect("robot", 0, outcome.callback()) );
}

TEST_CASE( "CentralConnectionManager Test 07 Callbacks bound to Connection", "[manager][central]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
    engine.attach(uart);
    ConnectOutcome outcome1, outcome2;
    int receive_count1 = 0, receive_count2 = 0, disconnect_count1 = 0;
    const uint8_t hello[] = { 'h', 'i' };

    connectUART(engine, radio, uart, outcome1, 0x0040, makeAddress(0x02));
    REQUIRE( BTBStatusCode::SUCCESS == uart.onReceive(CharRole::TX, ReceiveCallback( [&](const uint16_t h, const jau::TROOctets& v) {
        (void)h;
        (void)v;
        receive_count1++;
    } ) ) );
    REQUIRE( BTBStatusCode::SUCCESS == uart.onDisconnect( DisconnectCallback( [&](const uint16_t h, const uint8_t reason) {
        (void)h;
        (void)reason;
        disconnect_count1++;
    } ) ) );
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    REQUIRE( 1 == receive_count1 );

    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x13);
    REQUIRE( 1 == disconnect_count1 );
    REQUIRE( 0 == engine.getRegistry().size() );

    // same peer and same connection handle again
    connectUART(engine, radio, uart, outcome2, 0x0040, makeAddress(0x02));
    REQUIRE( 1 == outcome2.count );
    REQUIRE( 0 == engine.getRegistry().count(0x0040) );
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    REQUIRE( 1 == receive_count1 );

    REQUIRE( BTBStatusCode::SUCCESS == uart.onReceive(CharRole::TX, ReceiveCallback( [&](const uint16_t h, const jau::TROOctets& v) {
        (void)h;
        (void)v;
        receive_count2++;
    } ) ) );
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    REQUIRE( 1 == receive_count1 );
    REQUIRE( 1 == receive_count2 );

    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x13);
    REQUIRE( 1 == disconnect_count1 );
}

TEST_CASE( "CentralConnectionManager Test 10 Hub Protocol", "[manager][central][hub]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    CentralConnectionManager hub(radio, engine.getTable(), engine.getDiscovery(), HubService::centralConfig());
    engine.attach(hub);
    ConnectOutcome outcome;
    std::vector<uint8_t> received;

    // any name matches, the service selects the peer
    REQUIRE( BTBStatusCode::SUCCESS == hub.connect("ignored", 0, outcome.callback()) );
    REQUIRE( false == engine.getDiscovery().getCriteria().has_name );
    feedScanResult(engine, makeAddress(0x07), "robot", UARTService::serviceUUID());
    REQUIRE( ConnState::SCANNING == hub.getState() );
    feedScanResult(engine, makeAddress(0x08), "Hub 4", HubService::serviceUUID());
    REQUIRE( ConnState::CONNECTING == hub.getState() );
    REQUIRE( "Hub 4" == hub.getPeerName() );

    feedConnected(engine, 0x0001, makeAddress(0x08));
    engine.sendEvent( std::make_unique<RadioEvtServiceResult>(0x0001, 0x000a, 0x000f, *HubService::serviceUUID()) );
    engine.sendEvent( std::make_unique<RadioEvtDiscoveryDone>(RadioEvent::Opcode::GATTC_SERVICE_DONE, 0x0001, 0) );
    radio.clear();
    engine.sendEvent( std::make_unique<RadioEvtCharResult>(0x0001, 0x000b, 0x000c,
            number(GattCharProps::WriteNoAck | GattCharProps::WriteWithAck | GattCharProps::Notify), *HubService::ctrlUUID()) );
    engine.sendEvent( std::make_unique<RadioEvtDiscoveryDone>(RadioEvent::Opcode::GATTC_CHARACTERISTIC_DONE, 0x0001, 0) );

    REQUIRE( true == hub.isReady() );
    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::SUCCESS == outcome.status );
    REQUIRE( 0x000d == radio.last(MockRadio::Cmd::GATTC_WRITE)->value_handle );
    REQUIRE( BTBStatusCode::SUCCESS == hub.onReceive(CharRole::CTRL, ReceiveCallback( [&](const uint16_t h, const jau::TROOctets& v) {
        (void)h;
        received.insert(received.end(), v.get_ptr(), v.get_ptr()+v.size());
    } ) ) );
    REQUIRE( 1 == engine.getRegistry().count(0x0001) );

    const uint8_t status_report[] = { 0x05, 0x00, 0x01, 0x06, 0x06 };
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0001, 0x000c, status_report, sizeof(status_report)) );
    REQUIRE( sizeof(status_report) == received.size() );

    radio.clear();
    const uint8_t cmd[] = { 0x05, 0x00, 0x01, 0x02, 0x02 };
    REQUIRE( BTBStatusCode::SUCCESS == hub.send(CharRole::CTRL, jau::TROOctets(cmd, sizeof(cmd), jau::lb_endian::little)) );
    REQUIRE( 0x000c == radio.last(MockRadio::Cmd::GATTC_WRITE)->value_handle );

    REQUIRE( BTBStatusCode::SUCCESS == hub.disconnect() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::DISCONNECT) );
    feedDisconnected(engine, 0x0001, makeAddress(0x08), 0x16);
    REQUIRE( ConnState::CLOSED == hub.getState() );
}

TEST_CASE( "BTBEngine Test 01 Detach", "[engine]" ) {
    MockRadio radio;
    BTBEngine engine(radio);
    ConnectOutcome outcome;
    {
        CentralConnectionManager uart(radio, engine.getTable(), engine.getDiscovery(), UARTService::centralConfig());
        engine.attach(uart);
        REQUIRE( 1 == engine.getManagerCount() );
        connectUART(engine, radio, uart, outcome, 0x0040, makeAddress(0x02));
        REQUIRE( 1 == engine.getTable().size() );

        REQUIRE( true == engine.detach(uart) );
        REQUIRE( false == engine.detach(uart) );
        REQUIRE( 0 == engine.getManagerCount() );
        REQUIRE( 0 == engine.getTable().size() );
        REQUIRE( 0 == engine.getRegistry().size() );
    }
    // events of the detached manager's connection are ignored
    const uint8_t hello[] = { 'h', 'i' };
    engine.sendEvent( std::make_unique<RadioEvtNotify>(0x0040, TX_VH, hello, sizeof(hello)) );
    feedDisconnected(engine, 0x0040, makeAddress(0x02), 0x13);

    // foreign table
    CallbackRegistry registry;
    ConnectionTable table(registry);
    CentralConnectionManager foreign(radio, table, engine.getDiscovery(), UARTService::centralConfig());
    REQUIRE_THROWS_AS( engine.attach(foreign), jau::IllegalArgumentException );
}
