#include <iostream>
#include <cinttypes>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include <bt_bricks/EventRouter.hpp>

#include "MockRadio.hpp"

using namespace bt_bricks;
using namespace bt_bricks_test;

TEST_CASE( "RadioEvent Test 01 Raw Decode", "[event][codec]" ) {
    {
        const uint8_t raw[] = { 0x12, 0x00, 0x07, 0x00,   // NOTIFY, param_size 7
                                0x40, 0x00,               // conn_handle
                                0x12, 0x00,               // value_handle
                                'a', 'b', 'c' };
        std::unique_ptr<RadioEvent> e = RadioEvent::getSpecialized(raw, sizeof(raw));
        REQUIRE( nullptr != e );
        std::cout << e->toString() << std::endl;
        REQUIRE( RadioEvent::Opcode::GATTC_NOTIFY == e->getOpcode() );
        REQUIRE( EventClass::GATT_CLIENT == e->getEventClass() );
        const RadioEvtNotify & n = static_cast<const RadioEvtNotify&>(*e);
        REQUIRE( 0x0040 == n.getConnHandle() );
        REQUIRE( 0x0012 == n.getValueHandle() );
        REQUIRE( 3 == n.getValue().size() );
        REQUIRE( 'c' == n.getValue().get_uint8(2) );
    }
    {
        const BDAddressAndType addr = makeAddress(0x02);
        RadioEvtConnected e0(RadioEvent::Opcode::PERIPHERAL_CONNECT, 0x0001, addr);
        const jau::TROOctets & pdu = e0.getPDU();
        std::unique_ptr<RadioEvent> e1 = RadioEvent::getSpecialized(pdu.get_ptr(), pdu.size());
        REQUIRE( EventClass::SYSTEM == e1->getEventClass() );
        const RadioEvtConnected & c = static_cast<const RadioEvtConnected&>(*e1);
        REQUIRE( 0x0001 == c.getConnHandle() );
        REQUIRE( addr == c.getAddressAndType() );
        REQUIRE( BTRole::Central == c.getRole() );
    }
    {
        const uint8_t raw[] = { 0x06, 0x00, 0x00, 0x00 };   // SCAN_DONE
        std::unique_ptr<RadioEvent> e = RadioEvent::getSpecialized(raw, sizeof(raw));
        REQUIRE( EventClass::SCAN == e->getEventClass() );
    }
}

TEST_CASE( "RadioEvent Test 02 Malformed", "[event][codec]" ) {
    {
        const uint8_t raw[] = { 0x12, 0x00 };
        REQUIRE_THROWS_AS( RadioEvent::getSpecialized(raw, sizeof(raw)), jau::IndexOutOfBoundsException );
    }
    {
        // param_size exceeds buffer
        const uint8_t raw[] = { 0x12, 0x00, 0x09, 0x00, 0x40, 0x00, 0x12, 0x00 };
        REQUIRE_THROWS_AS( RadioEvent::getSpecialized(raw, sizeof(raw)), jau::IndexOutOfBoundsException );
    }
    {
        // MTU_EXCHANGED lacking the mtu
        const uint8_t raw[] = { 0x15, 0x00, 0x02, 0x00, 0x40, 0x00 };
        REQUIRE_THROWS_AS( RadioEvent::getSpecialized(raw, sizeof(raw)), jau::IndexOutOfBoundsException );
    }
}

TEST_CASE( "EventRouter Test 01 Dispatch by Class", "[router]" ) {
    EventRouter router;
    int scan_count = 0, system_count = 0;

    router.addEventCallback(EventClass::SCAN, RadioEventCallback( [&](const RadioEvent& e) {
        REQUIRE( EventClass::SCAN == e.getEventClass() );
        scan_count++;
    } ) );
    router.addEventCallback(EventClass::SYSTEM, RadioEventCallback( [&](const RadioEvent& e) {
        REQUIRE( EventClass::SYSTEM == e.getEventClass() );
        system_count++;
    } ) );
    REQUIRE_THROWS_AS( router.addEventCallback(EventClass::NONE, RadioEventCallback( [](const RadioEvent&) { } ) ),
                       jau::IllegalArgumentException );

    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtScanDone>() ) );
    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtMtuExchanged>(0x0001, 185) ) );
    // no listener for GATT_SERVER
    const uint8_t data[] = { 0x01 };
    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtGattsWrite>(0x0001, 0x0010, data, sizeof(data)) ) );
    REQUIRE( 1 == scan_count );
    REQUIRE( 1 == system_count );
    REQUIRE( 3 == router.getDispatchedCount() );

    REQUIRE( BTBStatusCode::INVALID_PARAMS == router.sendEvent( std::unique_ptr<RadioEvent>() ) );
    std::cout << router.toString() << std::endl;
}

TEST_CASE( "EventRouter Test 02 Unknown and Malformed Events", "[router]" ) {
    EventRouter router;
    int count = 0;
    for(jau::nsize_t i=1; i<EVENT_CLASS_COUNT; ++i) {
        router.addEventCallback(static_cast<EventClass>(i), RadioEventCallback( [&](const RadioEvent& e) {
            (void)e;
            count++;
        } ) );
    }
    // opcode 0x0004 (GATTS_READ_REQUEST) is not handled
    const uint8_t unknown[] = { 0x04, 0x00, 0x04, 0x00, 0x01, 0x00, 0x10, 0x00 };
    REQUIRE( BTBStatusCode::UNKNOWN_EVENT == router.sendEvent(unknown, sizeof(unknown)) );
    REQUIRE( 1 == router.getDroppedCount() );

    const uint8_t truncated[] = { 0x07, 0x00, 0x09, 0x00, 0x01 };
    REQUIRE( BTBStatusCode::INVALID_PARAMS == router.sendEvent(truncated, sizeof(truncated)) );
    REQUIRE( BTBStatusCode::INVALID_PARAMS == router.sendEvent(nullptr, 0) );
    REQUIRE( 3 == router.getDroppedCount() );
    REQUIRE( 0 == count );
    REQUIRE( 0 == router.getDispatchedCount() );
}

TEST_CASE( "EventRouter Test 03 Re-entrant Events in Order", "[router]" ) {
    EventRouter router;
    std::vector<uint16_t> order;
    int depth = 0, max_depth = 0;

    router.addEventCallback(EventClass::SYSTEM, RadioEventCallback( [&](const RadioEvent& e) {
        depth++;
        max_depth = std::max(max_depth, depth);
        const RadioEvtMtuExchanged & m = static_cast<const RadioEvtMtuExchanged&>(e);
        order.push_back(m.getMTU());
        if( 100 == m.getMTU() ) {
            // events emitted by a callback are processed after it returned, in order
            REQUIRE( true == router.isDispatching() );
            REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtMtuExchanged>(0x0001, 101) ) );
            REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtMtuExchanged>(0x0001, 102) ) );
            REQUIRE( 1 == order.size() );
        }
        depth--;
    } ) );

    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtMtuExchanged>(0x0001, 100) ) );
    REQUIRE( false == router.isDispatching() );
    REQUIRE( 3 == order.size() );
    REQUIRE( 100 == order[0] );
    REQUIRE( 101 == order[1] );
    REQUIRE( 102 == order[2] );
    REQUIRE( 1 == max_depth );
    REQUIRE( 3 == router.getDispatchedCount() );
}

TEST_CASE( "EventRouter Test 04 Throwing Listener", "[router]" ) {
    EventRouter router;
    int count = 0;
    router.addEventCallback(EventClass::SCAN, RadioEventCallback( [](const RadioEvent& e) {
        (void)e;
        throw std::runtime_error("listener failure");
    } ) );
    RadioEventCallback counter( [&](const RadioEvent& e) {
        (void)e;
        count++;
    } );
    router.addEventCallback(EventClass::SCAN, counter);

    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtScanDone>() ) );
    REQUIRE( 1 == count );

    REQUIRE( 1 == router.removeEventCallback(EventClass::SCAN, counter) );
    REQUIRE( 1 == router.getEventCallbackCount(EventClass::SCAN) );
    REQUIRE( BTBStatusCode::SUCCESS == router.sendEvent( std::make_unique<RadioEvtScanDone>() ) );
    REQUIRE( 1 == count );
}
