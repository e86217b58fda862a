#include <iostream>
#include <cinttypes>
#include <cstring>

#include <catch2/catch_test_macros.hpp>

#include <bt_bricks/DiscoveryEngine.hpp>
#include <bt_bricks/Protocols.hpp>

#include "MockRadio.hpp"

using namespace bt_bricks;
using namespace bt_bricks_test;

struct ScanOutcome {
    int count = 0;
    BTBStatusCode status = BTBStatusCode::UNKNOWN;
    BDAddressAndType address;
    std::string name;

    ScanCompletion callback() {
        return ScanCompletion( [this](const BTBStatusCode s, const DeviceRecord* r) {
            count++;
            status = s;
            if( nullptr != r ) {
                address = r->addressAndType;
                name = r->name;
            }
        } );
    }
};

static void feed(DiscoveryEngine& discovery, const BDAddressAndType& addr, const std::string& name,
                 const std::shared_ptr<const jau::uuid_t>& service) {
    std::unique_ptr<RadioEvent> e = makeScanResult(addr, name, service);
    discovery.eventReceived(*e);
}

TEST_CASE( "DiscoveryEngine Test 01 Match by Name and Service", "[discovery]" ) {
    MockRadio radio;
    DiscoveryEngine discovery(radio);
    ScanOutcome outcome;
    int observed = 0;
    discovery.setScanResultObserver( ScanResultObserver( [&](const DeviceRecord& r) {
        (void)r;
        observed++;
    } ) );

    REQUIRE( BTBStatusCode::SUCCESS == discovery.startScan(SearchCriteria("robot", UARTService::serviceUUID()), 5000, outcome.callback()) );
    REQUIRE( true == discovery.isScanning() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::START_SCAN) );
    REQUIRE( 5000 == radio.last(MockRadio::Cmd::START_SCAN)->duration );

    feed(discovery, makeAddress(0x01), "other", UARTService::serviceUUID());
    feed(discovery, makeAddress(0x03), "robot", HubService::serviceUUID());
    REQUIRE( 0 == outcome.count );
    feed(discovery, makeAddress(0x02), "robot", UARTService::serviceUUID());

    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::SUCCESS == outcome.status );
    REQUIRE( makeAddress(0x02) == outcome.address );
    REQUIRE( "robot" == outcome.name );
    REQUIRE( false == discovery.isScanning() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::STOP_SCAN) );
    REQUIRE( 3 == observed );
    REQUIRE( 3 == discovery.getResultCount() );

    // late results and scan done of the finished session are ignored
    feed(discovery, makeAddress(0x04), "robot", UARTService::serviceUUID());
    discovery.eventReceived( RadioEvtScanDone() );
    REQUIRE( 1 == outcome.count );
    REQUIRE( 3 == observed );
    std::cout << discovery.toString() << std::endl;
}

TEST_CASE( "DiscoveryEngine Test 02 Not Found", "[discovery]" ) {
    MockRadio radio;
    DiscoveryEngine discovery(radio);
    ScanOutcome outcome;

    REQUIRE( BTBStatusCode::SUCCESS == discovery.startScan(SearchCriteria(HubService::serviceUUID()), 0, outcome.callback()) );
    REQUIRE( BTBEnv::get().SCAN_TIMEOUT == radio.last(MockRadio::Cmd::START_SCAN)->duration );
    feed(discovery, makeAddress(0x01), "robot", UARTService::serviceUUID());
    discovery.eventReceived( RadioEvtScanDone() );

    REQUIRE( 1 == outcome.count );
    REQUIRE( BTBStatusCode::NOT_FOUND == outcome.status );
    REQUIRE( false == discovery.isScanning() );

    discovery.eventReceived( RadioEvtScanDone() );
    REQUIRE( 1 == outcome.count );
}

TEST_CASE( "DiscoveryEngine Test 03 One Session", "[discovery]" ) {
    MockRadio radio;
    DiscoveryEngine discovery(radio);
    ScanOutcome outcome1, outcome2;

    REQUIRE( BTBStatusCode::SUCCESS == discovery.startScan(SearchCriteria(UARTService::serviceUUID()), 1000, outcome1.callback()) );
    REQUIRE( BTBStatusCode::ALREADY_SCANNING == discovery.startScan(SearchCriteria(HubService::serviceUUID()), 1000, outcome2.callback()) );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::START_SCAN) );
    REQUIRE( true == discovery.getCriteria().service_uuid->equivalent(*UARTService::serviceUUID()) );

    // stop drops the completion
    REQUIRE( BTBStatusCode::SUCCESS == discovery.stopScan() );
    REQUIRE( false == discovery.isScanning() );
    discovery.eventReceived( RadioEvtScanDone() );
    REQUIRE( 0 == outcome1.count );
    REQUIRE( 0 == outcome2.count );

    REQUIRE( BTBStatusCode::SUCCESS == discovery.stopScan() );
    REQUIRE( 1 == radio.count(MockRadio::Cmd::STOP_SCAN) );
}

TEST_CASE( "DiscoveryEngine Test 04 Radio Failure", "[discovery]" ) {
    MockRadio radio;
    DiscoveryEngine discovery(radio);
    ScanOutcome outcome;

    radio.setResult(MockRadio::Cmd::START_SCAN, BTBStatusCode::INTERNAL_FAILURE);
    REQUIRE( BTBStatusCode::RADIO_ERROR == discovery.startScan(SearchCriteria(UARTService::serviceUUID()), 1000, outcome.callback()) );
    REQUIRE( false == discovery.isScanning() );
    REQUIRE( 0 == outcome.count );

    radio.setResult(MockRadio::Cmd::START_SCAN, BTBStatusCode::SUCCESS);
    REQUIRE( BTBStatusCode::SUCCESS == discovery.startScan(SearchCriteria(UARTService::serviceUUID()), 1000, outcome.callback()) );
}

TEST_CASE( "DiscoveryEngine Test 05 Criteria", "[discovery]" ) {
    const std::vector<uint8_t> adv = makeAdvData("robot", UARTService::serviceUUID());
    const RadioEvtScanResult e(makeAddress(0x02), 0x00, -50, adv.data(), adv.size());
    const DeviceRecord r(e);
    REQUIRE( "robot" == r.name );
    REQUIRE( -50 == r.rssi );
    REQUIRE( true == r.hasService(*UARTService::serviceUUID()) );

    // empty criteria match nothing
    REQUIRE( true == SearchCriteria().isEmpty() );
    REQUIRE( false == SearchCriteria().matches(r) );

    REQUIRE( true == SearchCriteria(UARTService::serviceUUID()).matches(r) );
    REQUIRE( true == SearchCriteria("robot", nullptr).matches(r) );
    REQUIRE( false == SearchCriteria("robo", nullptr).matches(r) );
    REQUIRE( false == SearchCriteria("robot", MIDIService::serviceUUID()).matches(r) );

    // the empty name is a valid criterion
    const std::vector<uint8_t> adv2 = makeAdvData("", UARTService::serviceUUID());
    const RadioEvtScanResult e2(makeAddress(0x03), 0x00, -50, adv2.data(), adv2.size());
    REQUIRE( true == SearchCriteria("", UARTService::serviceUUID()).matches( DeviceRecord(e2) ) );
    REQUIRE( false == SearchCriteria("", UARTService::serviceUUID()).matches(r) );
}

TEST_CASE( "DiscoveryEngine Test 06 Restart from Completion", "[discovery]" ) {
    MockRadio radio;
    DiscoveryEngine discovery(radio);
    int count = 0;
    BTBStatusCode restart_res = BTBStatusCode::UNKNOWN;

    discovery.startScan(SearchCriteria(UARTService::serviceUUID()), 1000,
            ScanCompletion( [&](const BTBStatusCode s, const DeviceRecord* r) {
                (void)r;
                REQUIRE( BTBStatusCode::NOT_FOUND == s );
                count++;
                restart_res = discovery.startScan(SearchCriteria(UARTService::serviceUUID()), 1000, ScanCompletion());
            } ) );
    discovery.eventReceived( RadioEvtScanDone() );
    REQUIRE( 1 == count );
    REQUIRE( BTBStatusCode::SUCCESS == restart_res );
    REQUIRE( true == discovery.isScanning() );
    REQUIRE( 2 == radio.count(MockRadio::Cmd::START_SCAN) );
}
