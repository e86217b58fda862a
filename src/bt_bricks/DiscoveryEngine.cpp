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
#include <jau/basic_types.hpp>

#include "DiscoveryEngine.hpp"

using namespace bt_bricks;

DeviceRecord::DeviceRecord() noexcept
: addressAndType(), name(), services(), rssi(0), adv(), timestamp(0)
{ }

DeviceRecord::DeviceRecord(const RadioEvtScanResult& e) noexcept
: addressAndType(e.getAddressAndType()), name(), services(), rssi(e.getRSSI()), adv(), timestamp(e.getTimestamp())
{
    const jau::nsize_t adv_sz = e.getAdvDataSize();
    if( 0 < adv_sz ) {
        adv.read_data(e.getAdvData(), adv_sz);
    }
    name = adv.getBestName();
    services = adv.getServices();
}

bool DeviceRecord::hasService(const jau::uuid_t& uuid) const noexcept {
    for(const auto& p : services) {
        if( p->equivalent(uuid) ) {
            return true;
        }
    }
    return false;
}

std::string DeviceRecord::toString() const noexcept {
    std::string srv;
    for(const auto& p : services) {
        if( !srv.empty() ) {
            srv.append(", ");
        }
        srv.append(p->toUUID128String());
    }
    return "Device["+addressAndType.toString()+", '"+name+"', rssi "+std::to_string(rssi)+", services["+srv+"]]";
}

bool SearchCriteria::matches(const DeviceRecord& r) const noexcept {
    if( isEmpty() ) {
        return false;
    }
    if( has_name && name != r.name ) {
        return false;
    }
    if( nullptr != service_uuid && !r.hasService(*service_uuid) ) {
        return false;
    }
    return true;
}

std::string SearchCriteria::toString() const noexcept {
    std::string n = has_name ? "'"+name+"'" : "-";
    std::string u = nullptr != service_uuid ? service_uuid->toUUID128String() : "-";
    return "Criteria[name "+n+", service "+u+"]";
}

DiscoveryEngine::DiscoveryEngine(RadioControl & radio_) noexcept
: env(BTBEnv::get()), radio(radio_), scanning(false), matched(false),
  criteria(), completion(), observer(), resultCount(0)
{ }

void DiscoveryEngine::complete(const BTBStatusCode status, const DeviceRecord* record) noexcept {
    // session is closed already, the completion may start a new one
    ScanCompletion cb = completion;
    completion = ScanCompletion();
    if( cb.is_null() ) {
        return;
    }
    try {
        cb(status, record);
    } catch (std::exception &e) {
        ERR_PRINT("DiscoveryEngine::complete: %s: Caught exception %s", to_string(status).c_str(), e.what());
    }
}

BTBStatusCode DiscoveryEngine::startScan(const SearchCriteria& criteria_, const int32_t duration_ms, const ScanCompletion& completion_) noexcept {
    if( scanning ) {
        WORDY_PRINT("DiscoveryEngine::startScan: %s, active %s",
                to_string(BTBStatusCode::ALREADY_SCANNING).c_str(), criteria.toString().c_str());
        return BTBStatusCode::ALREADY_SCANNING;
    }
    const int32_t duration = 0 < duration_ms ? duration_ms : env.SCAN_TIMEOUT;
    if( criteria_.isEmpty() ) {
        WARN_PRINT("DiscoveryEngine::startScan: Empty criteria will not match any device");
    }
    // session state must be valid before the radio may deliver results synchronously
    scanning = true;
    matched = false;
    resultCount = 0;
    criteria = criteria_;
    completion = completion_;

    const BTBStatusCode res = radio.startScan(duration);
    if( BTBStatusCode::SUCCESS != res ) {
        ERR_PRINT("DiscoveryEngine::startScan: Radio failed: %s, %s", to_string(res).c_str(), criteria.toString().c_str());
        if( !matched ) {
            scanning = false;
            completion = ScanCompletion();
        }
        return BTBStatusCode::RADIO_ERROR;
    }
    DBG_PRINT("DiscoveryEngine::startScan: %d ms, %s", duration, criteria.toString().c_str());
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode DiscoveryEngine::stopScan() noexcept {
    if( !scanning ) {
        return BTBStatusCode::SUCCESS;
    }
    scanning = false;
    completion = ScanCompletion();
    const BTBStatusCode res = radio.stopScan();
    DBG_PRINT("DiscoveryEngine::stopScan: results %zu, radio %s", (size_t)resultCount, to_string(res).c_str());
    return BTBStatusCode::SUCCESS == res ? res : BTBStatusCode::RADIO_ERROR;
}

void DiscoveryEngine::onScanResult(const RadioEvtScanResult& e) noexcept {
    if( !scanning ) {
        COND_PRINT(env.DEBUG_EVENT, "DiscoveryEngine::onScanResult: No session, ignored %s", e.toString().c_str());
        return;
    }
    resultCount++;
    const DeviceRecord record(e);
    if( !observer.is_null() ) {
        ScanResultObserver o = observer;
        try {
            o(record);
        } catch (std::exception &except) {
            ERR_PRINT("DiscoveryEngine::onScanResult: Observer caught exception %s", except.what());
        }
        if( !scanning ) {
            return; // session stopped by observer
        }
    }
    if( !criteria.matches(record) ) {
        COND_PRINT(env.DEBUG_EVENT, "DiscoveryEngine::onScanResult: No match %s", record.toString().c_str());
        return;
    }
    DBG_PRINT("DiscoveryEngine::onScanResult: Match %s, %s", record.toString().c_str(), criteria.toString().c_str());
    matched = true;
    scanning = false;
    const BTBStatusCode res = radio.stopScan();
    if( BTBStatusCode::SUCCESS != res ) {
        WARN_PRINT("DiscoveryEngine::onScanResult: Radio stopScan failed: %s", to_string(res).c_str());
    }
    complete(BTBStatusCode::SUCCESS, &record);
}

void DiscoveryEngine::onScanDone() noexcept {
    if( !scanning ) {
        DBG_PRINT("DiscoveryEngine::onScanDone: No session, matched %d, ignored", matched);
        return;
    }
    scanning = false;
    DBG_PRINT("DiscoveryEngine::onScanDone: %s after %zu results, %s",
            to_string(BTBStatusCode::NOT_FOUND).c_str(), (size_t)resultCount, criteria.toString().c_str());
    complete(BTBStatusCode::NOT_FOUND, nullptr);
}

void DiscoveryEngine::eventReceived(const RadioEvent& e) noexcept {
    switch( e.getOpcode() ) {
        case RadioEvent::Opcode::SCAN_RESULT:
            onScanResult( static_cast<const RadioEvtScanResult&>(e) );
            break;
        case RadioEvent::Opcode::SCAN_DONE:
            onScanDone();
            break;
        default:
            WARN_PRINT("DiscoveryEngine::eventReceived: Unexpected %s", e.toString().c_str());
            break;
    }
}

std::string DiscoveryEngine::toString() const noexcept {
    return "DiscoveryEngine[scanning "+std::to_string(scanning)+", matched "+std::to_string(matched)+
           ", results "+std::to_string(resultCount)+", "+criteria.toString()+"]";
}
