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

#ifndef BT_BRICKS_DISCOVERY_ENGINE_HPP_
#define BT_BRICKS_DISCOVERY_ENGINE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/uuid.hpp>

#include "BTBTypes.hpp"
#include "BTAddress.hpp"
#include "BTBEnv.hpp"
#include "AdvPayload.hpp"
#include "RadioEvent.hpp"
#include "RadioControl.hpp"

namespace bt_bricks {

    /**
     * A discovered remote device, created per scan result.
     */
    struct DeviceRecord {
        BDAddressAndType addressAndType;
        /** Advertised name, see AdvPayload::getBestName() */
        std::string name;
        /** Advertised service UUIDs */
        jau::darray<std::shared_ptr<const jau::uuid_t>> services;
        int8_t rssi;
        /** Complete decoded advertising payload */
        AdvPayload adv;
        uint64_t timestamp;

        DeviceRecord() noexcept;

        /** Decodes the given scan result. */
        DeviceRecord(const RadioEvtScanResult& e) noexcept;

        bool hasService(const jau::uuid_t& uuid) const noexcept;

        std::string toString() const noexcept;
    };

    /**
     * Search criteria of one scan session.
     *
     * All set fields must match, i.e. a conjunction.
     * Criteria without any field set match nothing.
     */
    struct SearchCriteria {
        /** Complete name to match exactly, if has_name */
        std::string name;
        bool has_name;
        /** Service UUID to be advertised, if not nullptr */
        std::shared_ptr<const jau::uuid_t> service_uuid;

        SearchCriteria() noexcept
        : name(), has_name(false), service_uuid(nullptr) {}

        SearchCriteria(std::shared_ptr<const jau::uuid_t> service_uuid_) noexcept
        : name(), has_name(false), service_uuid(std::move(service_uuid_)) {}

        SearchCriteria(std::string name_, std::shared_ptr<const jau::uuid_t> service_uuid_) noexcept
        : name(std::move(name_)), has_name(true), service_uuid(std::move(service_uuid_)) {}

        bool isEmpty() const noexcept { return !has_name && nullptr == service_uuid; }

        bool matches(const DeviceRecord& r) const noexcept;

        std::string toString() const noexcept;
    };

    /**
     * Completion of a scan session, invoked exactly once unless the session is stopped via DiscoveryEngine::stopScan().
     *
     * Arguments are BTBStatusCode::SUCCESS and the matched DeviceRecord,
     * or BTBStatusCode::NOT_FOUND and nullptr.
     * The record reference is only valid during the callback.
     */
    typedef jau::function<void(const BTBStatusCode, const DeviceRecord*)> ScanCompletion;

    /**
     * Observer of every scan result of an active session, invoked before matching.
     */
    typedef jau::function<void(const DeviceRecord&)> ScanResultObserver;

    /**
     * Owns the single scan session and matches scan results against its SearchCriteria.
     *
     * The first matching result wins, no ranking is performed.
     *
     * Single threaded use only, re-entrant calls from within callbacks are supported.
     */
    class DiscoveryEngine {
        private:
            const BTBEnv & env;
            RadioControl & radio;
            bool scanning;
            bool matched;
            SearchCriteria criteria;
            ScanCompletion completion;
            ScanResultObserver observer;
            jau::nsize_t resultCount;

            void complete(const BTBStatusCode status, const DeviceRecord* record) noexcept;

        public:
            DiscoveryEngine(RadioControl & radio_) noexcept;

            DiscoveryEngine(const DiscoveryEngine&) = delete;
            void operator=(const DiscoveryEngine&) = delete;

            /**
             * Starts a scan session with the given criteria.
             *
             * @param criteria the criteria of this session
             * @param duration_ms scan duration in milliseconds, if <= 0 BTBEnv::SCAN_TIMEOUT is used
             * @param completion invoked once with the outcome
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::ALREADY_SCANNING or BTBStatusCode::RADIO_ERROR.
             *         In the latter cases no session is active and completion is not invoked.
             */
            BTBStatusCode startScan(const SearchCriteria& criteria_, const int32_t duration_ms, const ScanCompletion& completion_) noexcept;

            /**
             * Cancels the active session without invoking its completion.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::RADIO_ERROR, session is closed in both cases.
             */
            BTBStatusCode stopScan() noexcept;

            void onScanResult(const RadioEvtScanResult& e) noexcept;

            /**
             * Closes the session with BTBStatusCode::NOT_FOUND if no match occurred.
             * A late scan done after a match is ignored.
             */
            void onScanDone() noexcept;

            /** EventRouter callback for EventClass::SCAN */
            void eventReceived(const RadioEvent& e) noexcept;

            void setScanResultObserver(const ScanResultObserver& o) noexcept { observer = o; }

            bool isScanning() const noexcept { return scanning; }

            const SearchCriteria& getCriteria() const noexcept { return criteria; }

            /** Number of scan results of the current or last session. */
            jau::nsize_t getResultCount() const noexcept { return resultCount; }

            std::string toString() const noexcept;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_DISCOVERY_ENGINE_HPP_ */
