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

#ifndef BT_BRICKS_CONNECTION_MANAGER_HPP_
#define BT_BRICKS_CONNECTION_MANAGER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <array>
#include <vector>

#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/octets.hpp>

#include "BTBTypes.hpp"
#include "BTBEnv.hpp"
#include "RadioEvent.hpp"
#include "RadioControl.hpp"
#include "ConnectionTable.hpp"
#include "DiscoveryEngine.hpp"
#include "Protocols.hpp"

namespace bt_bricks {

    class BTBEngine; // forward

    /**
     * Application callback receiving a value of the given connection,
     * i.e. a notification in central role or a written value in peripheral role.
     *
     * The value reference is only valid during the callback.
     */
    typedef jau::function<void(const uint16_t conn_handle, const jau::TROOctets& value)> ReceiveCallback;

    /** Application callback on a completed write with response, passing the write status. */
    typedef jau::function<void(const uint16_t conn_handle, const uint16_t value_handle, const uint16_t status)> WriteDoneCallback;

    /** Application callback on disconnect of a READY connection, passing the disconnect reason. */
    typedef jau::function<void(const uint16_t conn_handle, const uint8_t reason)> DisconnectCallback;

    /** Application callback on a central connected to a PeripheralConnectionManager, the connection is READY. */
    typedef jau::function<void(const uint16_t conn_handle, const BDAddressAndType& peer)> ConnectCallback;

    /**
     * Completion of CentralConnectionManager::connect(), invoked exactly once per accepted connect() call,
     * unless cancelled by disconnect().
     *
     * Arguments are BTBStatusCode::SUCCESS and the connection handle,
     * or the failure status and INVALID_CONN_HANDLE.
     */
    typedef jau::function<void(const BTBStatusCode status, const uint16_t conn_handle)> ConnectCompletion;

    /**
     * Protocol connection manager base, one state machine parametrized by a ProtocolConfig.
     *
     * Radio events reach a manager via the BTBEngine it is attached to.
     */
    class ConnectionManager {
        friend class BTBEngine;

        protected:
            const BTBEnv & env;
            RadioControl & radio;
            ConnectionTable & table;
            const ProtocolConfig config;
            const BTRole role;

            ConnectionManager(RadioControl & radio_, ConnectionTable & table_, ProtocolConfig config_, const BTRole role_) noexcept;

            /**
             * Writes or notifies the given value in fragments of the connection's transfer size.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::RADIO_ERROR
             */
            BTBStatusCode sendFragmented(const ConnectionContextRef& ctx, const uint16_t value_handle,
                                         const jau::TROOctets & value, const bool notify, const bool with_response) noexcept;

            /** The context has been bound to its connection handle. */
            virtual void connected(const ConnectionContextRef& ctx) noexcept = 0;

            /** The context has been torn down, i.e. is CLOSED and its callbacks are removed. */
            virtual void disconnected(const ConnectionContextRef& ctx, const uint8_t reason) noexcept = 0;

            /** GATT client event of the given context. */
            virtual void gattEvent(const ConnectionContextRef& ctx, const RadioEvent& e) noexcept {
                (void)ctx;
                (void)e;
            }

            /** Returns true if an incoming central connection shall be accepted and owned by this manager. */
            virtual bool acceptsIncoming() const noexcept { return false; }

            /** Returns true if an incoming central connection accepted by any manager shall be served by this manager as well. */
            virtual bool servesIncoming() const noexcept { return false; }

            /** Returns all live contexts served by this manager. */
            virtual jau::darray<ConnectionContextRef> getLiveContexts() const noexcept = 0;

        public:
            virtual ~ConnectionManager() noexcept {}

            ConnectionManager(const ConnectionManager&) = delete;
            void operator=(const ConnectionManager&) = delete;

            BTRole getRole() const noexcept { return role; }
            const ProtocolConfig& getConfig() const noexcept { return config; }
            ProtocolTag getProtocol() const noexcept { return config.tag; }

            /**
             * Sets the callback receiving values of the given role, replacing a previous one.
             *
             * A CentralConnectionManager binds the callback to its current READY connection,
             * i.e. it is removed with that connection.
             * A PeripheralConnectionManager binds it to its local characteristic, serving all connections.
             *
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::NOT_CONNECTED or BTBStatusCode::INVALID_PARAMS
             */
            virtual BTBStatusCode onReceive(const CharRole r, const ReceiveCallback& cb) noexcept = 0;

            /**
             * Sets the callback on disconnect, replacing a previous one.
             *
             * Bound to the current READY connection for a CentralConnectionManager,
             * to all connections for a PeripheralConnectionManager.
             *
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::NOT_CONNECTED
             */
            virtual BTBStatusCode onDisconnect(const DisconnectCallback& cb) noexcept = 0;

            /**
             * Sends the given value via the characteristic of the given role,
             * fragmented to the connection's transfer size.
             *
             * @param r the characteristic role
             * @param value the value
             * @param with_response central only, request write responses
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::NOT_CONNECTED, BTBStatusCode::INVALID_PARAMS
             *         or BTBStatusCode::RADIO_ERROR
             */
            virtual BTBStatusCode send(const CharRole r, const jau::TROOctets & value, const bool with_response=false) noexcept = 0;

            /**
             * Disconnects, safe from any state.
             */
            virtual BTBStatusCode disconnect() noexcept = 0;

            /**
             * Cooperative timeout processing, driven by the owner's loop.
             * @param now current monotonic time in milliseconds, see jau::getCurrentMilliseconds()
             */
            virtual void checkTimeouts(const uint64_t now) noexcept {
                (void)now;
            }

            virtual std::string toString() const noexcept = 0;
    };

    /**
     * Central role ConnectionManager, at most one connection per instance.
     *
     * <pre>
     * IDLE -> SCANNING -> CONNECTING -> DISCOVERING_SERVICES -> DISCOVERING_CHARACTERISTICS -> READY
     *                                                        any -> DISCONNECTING -> CLOSED
     * </pre>
     *
     * On entering READY the manager requests an MTU exchange to BTBEnv::GATT_TARGET_MTU
     * and enables notifications of all notifiable characteristics.
     *
     * Application callbacks are registered per connection once READY, e.g. from the ConnectCompletion,
     * and are removed with the connection's teardown. They never fire for a later connection.
     */
    class CentralConnectionManager : public ConnectionManager {
        private:
            DiscoveryEngine & discovery;
            /** State before a context exists */
            ConnState state;
            ConnectionContextRef ctx;
            ConnectCompletion completion;
            /** Connect or disconnect deadline in monotonic milliseconds, zero if none */
            uint64_t deadline;

            void complete(const BTBStatusCode status) noexcept;
            void fail(const BTBStatusCode status) noexcept;
            void closeConnection() noexcept;
            void scanComplete(const BTBStatusCode status, const DeviceRecord* record) noexcept;
            void enterReady() noexcept;

        protected:
            void connected(const ConnectionContextRef& ctx_) noexcept override;
            void disconnected(const ConnectionContextRef& ctx_, const uint8_t reason) noexcept override;
            void gattEvent(const ConnectionContextRef& ctx_, const RadioEvent& e) noexcept override;
            jau::darray<ConnectionContextRef> getLiveContexts() const noexcept override;

        public:
            CentralConnectionManager(RadioControl & radio_, ConnectionTable & table_, DiscoveryEngine & discovery_,
                                     ProtocolConfig config_) noexcept;

            ~CentralConnectionManager() noexcept override;

            /**
             * Starts to scan for a peer matching the given criteria and connects to the first match.
             *
             * @param criteria search criteria
             * @param timeout_ms bound of the whole connect procedure, if <= 0 BTBEnv::CONNECT_TIMEOUT is used
             * @param completion invoked once with the outcome
             * @return BTBStatusCode::SUCCESS if the connect procedure has been started,
             *         otherwise the failure status without invoking the completion, i.e.
             *         BTBStatusCode::BUSY, BTBStatusCode::ALREADY_SCANNING or BTBStatusCode::RADIO_ERROR.
             */
            BTBStatusCode connect(const SearchCriteria& criteria, const int32_t timeout_ms, const ConnectCompletion& completion_) noexcept;

            /**
             * Starts to connect to a peer advertising this protocol's service,
             * and the given name if ProtocolConfig::match_name.
             */
            BTBStatusCode connect(const std::string& name, const int32_t timeout_ms, const ConnectCompletion& completion_) noexcept;

            /** Receives notifications of the given notifiable role on the current READY connection. */
            BTBStatusCode onReceive(const CharRole r, const ReceiveCallback& cb) noexcept override;

            /**
             * Sets the callback on completed writes with response of all writable roles on the current READY connection.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::NOT_CONNECTED
             */
            BTBStatusCode onWriteDone(const WriteDoneCallback& cb) noexcept;

            BTBStatusCode onDisconnect(const DisconnectCallback& cb) noexcept override;

            BTBStatusCode send(const CharRole r, const jau::TROOctets & value, const bool with_response=false) noexcept override;

            BTBStatusCode disconnect() noexcept override;

            /**
             * Resolves an expired connect attempt with BTBStatusCode::CONNECT_TIMEOUT.
             * A disconnect not confirmed by the radio within BTBEnv::DISCONNECT_TIMEOUT is torn down locally.
             */
            void checkTimeouts(const uint64_t now) noexcept override;

            ConnState getState() const noexcept;

            bool isReady() const noexcept { return ConnState::READY == getState(); }

            /** Returns the connection handle if bound, otherwise INVALID_CONN_HANDLE */
            uint16_t getConnHandle() const noexcept;

            /** Returns the peer's value handle of the given role, zero if not known. */
            uint16_t getValueHandle(const CharRole r) const noexcept;

            std::string getPeerName() const noexcept;

            uint16_t getMTU() const noexcept;

            /** Returns the current or last context, may be nullptr. */
            ConnectionContextRef getContext() const noexcept { return ctx; }

            std::string toString() const noexcept override;
    };

    /**
     * Peripheral role ConnectionManager, serving the local GATT layout of its ProtocolConfig
     * to up to BTBEnv::PERIPHERAL_MAX_CONNECTIONS centrals.
     *
     * Connections are READY on connect-accept.
     * All started instances attached to one BTBEngine share the radio's GATT server,
     * hence serve each incoming connection, while the first advertising instance owns it.
     *
     * Written values are delivered via onReceive() per role of the written local value handle.
     */
    class PeripheralConnectionManager : public ConnectionManager {
        public:
            /** Default advertising interval in microseconds */
            static constexpr const int32_t DEFAULT_ADV_INTERVAL_US = 100000;

        private:
            bool registered;
            bool started;
            bool advertising;
            int32_t advIntervalUS;
            std::string advName;
            std::vector<uint8_t> advData;
            /** local value handle per CharRole, zero if not registered */
            std::array<uint16_t, CHAR_ROLE_COUNT> localHandles;
            std::array<ReceiveCallback, CHAR_ROLE_COUNT> receiveCallbacks;
            ConnectCallback connectCallback;
            DisconnectCallback disconnectCallback;
            /** served live connections */
            jau::darray<ConnectionContextRef> peers;

            BTBStatusCode startAdvertising() noexcept;
            void resumeAdvertising() noexcept;
            bool removePeer(const ConnectionContextRef& ctx) noexcept;
            void deliverReceived(const CharRole r, const uint16_t conn_handle, const jau::TROOctets& value);

        protected:
            void connected(const ConnectionContextRef& ctx) noexcept override;
            void disconnected(const ConnectionContextRef& ctx, const uint8_t reason) noexcept override;
            bool acceptsIncoming() const noexcept override { return started && advertising; }
            bool servesIncoming() const noexcept override;
            jau::darray<ConnectionContextRef> getLiveContexts() const noexcept override { return peers; }

        public:
            PeripheralConnectionManager(RadioControl & radio_, ConnectionTable & table_, ProtocolConfig config_,
                                        const int32_t adv_interval_us=DEFAULT_ADV_INTERVAL_US) noexcept;

            ~PeripheralConnectionManager() noexcept override;

            /**
             * Registers the local GATT layout, once.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::RADIO_ERROR
             */
            BTBStatusCode registerLayout() noexcept;

            /**
             * Registers the local GATT layout if not yet done, encodes the advertising payload
             * with flags, the given name and the service UUID and starts advertising.
             *
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::PAYLOAD_TOO_LARGE, BTBStatusCode::BUSY if started
             *         or BTBStatusCode::RADIO_ERROR
             */
            BTBStatusCode start(const std::string& advertised_name) noexcept;

            /**
             * Stops advertising and disconnects all peers.
             */
            BTBStatusCode stop() noexcept;

            /**
             * Receives values written by any central to the local characteristic of the given role.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::INVALID_PARAMS if the role is not writable
             */
            BTBStatusCode onReceive(const CharRole r, const ReceiveCallback& cb) noexcept override;

            /** Sets the callback on a served central's connect, replacing a previous one. */
            void onConnect(const ConnectCallback& cb) noexcept { connectCallback = cb; }

            BTBStatusCode onDisconnect(const DisconnectCallback& cb) noexcept override {
                disconnectCallback = cb;
                return BTBStatusCode::SUCCESS;
            }

            /** Notifies all connected peers. */
            BTBStatusCode send(const CharRole r, const jau::TROOctets & value, const bool with_response=false) noexcept override;

            /** Disconnects all peers, advertising continues if started. */
            BTBStatusCode disconnect() noexcept override;

            bool isStarted() const noexcept { return started; }
            bool isAdvertising() const noexcept { return advertising; }
            bool isConnected() const noexcept { return 0 < getConnectionCount(); }
            jau::nsize_t getConnectionCount() const noexcept { return peers.size(); }

            /** Returns the local value handle of the given role, zero if not registered. */
            uint16_t getLocalValueHandle(const CharRole r) const noexcept { return localHandles[number(r)]; }

            /** Returns the encoded advertising payload of the last start(). */
            const std::vector<uint8_t>& getAdvData() const noexcept { return advData; }

            std::string toString() const noexcept override;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_CONNECTION_MANAGER_HPP_ */
