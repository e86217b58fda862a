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

#ifndef BT_BRICKS_CONNECTION_TABLE_HPP_
#define BT_BRICKS_CONNECTION_TABLE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <array>

#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "BTBTypes.hpp"
#include "BTAddress.hpp"
#include "BTBEnv.hpp"
#include "CallbackRegistry.hpp"

namespace bt_bricks {

    class ConnectionManager; // forward
    class ConnectionTable; // forward

    /**
     * Per connection state, owned by the ConnectionTable while live.
     *
     * A context is created in ConnState::CONNECTING before its connection handle is known,
     * bound to the handle on connect-accept and destroyed on disconnect.
     * Its state only advances, see advanceState().
     */
    class ConnectionContext {
        friend class ConnectionTable;

        private:
            const uint32_t id;
            const ProtocolTag protocol;
            const BTRole role;
            const BDAddressAndType peer;
            ConnectionManager * const owner; // non-owning back reference
            ConnState state;
            uint16_t conn_handle;
            bool in_teardown;
            std::string peer_name;
            uint16_t svc_start_handle;
            uint16_t svc_end_handle;
            /** value handle per CharRole, zero if not discovered */
            std::array<uint16_t, CHAR_ROLE_COUNT> value_handles;
            uint16_t mtu;

        public:
            /** Default ATT MTU, valid until an MTU exchange completed. */
            static constexpr const uint16_t DEFAULT_MTU = 23;

            ConnectionContext(const uint32_t id_, const ProtocolTag protocol_, const BTRole role_,
                              const BDAddressAndType& peer_, ConnectionManager * owner_) noexcept;

            ConnectionContext(const ConnectionContext&) = delete;
            void operator=(const ConnectionContext&) = delete;

            /** Unique serial number of this context, distinguishing successive connections to the same peer. */
            uint32_t getId() const noexcept { return id; }
            ProtocolTag getProtocol() const noexcept { return protocol; }
            BTRole getRole() const noexcept { return role; }
            const BDAddressAndType& getPeer() const noexcept { return peer; }
            ConnectionManager * getOwner() const noexcept { return owner; }

            ConnState getState() const noexcept { return state; }

            /**
             * Advances the state to the given one, if higher than the current state.
             * ConnState::CLOSED is reserved to ConnectionTable.
             * @return true if advanced
             */
            bool advanceState(const ConnState newState) noexcept;

            uint16_t getConnHandle() const noexcept { return conn_handle; }
            bool isBound() const noexcept { return INVALID_CONN_HANDLE != conn_handle; }
            bool isClosed() const noexcept { return ConnState::CLOSED == state; }

            const std::string& getPeerName() const noexcept { return peer_name; }
            void setPeerName(const std::string& v) noexcept { peer_name = v; }

            void setServiceRange(const uint16_t start, const uint16_t end) noexcept {
                svc_start_handle = start;
                svc_end_handle = end;
            }
            bool hasServiceRange() const noexcept { return 0 != svc_start_handle && svc_start_handle <= svc_end_handle; }
            uint16_t getServiceStartHandle() const noexcept { return svc_start_handle; }
            uint16_t getServiceEndHandle() const noexcept { return svc_end_handle; }

            void setValueHandle(const CharRole r, const uint16_t value_handle) noexcept { value_handles[number(r)] = value_handle; }
            /** Returns the value handle of the given role, zero if not known. */
            uint16_t getValueHandle(const CharRole r) const noexcept { return value_handles[number(r)]; }
            bool hasValueHandle(const CharRole r) const noexcept { return 0 != value_handles[number(r)]; }

            uint16_t getMTU() const noexcept { return mtu; }
            void setMTU(const uint16_t v) noexcept { mtu = v; }

            /** Returns the maximum attribute value size per write or notification, i.e. MTU - 3. */
            jau::nsize_t getTransferSize() const noexcept { return mtu > 3 ? mtu - 3 : 0; }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<ConnectionContext> ConnectionContextRef;

    /**
     * Callback notified after ConnectionTable::teardown() removed the given context,
     * passing the disconnect reason.
     */
    typedef jau::function<void(const ConnectionContextRef&, const uint8_t)> ContextClosedCallback;

    /**
     * Authoritative store of all live ConnectionContext,
     * at most one per bound connection handle.
     *
     * Single threaded use only.
     */
    class ConnectionTable {
        private:
            const BTBEnv & env;
            CallbackRegistry & registry;
            jau::darray<ConnectionContextRef> contexts;
            uint32_t next_id;
            ContextClosedCallback closedCallback;

            bool contains(const ConnectionContextRef& ctx) const noexcept;
            void remove(const ConnectionContextRef& ctx) noexcept;

        public:
            ConnectionTable(CallbackRegistry & registry_) noexcept;

            ConnectionTable(const ConnectionTable&) = delete;
            void operator=(const ConnectionTable&) = delete;

            CallbackRegistry & getRegistry() noexcept { return registry; }

            void setContextClosedCallback(const ContextClosedCallback& cb) noexcept { closedCallback = cb; }

            /**
             * Allocates a new unbound context in ConnState::CONNECTING.
             */
            ConnectionContextRef createContext(const ProtocolTag protocol, const BTRole role,
                                               const BDAddressAndType& peer, ConnectionManager * owner) noexcept;

            /**
             * Binds the given context to the connection handle on connect-accept.
             *
             * A central role context advances to ConnState::DISCOVERING_SERVICES,
             * a peripheral role context advances to ConnState::READY.
             *
             * A stale live context bound to the same handle is torn down first.
             *
             * @return BTBStatusCode::SUCCESS, BTBStatusCode::NOT_FOUND if ctx is not live
             *         or BTBStatusCode::INVALID_PARAMS
             */
            BTBStatusCode bindHandle(const ConnectionContextRef& ctx, const uint16_t conn_handle) noexcept;

            /** Returns the live context bound to the given connection handle or nullptr. */
            ConnectionContextRef lookup(const uint16_t conn_handle) const noexcept;

            /** Returns the live unbound context of the given peer or nullptr. */
            ConnectionContextRef lookupPending(const BDAddressAndType& peer) const noexcept;

            /**
             * Tears down the context of the given connection handle, once per disconnect.
             *
             * The registry is drained first: the CallbackKind::DISCONNECT callback fires,
             * then all entries of the handle are removed.
             * Then the context is removed, moved to ConnState::CLOSED and the ContextClosedCallback is notified.
             *
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::DOUBLE_TEARDOWN, which is logged and otherwise ignored.
             */
            BTBStatusCode teardown(const uint16_t conn_handle, const uint8_t reason) noexcept;

            /**
             * Removes the given unbound context, i.e. a cancelled connect attempt.
             * @return true if removed
             */
            bool discard(const ConnectionContextRef& ctx) noexcept;

            /**
             * Registers a callback for the live connection handle.
             * @return BTBStatusCode::SUCCESS or BTBStatusCode::NOT_CONNECTED if no live context is bound to the handle
             */
            BTBStatusCode registerCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                                           const RegistryCallback& cb) noexcept;

            /** Returns the number of live contexts. */
            jau::nsize_t size() const noexcept { return contexts.size(); }

            /** Returns the number of live contexts owned by the given manager. */
            jau::nsize_t count(const ConnectionManager * owner) const noexcept;

            /** Returns a copy of all live contexts owned by the given manager. */
            jau::darray<ConnectionContextRef> getContexts(const ConnectionManager * owner) const noexcept;

            std::string toString() const noexcept;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_CONNECTION_TABLE_HPP_ */
