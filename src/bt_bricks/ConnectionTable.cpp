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

#include "ConnectionTable.hpp"

using namespace bt_bricks;

ConnectionContext::ConnectionContext(const uint32_t id_, const ProtocolTag protocol_, const BTRole role_,
                                     const BDAddressAndType& peer_, ConnectionManager * owner_) noexcept
: id(id_), protocol(protocol_), role(role_), peer(peer_), owner(owner_),
  state(ConnState::CONNECTING), conn_handle(INVALID_CONN_HANDLE), in_teardown(false),
  peer_name(), svc_start_handle(0), svc_end_handle(0), value_handles(), mtu(DEFAULT_MTU)
{
    value_handles.fill(0);
}

bool ConnectionContext::advanceState(const ConnState newState) noexcept {
    if( ConnState::CLOSED == newState || newState <= state ) {
        DBG_PRINT("ConnectionContext::advanceState: Refused %s -> %s: %s",
                to_string(state).c_str(), to_string(newState).c_str(), toString().c_str());
        return false;
    }
    DBG_PRINT("ConnectionContext::advanceState: %s -> %s: id %u", to_string(state).c_str(), to_string(newState).c_str(), id);
    state = newState;
    return true;
}

std::string ConnectionContext::toString() const noexcept {
    std::string vh_str;
    for(jau::nsize_t i=0; i<CHAR_ROLE_COUNT; ++i) {
        if( 0 != value_handles[i] ) {
            vh_str.append(", "+to_string(static_cast<CharRole>(i))+" "+jau::to_hexstring(value_handles[i]));
        }
    }
    return "ConnCtx[id "+std::to_string(id)+", "+to_string(protocol)+", "+to_string(role)+", "+to_string(state)+
           ", handle "+jau::to_hexstring(conn_handle)+", peer "+peer.toString()+", name '"+peer_name+"'"+
           ", svc ["+jau::to_hexstring(svc_start_handle)+".."+jau::to_hexstring(svc_end_handle)+"]"+vh_str+
           ", mtu "+std::to_string(mtu)+"]";
}

ConnectionTable::ConnectionTable(CallbackRegistry & registry_) noexcept
: env(BTBEnv::get()), registry(registry_), contexts(), next_id(1), closedCallback()
{ }

bool ConnectionTable::contains(const ConnectionContextRef& ctx) const noexcept {
    for (const auto& e : contexts) {
        if ( e == ctx ) {
            return true;
        }
    }
    return false;
}

void ConnectionTable::remove(const ConnectionContextRef& ctx) noexcept {
    auto end = contexts.end();
    for (auto it = contexts.begin(); it != end; ++it) {
        if ( *it == ctx ) {
            contexts.erase(it);
            return; // done
        }
    }
}

ConnectionContextRef ConnectionTable::createContext(const ProtocolTag protocol, const BTRole role,
                                                    const BDAddressAndType& peer, ConnectionManager * owner) noexcept
{
    ConnectionContextRef ctx = std::make_shared<ConnectionContext>(next_id++, protocol, role, peer, owner);
    contexts.push_back(ctx);
    DBG_PRINT("ConnectionTable::create: %s, live %zu", ctx->toString().c_str(), (size_t)contexts.size());
    return ctx;
}

BTBStatusCode ConnectionTable::bindHandle(const ConnectionContextRef& ctx, const uint16_t conn_handle) noexcept {
    if( nullptr == ctx || INVALID_CONN_HANDLE == conn_handle ) {
        return BTBStatusCode::INVALID_PARAMS;
    }
    if( !contains(ctx) ) {
        WARN_PRINT("ConnectionTable::bind: Context not live, handle %s: %s",
                jau::to_hexstring(conn_handle).c_str(), ctx->toString().c_str());
        return BTBStatusCode::NOT_FOUND;
    }
    if( ctx->isBound() ) {
        if( conn_handle == ctx->conn_handle ) {
            return BTBStatusCode::SUCCESS;
        }
        WARN_PRINT("ConnectionTable::bind: Context already bound, handle %s: %s",
                jau::to_hexstring(conn_handle).c_str(), ctx->toString().c_str());
        return BTBStatusCode::INVALID_PARAMS;
    }
    ConnectionContextRef stale = lookup(conn_handle);
    if( nullptr != stale ) {
        WARN_PRINT("ConnectionTable::bind: Stale context with handle %s, tearing down: %s",
                jau::to_hexstring(conn_handle).c_str(), stale->toString().c_str());
        teardown(conn_handle, 0);
    }
    ctx->conn_handle = conn_handle;
    if( BTRole::Peripheral == ctx->role ) {
        ctx->advanceState(ConnState::READY);
    } else {
        ctx->advanceState(ConnState::DISCOVERING_SERVICES);
    }
    DBG_PRINT("ConnectionTable::bind: %s", ctx->toString().c_str());
    return BTBStatusCode::SUCCESS;
}

ConnectionContextRef ConnectionTable::lookup(const uint16_t conn_handle) const noexcept {
    if( INVALID_CONN_HANDLE == conn_handle ) {
        return nullptr;
    }
    const jau::nsize_t size = contexts.size();
    for (jau::nsize_t i = 0; i < size; i++) {
        const ConnectionContextRef & e = contexts[i];
        if ( conn_handle == e->conn_handle ) {
            return e;
        }
    }
    return nullptr;
}

ConnectionContextRef ConnectionTable::lookupPending(const BDAddressAndType& peer) const noexcept {
    for (const auto& e : contexts) {
        if ( !e->isBound() && e->peer.matches(peer) ) {
            return e;
        }
    }
    return nullptr;
}

BTBStatusCode ConnectionTable::teardown(const uint16_t conn_handle, const uint8_t reason) noexcept {
    ConnectionContextRef ctx = lookup(conn_handle);
    if( nullptr == ctx || ctx->in_teardown ) {
        WORDY_PRINT("ConnectionTable::teardown: %s, handle %s, reason %s",
                to_string(BTBStatusCode::DOUBLE_TEARDOWN).c_str(), jau::to_hexstring(conn_handle).c_str(),
                jau::to_hexstring(reason).c_str());
        return BTBStatusCode::DOUBLE_TEARDOWN;
    }
    ctx->in_teardown = true;
    ctx->advanceState(ConnState::DISCONNECTING);

    const jau::TROOctets empty(nullptr, 0, jau::lb_endian::little);
    registry.trigger(conn_handle, CallbackKind::DISCONNECT, 0, empty, reason);
    const jau::nsize_t removed = registry.cleanup(conn_handle);

    remove(ctx);
    ctx->state = ConnState::CLOSED;
    COND_PRINT(env.DEBUG_EVENT, "ConnectionTable::teardown: removed %zu callbacks, live %zu: %s",
            (size_t)removed, (size_t)contexts.size(), ctx->toString().c_str());
    (void)removed;

    if( !closedCallback.is_null() ) {
        closedCallback(ctx, reason);
    }
    return BTBStatusCode::SUCCESS;
}

bool ConnectionTable::discard(const ConnectionContextRef& ctx) noexcept {
    if( nullptr == ctx || ctx->isBound() || !contains(ctx) ) {
        return false;
    }
    remove(ctx);
    ctx->state = ConnState::CLOSED;
    DBG_PRINT("ConnectionTable::discard: live %zu: %s", (size_t)contexts.size(), ctx->toString().c_str());
    return true;
}

BTBStatusCode ConnectionTable::registerCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                                                const RegistryCallback& cb) noexcept
{
    ConnectionContextRef ctx = lookup(conn_handle);
    if( nullptr == ctx || ctx->in_teardown ) {
        WARN_PRINT("ConnectionTable::registerCallback: No live context for handle %s, %s",
                jau::to_hexstring(conn_handle).c_str(), to_string(kind).c_str());
        return BTBStatusCode::NOT_CONNECTED;
    }
    registry.registerCallback(conn_handle, kind, attr_handle, cb);
    return BTBStatusCode::SUCCESS;
}

jau::nsize_t ConnectionTable::count(const ConnectionManager * owner) const noexcept {
    jau::nsize_t count = 0;
    for (const auto& e : contexts) {
        if ( owner == e->owner ) {
            count++;
        }
    }
    return count;
}

jau::darray<ConnectionContextRef> ConnectionTable::getContexts(const ConnectionManager * owner) const noexcept {
    jau::darray<ConnectionContextRef> res;
    for (const auto& e : contexts) {
        if ( owner == e->owner ) {
            res.push_back(e);
        }
    }
    return res;
}

std::string ConnectionTable::toString() const noexcept {
    std::string out("ConnectionTable[live "+std::to_string(contexts.size()));
    for (const auto& e : contexts) {
        out.append(", "+e->toString());
    }
    out.append("]");
    return out;
}
