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

#include "BTBEngine.hpp"

using namespace bt_bricks;

BTBEngine::BTBEngine(RadioControl & radio_)
: env(BTBEnv::get()), radio(radio_), registry(), table(registry), discovery(radio_), router(), managers()
{
    table.setContextClosedCallback( jau::bind_member(this, &BTBEngine::contextClosed) );
    router.addEventCallback(EventClass::SCAN, jau::bind_member(&discovery, &DiscoveryEngine::eventReceived));
    router.addEventCallback(EventClass::SYSTEM, jau::bind_member(this, &BTBEngine::systemEvent));
    router.addEventCallback(EventClass::GATT_CLIENT, jau::bind_member(this, &BTBEngine::gattClientEvent));
    router.addEventCallback(EventClass::GATT_SERVER, jau::bind_member(this, &BTBEngine::gattServerEvent));
    DBG_PRINT("BTBEngine::ctor: %s", radio.toString().c_str());
}

BTBEngine::~BTBEngine() noexcept {
    DBG_PRINT("BTBEngine::dtor: %s", toString().c_str());
    table.setContextClosedCallback( ContextClosedCallback() );
    managers.clear();
}

bool BTBEngine::isAttached(const ConnectionManager * mgr) const noexcept {
    for(const ConnectionManager * m : managers) {
        if( m == mgr ) {
            return true;
        }
    }
    return false;
}

bool BTBEngine::attach(ConnectionManager & mgr) {
    if( &mgr.table != &table ) {
        throw jau::IllegalArgumentException("Manager uses a foreign ConnectionTable: "+mgr.toString(), E_FILE_LINE);
    }
    if( isAttached(&mgr) ) {
        return false;
    }
    managers.push_back(&mgr);
    DBG_PRINT("BTBEngine::attach: %s, managers %zu", mgr.toString().c_str(), (size_t)managers.size());
    return true;
}

bool BTBEngine::detach(ConnectionManager & mgr) noexcept {
    if( !isAttached(&mgr) ) {
        return false;
    }
    for(const ConnectionContextRef & ctx : mgr.getLiveContexts()) {
        if( ctx->isBound() ) {
            table.teardown(ctx->getConnHandle(), 0);
        } else {
            table.discard(ctx);
        }
    }
    auto end = managers.end();
    for (auto it = managers.begin(); it != end; ++it) {
        if ( *it == &mgr ) {
            managers.erase(it);
            break;
        }
    }
    DBG_PRINT("BTBEngine::detach: %s, managers %zu", mgr.toString().c_str(), (size_t)managers.size());
    return true;
}

void BTBEngine::contextClosed(const ConnectionContextRef& ctx, const uint8_t reason) noexcept {
    if( BTRole::Peripheral == ctx->getRole() ) {
        // served by all peripheral managers, each drops its own reference
        const jau::darray<ConnectionManager*> list = managers;
        for(ConnectionManager * m : list) {
            if( BTRole::Peripheral == m->getRole() && isAttached(m) ) {
                m->disconnected(ctx, reason);
            }
        }
        return;
    }
    ConnectionManager * owner = ctx->getOwner();
    if( nullptr != owner && isAttached(owner) ) {
        owner->disconnected(ctx, reason);
    }
}

void BTBEngine::peripheralConnected(const RadioEvtConnected& e) noexcept {
    const uint16_t conn_handle = e.getConnHandle();
    const BDAddressAndType addressAndType = e.getAddressAndType();
    ConnectionContextRef ctx = table.lookupPending(addressAndType);
    if( nullptr == ctx || !isAttached(ctx->getOwner()) ) {
        WARN_PRINT("BTBEngine::peripheralConnected: No pending connect, disconnecting %s", e.toString().c_str());
        radio.disconnect(conn_handle);
        return;
    }
    const BTBStatusCode res = table.bindHandle(ctx, conn_handle);
    if( BTBStatusCode::SUCCESS != res ) {
        WARN_PRINT("BTBEngine::peripheralConnected: Bind failed %s, disconnecting %s", to_string(res).c_str(), e.toString().c_str());
        radio.disconnect(conn_handle);
        return;
    }
    ctx->getOwner()->connected(ctx);
}

void BTBEngine::centralConnected(const RadioEvtConnected& e) noexcept {
    const uint16_t conn_handle = e.getConnHandle();
    ConnectionManager * owner = nullptr;
    for(ConnectionManager * m : managers) {
        if( BTRole::Peripheral == m->getRole() && m->acceptsIncoming() ) {
            owner = m;
            break;
        }
    }
    if( nullptr == owner ) {
        WARN_PRINT("BTBEngine::centralConnected: Not advertising, disconnecting %s", e.toString().c_str());
        radio.disconnect(conn_handle);
        return;
    }
    ConnectionContextRef ctx = table.createContext(owner->getProtocol(), BTRole::Peripheral, e.getAddressAndType(), owner);
    const BTBStatusCode res = table.bindHandle(ctx, conn_handle);
    if( BTBStatusCode::SUCCESS != res ) {
        WARN_PRINT("BTBEngine::centralConnected: Bind failed %s, disconnecting %s", to_string(res).c_str(), e.toString().c_str());
        table.discard(ctx);
        radio.disconnect(conn_handle);
        return;
    }
    // one GATT server, all started peripheral managers serve the connection
    const jau::darray<ConnectionManager*> list = managers;
    for(ConnectionManager * m : list) {
        if( ctx->isClosed() ) {
            break; // disconnected from within a callback
        }
        if( BTRole::Peripheral == m->getRole() && isAttached(m) && ( m == owner || m->servesIncoming() ) ) {
            m->connected(ctx);
        }
    }
}

void BTBEngine::systemEvent(const RadioEvent& e) noexcept {
    switch( e.getOpcode() ) {
        case RadioEvent::Opcode::PERIPHERAL_CONNECT:
            peripheralConnected( static_cast<const RadioEvtConnected&>(e) );
            break;
        case RadioEvent::Opcode::CENTRAL_CONNECT:
            centralConnected( static_cast<const RadioEvtConnected&>(e) );
            break;
        case RadioEvent::Opcode::PERIPHERAL_DISCONNECT:
            [[fallthrough]];
        case RadioEvent::Opcode::CENTRAL_DISCONNECT: {
            const RadioEvtDisconnected & event = static_cast<const RadioEvtDisconnected&>(e);
            table.teardown(event.getConnHandle(), event.getReason());
        } break;
        case RadioEvent::Opcode::MTU_EXCHANGED: {
            const RadioEvtMtuExchanged & event = static_cast<const RadioEvtMtuExchanged&>(e);
            ConnectionContextRef ctx = table.lookup(event.getConnHandle());
            if( nullptr != ctx ) {
                ctx->setMTU(event.getMTU());
                DBG_PRINT("BTBEngine::systemEvent: MTU %u: %s", (unsigned)event.getMTU(), ctx->toString().c_str());
            }
        } break;
        default:
            WARN_PRINT("BTBEngine::systemEvent: Unexpected %s", e.toString().c_str());
            break;
    }
}

void BTBEngine::gattClientEvent(const RadioEvent& e) noexcept {
    const uint16_t conn_handle = static_cast<const RadioEvtConnMeta&>(e).getConnHandle();
    ConnectionContextRef ctx = table.lookup(conn_handle);
    if( nullptr == ctx ) {
        COND_PRINT(env.DEBUG_EVENT, "BTBEngine::gattClientEvent: No connection, ignored %s", e.toString().c_str());
        return;
    }
    switch( e.getOpcode() ) {
        case RadioEvent::Opcode::GATTC_NOTIFY: {
            const RadioEvtNotify & event = static_cast<const RadioEvtNotify&>(e);
            registry.trigger(conn_handle, CallbackKind::NOTIFY, event.getValueHandle(), event.getValue());
        } break;
        case RadioEvent::Opcode::GATTC_WRITE_DONE: {
            const RadioEvtWriteDone & event = static_cast<const RadioEvtWriteDone&>(e);
            const jau::TROOctets empty(nullptr, 0, jau::lb_endian::little);
            registry.trigger(conn_handle, CallbackKind::WRITE_DONE, event.getValueHandle(), empty, event.getStatus());
        } break;
        default: {
            ConnectionManager * owner = ctx->getOwner();
            if( nullptr != owner && isAttached(owner) ) {
                owner->gattEvent(ctx, e);
            }
        } break;
    }
}

void BTBEngine::gattServerEvent(const RadioEvent& e) noexcept {
    if( RadioEvent::Opcode::GATTS_WRITE != e.getOpcode() ) {
        WARN_PRINT("BTBEngine::gattServerEvent: Unexpected %s", e.toString().c_str());
        return;
    }
    const RadioEvtGattsWrite & event = static_cast<const RadioEvtGattsWrite&>(e);
    const uint16_t conn_handle = event.getConnHandle();
    if( nullptr == table.lookup(conn_handle) ) {
        COND_PRINT(env.DEBUG_EVENT, "BTBEngine::gattServerEvent: No connection, ignored %s", e.toString().c_str());
        return;
    }
    registry.trigger(conn_handle, CallbackKind::WRITE_RECEIVED, event.getValueHandle(), event.getValue());
}

void BTBEngine::checkTimeouts(const uint64_t now) noexcept {
    // a manager may be detached during its own timeout processing
    const jau::darray<ConnectionManager*> list = managers;
    for(ConnectionManager * m : list) {
        if( isAttached(m) ) {
            m->checkTimeouts(now);
        }
    }
}

void BTBEngine::checkTimeouts() noexcept {
    checkTimeouts( jau::getCurrentMilliseconds() );
}

std::string BTBEngine::toString() const noexcept {
    return "BTBEngine[managers "+std::to_string(managers.size())+", live "+std::to_string(table.size())+
           ", callbacks "+std::to_string(registry.size())+", "+discovery.toString()+", "+router.toString()+"]";
}
