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
#include <algorithm>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "ConnectionManager.hpp"

using namespace bt_bricks;

ConnectionManager::ConnectionManager(RadioControl & radio_, ConnectionTable & table_, ProtocolConfig config_, const BTRole role_) noexcept
: env(BTBEnv::get()), radio(radio_), table(table_), config(std::move(config_)), role(role_)
{ }

BTBStatusCode ConnectionManager::sendFragmented(const ConnectionContextRef& ctx, const uint16_t value_handle,
                                                const jau::TROOctets & value, const bool notify, const bool with_response) noexcept
{
    const uint16_t conn_handle = ctx->getConnHandle();
    const jau::nsize_t frag_max = ctx->getTransferSize();
    const jau::nsize_t size = value.size();
    if( 0 == frag_max ) {
        return BTBStatusCode::INVALID_PARAMS;
    }
    jau::nsize_t offset = 0;
    do {
        const jau::nsize_t len = std::min<jau::nsize_t>(frag_max, size - offset);
        const jau::TROOctets frag(0 < len ? value.get_ptr() + offset : nullptr, len, jau::lb_endian::little);
        const BTBStatusCode res = notify ? radio.gattsNotify(conn_handle, value_handle, frag)
                                         : radio.gattcWrite(conn_handle, value_handle, frag, with_response);
        if( BTBStatusCode::SUCCESS != res ) {
            ERR_PRINT("ConnectionManager::send: %s: Radio failed %s at offset %zu/%zu: %s",
                    to_string(config.tag).c_str(), to_string(res).c_str(), (size_t)offset, (size_t)size, ctx->toString().c_str());
            return BTBStatusCode::RADIO_ERROR;
        }
        offset += len;
    } while( offset < size );
    return BTBStatusCode::SUCCESS;
}

//
// CentralConnectionManager
//

CentralConnectionManager::CentralConnectionManager(RadioControl & radio_, ConnectionTable & table_, DiscoveryEngine & discovery_,
                                                   ProtocolConfig config_) noexcept
: ConnectionManager(radio_, table_, std::move(config_), BTRole::Central),
  discovery(discovery_), state(ConnState::IDLE), ctx(nullptr), completion(), deadline(0)
{ }

CentralConnectionManager::~CentralConnectionManager() noexcept {
    completion = ConnectCompletion();
    if( ConnState::SCANNING == state && nullptr == ctx ) {
        discovery.stopScan();
    }
    closeConnection();
    if( nullptr != ctx && !ctx->isClosed() ) {
        // no late disconnect event may reach this instance
        table.teardown(ctx->getConnHandle(), 0);
    }
}

ConnState CentralConnectionManager::getState() const noexcept {
    return nullptr != ctx ? ctx->getState() : state;
}

uint16_t CentralConnectionManager::getConnHandle() const noexcept {
    return nullptr != ctx && !ctx->isClosed() ? ctx->getConnHandle() : INVALID_CONN_HANDLE;
}

uint16_t CentralConnectionManager::getValueHandle(const CharRole r) const noexcept {
    return nullptr != ctx ? ctx->getValueHandle(r) : 0;
}

std::string CentralConnectionManager::getPeerName() const noexcept {
    return nullptr != ctx ? ctx->getPeerName() : std::string();
}

uint16_t CentralConnectionManager::getMTU() const noexcept {
    return nullptr != ctx ? ctx->getMTU() : ConnectionContext::DEFAULT_MTU;
}

jau::darray<ConnectionContextRef> CentralConnectionManager::getLiveContexts() const noexcept {
    jau::darray<ConnectionContextRef> res;
    if( nullptr != ctx && !ctx->isClosed() ) {
        res.push_back(ctx);
    }
    return res;
}

void CentralConnectionManager::complete(const BTBStatusCode status) noexcept {
    deadline = 0;
    ConnectCompletion cb = completion;
    completion = ConnectCompletion();
    if( cb.is_null() ) {
        return;
    }
    const uint16_t conn_handle = BTBStatusCode::SUCCESS == status ? getConnHandle() : INVALID_CONN_HANDLE;
    if( BTBStatusCode::SUCCESS == status ) {
        DBG_PRINT("CentralConnectionManager::complete: %s: %s", to_string(status).c_str(), toString().c_str());
    } else {
        WORDY_PRINT("CentralConnectionManager::complete: %s: %s", to_string(status).c_str(), toString().c_str());
    }
    try {
        cb(status, conn_handle);
    } catch (std::exception &e) {
        ERR_PRINT("CentralConnectionManager::complete: %s: Caught exception %s", to_string(status).c_str(), e.what());
    }
}

void CentralConnectionManager::closeConnection() noexcept {
    if( nullptr == ctx || ctx->isClosed() ) {
        return;
    }
    // keep a reference, teardown may run synchronously
    ConnectionContextRef c = ctx;
    if( !c->isBound() ) {
        radio.cancelConnect();
        table.discard(c);
        return;
    }
    if( ConnState::DISCONNECTING <= c->getState() ) {
        return; // already on its way
    }
    c->advanceState(ConnState::DISCONNECTING);
    const uint16_t conn_handle = c->getConnHandle();
    deadline = jau::getCurrentMilliseconds() + static_cast<uint64_t>(env.DISCONNECT_TIMEOUT);
    const BTBStatusCode res = radio.disconnect(conn_handle);
    if( BTBStatusCode::SUCCESS != res ) {
        WARN_PRINT("CentralConnectionManager::closeConnection: Radio disconnect failed %s, local teardown: %s",
                to_string(res).c_str(), c->toString().c_str());
        table.teardown(conn_handle, 0);
    }
}

void CentralConnectionManager::fail(const BTBStatusCode status) noexcept {
    complete(status);
    closeConnection();
}

BTBStatusCode CentralConnectionManager::connect(const SearchCriteria& criteria, const int32_t timeout_ms, const ConnectCompletion& completion_) noexcept {
    const ConnState s = getState();
    if( ConnState::IDLE != s && ConnState::CLOSED != s ) {
        WORDY_PRINT("CentralConnectionManager::connect: %s, %s", to_string(BTBStatusCode::BUSY).c_str(), toString().c_str());
        return BTBStatusCode::BUSY;
    }
    const int32_t timeout = 0 < timeout_ms ? timeout_ms : env.CONNECT_TIMEOUT;
    ctx = nullptr;
    state = ConnState::SCANNING;
    completion = completion_;
    deadline = jau::getCurrentMilliseconds() + static_cast<uint64_t>(timeout);
    DBG_PRINT("CentralConnectionManager::connect: %s, timeout %d ms, %s",
            to_string(config.tag).c_str(), timeout, criteria.toString().c_str());

    const BTBStatusCode res = discovery.startScan(criteria, std::min(timeout, env.SCAN_TIMEOUT),
                                                  jau::bind_member(this, &CentralConnectionManager::scanComplete));
    if( BTBStatusCode::SUCCESS != res ) {
        if( nullptr == ctx && ConnState::SCANNING == state ) {
            state = ConnState::IDLE;
            completion = ConnectCompletion();
            deadline = 0;
        }
        return res;
    }
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode CentralConnectionManager::connect(const std::string& name, const int32_t timeout_ms, const ConnectCompletion& completion_) noexcept {
    if( config.match_name ) {
        return connect(SearchCriteria(name, config.service_uuid), timeout_ms, completion_);
    } else {
        return connect(SearchCriteria(config.service_uuid), timeout_ms, completion_);
    }
}

void CentralConnectionManager::scanComplete(const BTBStatusCode status, const DeviceRecord* record) noexcept {
    if( ConnState::SCANNING != state || nullptr != ctx ) {
        DBG_PRINT("CentralConnectionManager::scanComplete: Ignored %s, %s", to_string(status).c_str(), toString().c_str());
        return;
    }
    state = ConnState::IDLE;
    if( BTBStatusCode::SUCCESS != status || nullptr == record ) {
        complete(BTBStatusCode::SUCCESS != status ? status : BTBStatusCode::NOT_FOUND);
        return;
    }
    ctx = table.createContext(config.tag, BTRole::Central, record->addressAndType, this);
    ctx->setPeerName(record->name);
    DBG_PRINT("CentralConnectionManager::scanComplete: Connecting %s", ctx->toString().c_str());

    const BTBStatusCode res = radio.connect(record->addressAndType);
    if( BTBStatusCode::SUCCESS != res ) {
        ERR_PRINT("CentralConnectionManager::scanComplete: Radio connect failed %s: %s",
                to_string(res).c_str(), ctx->toString().c_str());
        table.discard(ctx);
        complete(BTBStatusCode::RADIO_ERROR);
    }
}

void CentralConnectionManager::connected(const ConnectionContextRef& ctx_) noexcept {
    if( ctx_ != ctx ) {
        WARN_PRINT("CentralConnectionManager::connected: Foreign context %s, own %s",
                ctx_->toString().c_str(), nullptr != ctx ? ctx->toString().c_str() : "null");
        return;
    }
    DBG_PRINT("CentralConnectionManager::connected: %s", ctx->toString().c_str());
    const BTBStatusCode res = radio.discoverServices(ctx->getConnHandle(), *config.service_uuid);
    if( BTBStatusCode::SUCCESS != res ) {
        ERR_PRINT("CentralConnectionManager::connected: Radio service discovery failed %s: %s",
                to_string(res).c_str(), ctx->toString().c_str());
        fail(BTBStatusCode::RADIO_ERROR);
    }
}

void CentralConnectionManager::disconnected(const ConnectionContextRef& ctx_, const uint8_t reason) noexcept {
    if( ctx_ != ctx ) {
        return;
    }
    DBG_PRINT("CentralConnectionManager::disconnected: reason %s: %s", jau::to_hexstring(reason).c_str(), ctx->toString().c_str());
    complete(BTBStatusCode::CONNECTION_LOST); // no-op if completed already
    deadline = 0;
}

void CentralConnectionManager::gattEvent(const ConnectionContextRef& ctx_, const RadioEvent& e) noexcept {
    if( ctx_ != ctx || ctx->isClosed() ) {
        return;
    }
    const uint16_t conn_handle = ctx->getConnHandle();
    const ConnState s = ctx->getState();
    switch( e.getOpcode() ) {
        case RadioEvent::Opcode::GATTC_SERVICE_RESULT: {
            if( ConnState::DISCOVERING_SERVICES != s ) {
                break;
            }
            const RadioEvtServiceResult & event = static_cast<const RadioEvtServiceResult&>(e);
            if( event.getUUID()->equivalent(*config.service_uuid) ) {
                ctx->setServiceRange(event.getStartHandle(), event.getEndHandle());
                DBG_PRINT("CentralConnectionManager::gattEvent: Service %s", ctx->toString().c_str());
            }
        } break;

        case RadioEvent::Opcode::GATTC_SERVICE_DONE: {
            if( ConnState::DISCOVERING_SERVICES != s ) {
                break;
            }
            if( !ctx->hasServiceRange() ) {
                WORDY_PRINT("CentralConnectionManager::gattEvent: %s, service %s not found: %s",
                        to_string(BTBStatusCode::INCOMPLETE_SERVICE).c_str(),
                        config.service_uuid->toUUID128String().c_str(), ctx->toString().c_str());
                fail(BTBStatusCode::INCOMPLETE_SERVICE);
                break;
            }
            ctx->advanceState(ConnState::DISCOVERING_CHARACTERISTICS);
            const BTBStatusCode res = radio.discoverCharacteristics(conn_handle, ctx->getServiceStartHandle(), ctx->getServiceEndHandle());
            if( BTBStatusCode::SUCCESS != res ) {
                ERR_PRINT("CentralConnectionManager::gattEvent: Radio characteristic discovery failed %s: %s",
                        to_string(res).c_str(), ctx->toString().c_str());
                fail(BTBStatusCode::RADIO_ERROR);
            }
        } break;

        case RadioEvent::Opcode::GATTC_CHARACTERISTIC_RESULT: {
            if( ConnState::DISCOVERING_CHARACTERISTICS != s ) {
                break;
            }
            const RadioEvtCharResult & event = static_cast<const RadioEvtCharResult&>(e);
            const CharSpec * cs = config.findChar(*event.getUUID());
            if( nullptr != cs ) {
                ctx->setValueHandle(cs->role, event.getValueHandle());
            }
        } break;

        case RadioEvent::Opcode::GATTC_CHARACTERISTIC_DONE: {
            if( ConnState::DISCOVERING_CHARACTERISTICS != s ) {
                break;
            }
            for(const CharSpec & cs : config.chars) {
                if( cs.required && !ctx->hasValueHandle(cs.role) ) {
                    WORDY_PRINT("CentralConnectionManager::gattEvent: %s, missing %s: %s",
                            to_string(BTBStatusCode::INCOMPLETE_SERVICE).c_str(), cs.toString().c_str(), ctx->toString().c_str());
                    fail(BTBStatusCode::INCOMPLETE_SERVICE);
                    return;
                }
            }
            enterReady();
        } break;

        default:
            break;
    }
}

void CentralConnectionManager::enterReady() noexcept {
    const uint16_t conn_handle = ctx->getConnHandle();
    ctx->advanceState(ConnState::READY);

    static const uint8_t cccd_notify[] = { 0x01, 0x00 };
    const jau::TROOctets cccd_value(cccd_notify, sizeof(cccd_notify), jau::lb_endian::little);

    for(const CharSpec & cs : config.chars) {
        const uint16_t vh = ctx->getValueHandle(cs.role);
        if( 0 == vh || !cs.isNotifiable() ) {
            continue;
        }
        // client characteristic configuration descriptor follows the value
        const BTBStatusCode res = radio.gattcWrite(conn_handle, vh+1, cccd_value, true);
        if( BTBStatusCode::SUCCESS != res ) {
            WARN_PRINT("CentralConnectionManager::enterReady: Enable notification of %s failed %s",
                    to_string(cs.role).c_str(), to_string(res).c_str());
        }
    }

    const BTBStatusCode res = radio.exchangeMTU(conn_handle, static_cast<uint16_t>(env.GATT_TARGET_MTU));
    if( BTBStatusCode::SUCCESS != res ) {
        WARN_PRINT("CentralConnectionManager::enterReady: MTU exchange failed %s, using %u",
                to_string(res).c_str(), (unsigned)ctx->getMTU());
    }
    complete(BTBStatusCode::SUCCESS);
}

BTBStatusCode CentralConnectionManager::onReceive(const CharRole r, const ReceiveCallback& cb) noexcept {
    if( nullptr == ctx || ConnState::READY != ctx->getState() ) {
        return BTBStatusCode::NOT_CONNECTED;
    }
    const CharSpec * cs = config.findChar(r);
    const uint16_t vh = ctx->getValueHandle(r);
    if( nullptr == cs || !cs->isNotifiable() || 0 == vh ) {
        WARN_PRINT("CentralConnectionManager::onReceive: %s not notifiable: %s", to_string(r).c_str(), ctx->toString().c_str());
        return BTBStatusCode::INVALID_PARAMS;
    }
    return table.registerCallback(ctx->getConnHandle(), CallbackKind::NOTIFY, vh,
            RegistryCallback( [cb](const uint16_t h, const uint16_t attr, const jau::TROOctets& v, const uint16_t status) {
                (void)attr;
                (void)status;
                ReceiveCallback f = cb;
                f(h, v);
            } ) );
}

BTBStatusCode CentralConnectionManager::onWriteDone(const WriteDoneCallback& cb) noexcept {
    if( nullptr == ctx || ConnState::READY != ctx->getState() ) {
        return BTBStatusCode::NOT_CONNECTED;
    }
    const uint16_t conn_handle = ctx->getConnHandle();
    for(const CharSpec & cs : config.chars) {
        const uint16_t vh = ctx->getValueHandle(cs.role);
        if( 0 == vh || !cs.isWritable() ) {
            continue;
        }
        const BTBStatusCode res = table.registerCallback(conn_handle, CallbackKind::WRITE_DONE, vh,
                RegistryCallback( [cb](const uint16_t h, const uint16_t attr, const jau::TROOctets& v, const uint16_t status) {
                    (void)v;
                    WriteDoneCallback f = cb;
                    f(h, attr, status);
                } ) );
        if( BTBStatusCode::SUCCESS != res ) {
            return res;
        }
    }
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode CentralConnectionManager::onDisconnect(const DisconnectCallback& cb) noexcept {
    if( nullptr == ctx || ConnState::READY != ctx->getState() ) {
        return BTBStatusCode::NOT_CONNECTED;
    }
    return table.registerCallback(ctx->getConnHandle(), CallbackKind::DISCONNECT, 0,
            RegistryCallback( [cb](const uint16_t h, const uint16_t attr, const jau::TROOctets& v, const uint16_t reason) {
                (void)attr;
                (void)v;
                DisconnectCallback f = cb;
                f(h, static_cast<uint8_t>(reason));
            } ) );
}

BTBStatusCode CentralConnectionManager::send(const CharRole r, const jau::TROOctets & value, const bool with_response) noexcept {
    if( nullptr == ctx || ConnState::READY != ctx->getState() ) {
        return BTBStatusCode::NOT_CONNECTED;
    }
    const uint16_t vh = ctx->getValueHandle(r);
    if( 0 == vh ) {
        WARN_PRINT("CentralConnectionManager::send: No value handle for %s: %s", to_string(r).c_str(), ctx->toString().c_str());
        return BTBStatusCode::INVALID_PARAMS;
    }
    return sendFragmented(ctx, vh, value, false /* notify */, with_response);
}

BTBStatusCode CentralConnectionManager::disconnect() noexcept {
    const ConnState s = getState();
    DBG_PRINT("CentralConnectionManager::disconnect: %s", toString().c_str());
    if( ConnState::SCANNING == s && nullptr == ctx ) {
        // cancelled by the application, completion is dropped
        completion = ConnectCompletion();
        deadline = 0;
        state = ConnState::IDLE;
        discovery.stopScan();
        return BTBStatusCode::SUCCESS;
    }
    if( nullptr == ctx || ctx->isClosed() ) {
        return BTBStatusCode::NOT_CONNECTED;
    }
    completion = ConnectCompletion();
    deadline = 0;
    closeConnection();
    return BTBStatusCode::SUCCESS;
}

void CentralConnectionManager::checkTimeouts(const uint64_t now) noexcept {
    if( 0 == deadline || now < deadline ) {
        return;
    }
    const ConnState s = getState();
    if( ConnState::DISCONNECTING == s && nullptr != ctx && ctx->isBound() ) {
        deadline = 0;
        WARN_PRINT("CentralConnectionManager::checkTimeouts: Disconnect not confirmed, local teardown: %s", ctx->toString().c_str());
        table.teardown(ctx->getConnHandle(), 0);
        return;
    }
    WORDY_PRINT("CentralConnectionManager::checkTimeouts: %s in %s, %s",
            to_string(BTBStatusCode::CONNECT_TIMEOUT).c_str(), to_string(s).c_str(), toString().c_str());
    if( ConnState::SCANNING == s && nullptr == ctx ) {
        state = ConnState::IDLE;
        discovery.stopScan();
        complete(BTBStatusCode::CONNECT_TIMEOUT);
        return;
    }
    if( ConnState::READY <= s ) {
        deadline = 0;
        return;
    }
    fail(BTBStatusCode::CONNECT_TIMEOUT);
}

std::string CentralConnectionManager::toString() const noexcept {
    return "CentralMgr["+to_string(config.tag)+", "+to_string(getState())+
           ", "+(nullptr != ctx ? ctx->toString() : std::string("no context"))+"]";
}

//
// PeripheralConnectionManager
//

PeripheralConnectionManager::PeripheralConnectionManager(RadioControl & radio_, ConnectionTable & table_, ProtocolConfig config_,
                                                         const int32_t adv_interval_us) noexcept
: ConnectionManager(radio_, table_, std::move(config_), BTRole::Peripheral),
  registered(false), started(false), advertising(false), advIntervalUS(adv_interval_us),
  advName(), advData(), localHandles(), receiveCallbacks(), connectCallback(), disconnectCallback(), peers()
{
    localHandles.fill(0);
}

PeripheralConnectionManager::~PeripheralConnectionManager() noexcept {
    stop();
    // no late event may reach this instance
    const jau::darray<ConnectionContextRef> list = peers;
    for(const ConnectionContextRef & c : list) {
        if( !c->isClosed() ) {
            table.teardown(c->getConnHandle(), 0);
        }
    }
    peers.clear();
}

bool PeripheralConnectionManager::servesIncoming() const noexcept {
    return started && getConnectionCount() < static_cast<jau::nsize_t>(env.PERIPHERAL_MAX_CONNECTIONS);
}

bool PeripheralConnectionManager::removePeer(const ConnectionContextRef& ctx) noexcept {
    auto end = peers.end();
    for (auto it = peers.begin(); it != end; ++it) {
        if ( *it == ctx ) {
            peers.erase(it);
            return true;
        }
    }
    return false;
}

void PeripheralConnectionManager::deliverReceived(const CharRole r, const uint16_t conn_handle, const jau::TROOctets& value) {
    ReceiveCallback cb = receiveCallbacks[number(r)];
    if( cb.is_null() ) {
        COND_PRINT(env.DEBUG_EVENT, "PeripheralConnectionManager::deliverReceived: %s: No callback for %s, handle %s, size %zu",
                to_string(config.tag).c_str(), to_string(r).c_str(), jau::to_hexstring(conn_handle).c_str(), (size_t)value.size());
        return;
    }
    cb(conn_handle, value);
}

BTBStatusCode PeripheralConnectionManager::onReceive(const CharRole r, const ReceiveCallback& cb) noexcept {
    const CharSpec * cs = config.findChar(r);
    if( nullptr == cs || !cs->isWritable() ) {
        WARN_PRINT("PeripheralConnectionManager::onReceive: %s not writable: %s", to_string(r).c_str(), config.toString().c_str());
        return BTBStatusCode::INVALID_PARAMS;
    }
    receiveCallbacks[number(r)] = cb;
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode PeripheralConnectionManager::registerLayout() noexcept {
    if( registered ) {
        return BTBStatusCode::SUCCESS;
    }
    const jau::darray<GattCharDecl> decls = config.getCharDecls();
    jau::darray<uint16_t> handles;
    const BTBStatusCode res = radio.registerService(*config.service_uuid, decls, handles);
    if( BTBStatusCode::SUCCESS != res || handles.size() != decls.size() ) {
        ERR_PRINT("PeripheralConnectionManager::registerLayout: Radio failed %s, handles %zu/%zu: %s",
                to_string(res).c_str(), (size_t)handles.size(), (size_t)decls.size(), config.toString().c_str());
        return BTBStatusCode::RADIO_ERROR;
    }
    for(jau::nsize_t i=0; i<config.chars.size(); ++i) {
        localHandles[number(config.chars[i].role)] = handles[i];
    }
    registered = true;
    DBG_PRINT("PeripheralConnectionManager::registerLayout: %s", toString().c_str());
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode PeripheralConnectionManager::startAdvertising() noexcept {
    const jau::TROOctets data(advData.data(), advData.size(), jau::lb_endian::little);
    const BTBStatusCode res = radio.startAdvertising(advIntervalUS, data);
    if( BTBStatusCode::SUCCESS != res ) {
        ERR_PRINT("PeripheralConnectionManager::startAdvertising: Radio failed %s: %s", to_string(res).c_str(), toString().c_str());
        advertising = false;
        return BTBStatusCode::RADIO_ERROR;
    }
    advertising = true;
    return BTBStatusCode::SUCCESS;
}

void PeripheralConnectionManager::resumeAdvertising() noexcept {
    if( !started || advertising ) {
        return;
    }
    const jau::nsize_t count = getConnectionCount();
    if( count >= static_cast<jau::nsize_t>(env.PERIPHERAL_MAX_CONNECTIONS) ) {
        WORDY_PRINT("PeripheralConnectionManager::resumeAdvertising: %s, %zu connections",
                to_string(BTBStatusCode::CONNECTION_LIMIT).c_str(), (size_t)count);
        return;
    }
    startAdvertising();
}

BTBStatusCode PeripheralConnectionManager::start(const std::string& advertised_name) noexcept {
    if( started ) {
        return BTBStatusCode::BUSY;
    }
    AdvPayload adv;
    adv.setFlags(GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP);
    adv.setName(advertised_name);
    adv.addService(config.service_uuid);
    adv.setServicesComplete(true);
    std::vector<uint8_t> data;
    const BTBStatusCode enc_res = adv.encode(data);
    if( BTBStatusCode::SUCCESS != enc_res ) {
        WORDY_PRINT("PeripheralConnectionManager::start: %s, %zu > %zu bytes: %s",
                to_string(enc_res).c_str(), (size_t)adv.getEncodedSize(AdvDataType::ALL),
                (size_t)AdvPayload::MAX_ADV_LENGTH, adv.toString().c_str());
        return enc_res;
    }
    const BTBStatusCode reg_res = registerLayout();
    if( BTBStatusCode::SUCCESS != reg_res ) {
        return reg_res;
    }
    advName = advertised_name;
    advData = std::move(data);
    started = true;
    const BTBStatusCode res = startAdvertising();
    if( BTBStatusCode::SUCCESS != res ) {
        started = false;
        return res;
    }
    DBG_PRINT("PeripheralConnectionManager::start: %s", toString().c_str());
    return BTBStatusCode::SUCCESS;
}

BTBStatusCode PeripheralConnectionManager::stop() noexcept {
    const bool was_advertising = advertising;
    started = false;
    advertising = false;
    BTBStatusCode res = BTBStatusCode::SUCCESS;
    if( was_advertising && BTBStatusCode::SUCCESS != radio.stopAdvertising() ) {
        res = BTBStatusCode::RADIO_ERROR;
    }
    if( BTBStatusCode::SUCCESS != disconnect() && BTBStatusCode::SUCCESS == res ) {
        res = BTBStatusCode::RADIO_ERROR;
    }
    DBG_PRINT("PeripheralConnectionManager::stop: %s: %s", to_string(res).c_str(), toString().c_str());
    return res;
}

void PeripheralConnectionManager::connected(const ConnectionContextRef& ctx) noexcept {
    const uint16_t conn_handle = ctx->getConnHandle();
    peers.push_back(ctx);
    // connectable advertising ends with the connection
    advertising = false;

    for(const CharSpec & cs : config.chars) {
        const uint16_t vh = localHandles[number(cs.role)];
        ctx->setValueHandle(cs.role, vh);
        if( 0 != vh && cs.isWritable() ) {
            const CharRole r = cs.role;
            table.registerCallback(conn_handle, CallbackKind::WRITE_RECEIVED, vh,
                    RegistryCallback( [this, r](const uint16_t h, const uint16_t attr, const jau::TROOctets& v, const uint16_t status) {
                        (void)attr;
                        (void)status;
                        deliverReceived(r, h, v);
                    } ) );
        }
    }
    DBG_PRINT("PeripheralConnectionManager::connected: %s: %s, connections %zu",
            to_string(config.tag).c_str(), ctx->toString().c_str(), (size_t)getConnectionCount());
    ConnectCallback cb = connectCallback;
    if( !cb.is_null() ) {
        try {
            cb(conn_handle, ctx->getPeer());
        } catch (std::exception &e) {
            ERR_PRINT("PeripheralConnectionManager::connected: Caught exception %s", e.what());
        }
    }
    resumeAdvertising();
}

void PeripheralConnectionManager::disconnected(const ConnectionContextRef& ctx, const uint8_t reason) noexcept {
    if( !removePeer(ctx) ) {
        return;
    }
    DBG_PRINT("PeripheralConnectionManager::disconnected: %s: reason %s: %s, connections %zu",
            to_string(config.tag).c_str(), jau::to_hexstring(reason).c_str(), ctx->toString().c_str(), (size_t)getConnectionCount());
    DisconnectCallback cb = disconnectCallback;
    if( !cb.is_null() ) {
        try {
            cb(ctx->getConnHandle(), reason);
        } catch (std::exception &e) {
            ERR_PRINT("PeripheralConnectionManager::disconnected: Caught exception %s", e.what());
        }
    }
    resumeAdvertising();
}

BTBStatusCode PeripheralConnectionManager::send(const CharRole r, const jau::TROOctets & value, const bool with_response) noexcept {
    (void)with_response;
    const uint16_t vh = localHandles[number(r)];
    if( 0 == vh ) {
        return BTBStatusCode::INVALID_PARAMS;
    }
    const jau::darray<ConnectionContextRef> list = peers;
    BTBStatusCode res = BTBStatusCode::NOT_CONNECTED;
    for(const ConnectionContextRef & c : list) {
        if( ConnState::READY != c->getState() ) {
            continue;
        }
        const BTBStatusCode r_res = sendFragmented(c, vh, value, true /* notify */, false);
        if( BTBStatusCode::NOT_CONNECTED == res || BTBStatusCode::SUCCESS != r_res ) {
            res = r_res;
        }
    }
    return res;
}

BTBStatusCode PeripheralConnectionManager::disconnect() noexcept {
    const jau::darray<ConnectionContextRef> list = peers;
    BTBStatusCode res = BTBStatusCode::SUCCESS;
    for(const ConnectionContextRef & c : list) {
        if( c->isClosed() || ConnState::DISCONNECTING <= c->getState() ) {
            continue;
        }
        c->advanceState(ConnState::DISCONNECTING);
        const uint16_t conn_handle = c->getConnHandle();
        if( BTBStatusCode::SUCCESS != radio.disconnect(conn_handle) ) {
            WARN_PRINT("PeripheralConnectionManager::disconnect: Radio failed, local teardown: %s", c->toString().c_str());
            table.teardown(conn_handle, 0);
            res = BTBStatusCode::RADIO_ERROR;
        }
    }
    return res;
}

std::string PeripheralConnectionManager::toString() const noexcept {
    std::string vh_str;
    for(jau::nsize_t i=0; i<CHAR_ROLE_COUNT; ++i) {
        if( 0 != localHandles[i] ) {
            vh_str.append(", "+to_string(static_cast<CharRole>(i))+" "+jau::to_hexstring(localHandles[i]));
        }
    }
    return "PeripheralMgr["+to_string(config.tag)+", name '"+advName+"', started "+std::to_string(started)+
           ", advertising "+std::to_string(advertising)+", connections "+std::to_string(getConnectionCount())+vh_str+"]";
}
