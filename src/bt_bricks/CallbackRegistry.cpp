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
#include <cstdint>

#include <jau/debug.hpp>

#include "CallbackRegistry.hpp"

using namespace bt_bricks;

std::string bt_bricks::to_string(const CallbackKind v) noexcept {
    switch(v) {
        case CallbackKind::NOTIFY: return "NOTIFY";
        case CallbackKind::WRITE_RECEIVED: return "WRITE_RECEIVED";
        case CallbackKind::WRITE_DONE: return "WRITE_DONE";
        case CallbackKind::DISCONNECT: return "DISCONNECT";
    }
    return "Unknown CallbackKind";
}

CallbackRegistry::CallbackRegistry() noexcept
: env(BTBEnv::get()), entries()
{ }

CallbackRegistry::Entry* CallbackRegistry::find(const CallbackKey& key) noexcept {
    const jau::nsize_t size = entries.size();
    for (jau::nsize_t i = 0; i < size; i++) {
        Entry & e = entries[i];
        if ( key == e.key ) {
            return &e;
        }
    }
    return nullptr;
}

bool CallbackRegistry::registerCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                                        const RegistryCallback& cb) noexcept
{
    const CallbackKey key { conn_handle, kind, attr_handle };
    Entry * e = find(key);
    if( nullptr != e ) {
        WARN_PRINT("CallbackRegistry::register: Overwriting existing callback for %s", key.toString().c_str());
        e->callback = cb;
        return false;
    }
    entries.push_back( Entry { key, cb } );
    DBG_PRINT("CallbackRegistry::register: %s, entries %zu", key.toString().c_str(), (size_t)entries.size());
    return true;
}

bool CallbackRegistry::unregisterCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle) noexcept {
    const CallbackKey key { conn_handle, kind, attr_handle };
    auto end = entries.end();
    for (auto it = entries.begin(); it != end; ++it) {
        if ( key == it->key ) {
            entries.erase(it);
            return true; // done
        }
    }
    return false;
}

bool CallbackRegistry::trigger(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                               const jau::TROOctets& value, const uint16_t status) noexcept
{
    const CallbackKey key { conn_handle, kind, attr_handle };
    Entry * e = find(key);
    if( nullptr == e ) {
        COND_PRINT(env.DEBUG_EVENT, "CallbackRegistry::trigger: No listener for %s", key.toString().c_str());
        return false;
    }
    // the callback may modify the registry, e.g. disconnect and cleanup
    RegistryCallback cb = e->callback;
    try {
        cb(conn_handle, attr_handle, value, status);
    } catch (std::exception &except) {
        ERR_PRINT("CallbackRegistry::trigger: %s: Caught exception %s", key.toString().c_str(), except.what());
    }
    COND_PRINT(env.DEBUG_EVENT, "CallbackRegistry::trigger: %s, value size %zu, status %u",
            key.toString().c_str(), (size_t)value.size(), (unsigned)status);
    return true;
}

jau::nsize_t CallbackRegistry::cleanup(const uint16_t conn_handle) noexcept {
    jau::nsize_t count = 0;
    for(auto it = entries.begin(); it != entries.end(); ) {
        if( conn_handle == it->key.conn_handle ) {
            it = entries.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    DBG_PRINT("CallbackRegistry::cleanup: handle %s: removed %zu, remaining %zu",
            jau::to_hexstring(conn_handle).c_str(), (size_t)count, (size_t)entries.size());
    return count;
}

jau::nsize_t CallbackRegistry::count(const uint16_t conn_handle) const noexcept {
    jau::nsize_t count = 0;
    for (const auto& e : entries) {
        if ( conn_handle == e.key.conn_handle ) {
            count++;
        }
    }
    return count;
}

std::string CallbackRegistry::toString() const noexcept {
    std::string out("CallbackRegistry[entries "+std::to_string(entries.size()));
    for (const auto& e : entries) {
        out.append(", "+e.key.toString());
    }
    out.append("]");
    return out;
}
