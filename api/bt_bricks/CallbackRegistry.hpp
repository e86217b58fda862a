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

#ifndef BT_BRICKS_CALLBACK_REGISTRY_HPP_
#define BT_BRICKS_CALLBACK_REGISTRY_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/octets.hpp>

#include "BTBTypes.hpp"
#include "BTBEnv.hpp"

namespace bt_bricks {

    /**
     * Event kind of a CallbackRegistry entry.
     */
    enum class CallbackKind : uint8_t {
        /** Peer notified an attribute value, keyed by the peer's value handle. */
        NOTIFY          = 0,
        /** Peer wrote a local attribute value, keyed by the local value handle. */
        WRITE_RECEIVED  = 1,
        /** A write with response to the peer completed, keyed by the peer's value handle. */
        WRITE_DONE      = 2,
        /** Connection has been disconnected, attribute handle unused, i.e. zero. */
        DISCONNECT      = 3
    };
    constexpr uint8_t number(const CallbackKind rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const CallbackKind v) noexcept;

    /**
     * Registry callback, invoked via CallbackRegistry::trigger().
     *
     * Arguments are
     * - connection handle
     * - attribute value handle, zero for CallbackKind::DISCONNECT
     * - attribute value, empty for CallbackKind::WRITE_DONE and CallbackKind::DISCONNECT.
     *   The value reference is only valid during the callback.
     * - status, i.e. the write status for CallbackKind::WRITE_DONE or disconnect reason for CallbackKind::DISCONNECT,
     *   otherwise zero.
     */
    typedef jau::function<void(const uint16_t, const uint16_t, const jau::TROOctets&, const uint16_t)> RegistryCallback;

    /**
     * Composite key of a CallbackRegistry entry.
     */
    struct CallbackKey {
        uint16_t conn_handle;
        CallbackKind kind;
        uint16_t attr_handle;

        std::string toString() const noexcept {
            return "key[handle "+jau::to_hexstring(conn_handle)+", "+to_string(kind)+", attr "+jau::to_hexstring(attr_handle)+"]";
        }
    };
    inline bool operator==(const CallbackKey& lhs, const CallbackKey& rhs) noexcept {
        return lhs.conn_handle == rhs.conn_handle && lhs.kind == rhs.kind && lhs.attr_handle == rhs.attr_handle;
    }
    inline bool operator!=(const CallbackKey& lhs, const CallbackKey& rhs) noexcept
    { return !(lhs == rhs); }

    /**
     * Single registry of all per connection callbacks,
     * mapping CallbackKey to exactly one RegistryCallback.
     *
     * All entries of one connection handle are removed with cleanup(),
     * which ConnectionTable::teardown() runs before removing the connection's context.
     * Hence no callback fires against a destroyed connection.
     *
     * Single threaded use only, re-entrant calls from within a callback are supported.
     */
    class CallbackRegistry {
        public:
            struct Entry {
                CallbackKey key;
                RegistryCallback callback;
            };

        private:
            const BTBEnv & env;
            jau::darray<Entry> entries;

            Entry* find(const CallbackKey& key) noexcept;

        public:
            CallbackRegistry() noexcept;

            CallbackRegistry(const CallbackRegistry&) = delete;
            void operator=(const CallbackRegistry&) = delete;

            /**
             * Registers the given callback for the composite key.
             *
             * An existing entry is overwritten, which is logged as a warning.
             *
             * @return true if a new entry was added, false if an existing entry was overwritten
             */
            bool registerCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                                  const RegistryCallback& cb) noexcept;

            /**
             * Removes the entry of the composite key.
             * @return true if an entry was removed
             */
            bool unregisterCallback(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle) noexcept;

            /**
             * Invokes the callback registered for the composite key, if any.
             *
             * A missing entry is the regular 'no listener' case.
             * An exception thrown by the callback is logged and absorbed.
             *
             * @return true if a callback has been invoked
             */
            bool trigger(const uint16_t conn_handle, const CallbackKind kind, const uint16_t attr_handle,
                         const jau::TROOctets& value, const uint16_t status=0) noexcept;

            /**
             * Removes all entries of the given connection handle.
             * @return number of removed entries
             */
            jau::nsize_t cleanup(const uint16_t conn_handle) noexcept;

            /** Returns the number of entries of the given connection handle. */
            jau::nsize_t count(const uint16_t conn_handle) const noexcept;

            /** Returns the number of all entries. */
            jau::nsize_t size() const noexcept { return entries.size(); }

            std::string toString() const noexcept;
    };

} // namespace bt_bricks

#endif /* BT_BRICKS_CALLBACK_REGISTRY_HPP_ */
