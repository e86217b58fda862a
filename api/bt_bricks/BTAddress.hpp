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

#ifndef BT_BRICKS_ADDRESS_HPP_
#define BT_BRICKS_ADDRESS_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <functional>

#include <jau/eui48.hpp>

using jau::EUI48;

namespace bt_bricks {

    /**
     * Peer address type as reported with scan results and connection events.
     */
    enum class BDAddressType : uint8_t {
        /** Bluetooth BREDR address */
        BDADDR_BREDR      = 0x00,
        /** Bluetooth LE public address */
        BDADDR_LE_PUBLIC  = 0x01,
        /** Bluetooth LE random address */
        BDADDR_LE_RANDOM  = 0x02,
        /** Undefined */
        BDADDR_UNDEFINED  = 0xff
    };
    constexpr BDAddressType to_BDAddressType(const uint8_t v) noexcept {
        if( v <= 2 ) {
            return static_cast<BDAddressType>(v);
        }
        return BDAddressType::BDADDR_UNDEFINED;
    }
    constexpr uint8_t number(const BDAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BDAddressType type) noexcept;

    /**
     * Unique Bluetooth EUI48 address and ::BDAddressType tuple.
     */
    class BDAddressAndType {
        public:
            /** Using EUI48::ANY_DEVICE and ::BDAddressType::BDADDR_UNDEFINED to match any device. */
            static const BDAddressAndType ANY_DEVICE;

            jau::EUI48 address;
            BDAddressType type;

            BDAddressAndType(const jau::EUI48 & address_, BDAddressType type_) noexcept
            : address(address_), type(type_) {}

            BDAddressAndType() noexcept : address(), type{BDAddressType::BDADDR_UNDEFINED} { }
            BDAddressAndType(const BDAddressAndType &o) noexcept = default;
            BDAddressAndType(BDAddressAndType &&o) noexcept = default;
            BDAddressAndType& operator=(const BDAddressAndType &o) noexcept = default;
            BDAddressAndType& operator=(BDAddressAndType &&o) noexcept = default;

            bool isLEAddress() const noexcept {
                return BDAddressType::BDADDR_LE_PUBLIC == type || BDAddressType::BDADDR_LE_RANDOM == type;
            }

            /**
             * Returns true if both devices match, i.e. equal address
             * and equal type or at least one type is ::BDAddressType::BDADDR_UNDEFINED.
             */
            bool matches(const BDAddressAndType & o) const noexcept {
                if(this == &o) {
                    return true;
                }
                return address == o.address &&
                       ( type == o.type ||
                         BDAddressType::BDADDR_UNDEFINED == type ||
                         BDAddressType::BDADDR_UNDEFINED == o.type );
            }

            std::size_t hash_code() const noexcept {
                // 31 * x == (x << 5) - x
                std::size_t h = 0;
                for(jau::nsize_t i=0; i<sizeof(address.b); ++i) {
                    h = ( ( h << 5 ) - h ) + address.b[i];
                }
                h = ( ( h << 5 ) - h ) + number(type);
                return h;
            }

            std::string toString() const noexcept;
    };
    inline bool operator==(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept {
        if( &lhs == &rhs ) {
            return true;
        }
        return lhs.address == rhs.address &&
               lhs.type == rhs.type;
    }
    inline bool operator!=(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept
    { return !(lhs == rhs); }

} // namespace bt_bricks

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    template<> struct hash<bt_bricks::BDAddressAndType> {
        std::size_t operator()(bt_bricks::BDAddressAndType const& a) const noexcept {
            return a.hash_code();
        }
    };
}

#endif /* BT_BRICKS_ADDRESS_HPP_ */
