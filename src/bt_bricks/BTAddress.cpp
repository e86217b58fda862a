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

#include "BTAddress.hpp"

using namespace bt_bricks;

const BDAddressAndType BDAddressAndType::ANY_DEVICE(EUI48::ANY_DEVICE, BDAddressType::BDADDR_UNDEFINED);

std::string bt_bricks::to_string(const BDAddressType type) noexcept {
    switch( type ) {
        case BDAddressType::BDADDR_BREDR: return "BDADDR_BREDR";
        case BDAddressType::BDADDR_LE_PUBLIC: return "BDADDR_LE_PUBLIC";
        case BDAddressType::BDADDR_LE_RANDOM: return "BDADDR_LE_RANDOM";
        case BDAddressType::BDADDR_UNDEFINED: return "BDADDR_UNDEFINED";
    }
    return "Unknown BDAddressType";
}

std::string BDAddressAndType::toString() const noexcept {
    return "["+address.toString()+", "+to_string(type)+"]";
}
