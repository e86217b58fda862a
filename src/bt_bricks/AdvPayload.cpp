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
#include <cstdio>
#include <cerrno>

#include <algorithm>

#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include "AdvPayload.hpp"

using namespace bt_bricks;

template<typename T>
static void append_bitstr(std::string& out, T mask, T bit, const std::string& bitstr, bool& comma) {
    if( bit == ( mask & bit ) ) {
        if( comma ) { out.append(", "); }
        out.append(bitstr); comma = true;
    }
}
#define APPEND_BITSTR(U,V,M) append_bitstr(out, M, U::V, #V, comma);

#define GAPFLAGS_ENUM(X,M) \
    X(GAPFlags,LE_Ltd_Disc,M) \
    X(GAPFlags,LE_Gen_Disc,M) \
    X(GAPFlags,BREDR_UNSUP,M) \
    X(GAPFlags,Dual_SameCtrl,M) \
    X(GAPFlags,Dual_SameHost,M) \
    X(GAPFlags,RESERVED1,M) \
    X(GAPFlags,RESERVED2,M) \
    X(GAPFlags,RESERVED3,M)

std::string bt_bricks::to_string(const GAPFlags v) noexcept {
    std::string out("[");
    bool comma = false;
    GAPFLAGS_ENUM(APPEND_BITSTR,v)
    out.append("]");
    return out;
}

#define ADV_DATA_TYPE_ENUM(X,M) \
    X(AdvDataType,FLAGS,M) \
    X(AdvDataType,NAME,M) \
    X(AdvDataType,NAME_SHORT,M) \
    X(AdvDataType,TX_POWER,M) \
    X(AdvDataType,MANUF_DATA,M) \
    X(AdvDataType,SERVICE_UUID,M)

std::string bt_bricks::to_string(const AdvDataType mask) noexcept {
    std::string out("[");
    bool comma = false;
    ADV_DATA_TYPE_ENUM(APPEND_BITSTR,mask)
    out.append("]");
    return out;
}

ManufactureSpecificData::ManufactureSpecificData(const uint16_t company_) noexcept
: company(company_),
  data(jau::lb_endian::little /* intentional zero sized */)
{ }

ManufactureSpecificData::ManufactureSpecificData(const uint16_t company_, uint8_t const * const data_, jau::nsize_t const data_len) noexcept
: company(company_),
  data(data_, data_len, jau::lb_endian::little)
{ }

std::string ManufactureSpecificData::toString() const noexcept {
  std::string out("MSD[company[");
  out.append(jau::to_hexstring(company)+"], data["+data.toString()+"]]");
  return out;
}

bool bt_bricks::operator==(const ManufactureSpecificData& lhs, const ManufactureSpecificData& rhs) noexcept {
    return lhs.company == rhs.company &&
           lhs.data.size() == rhs.data.size() &&
           ( 0 == lhs.data.size() || 0 == ::memcmp(lhs.data.get_ptr(), rhs.data.get_ptr(), lhs.data.size()) );
}

AdvPayload::AdvPayload() noexcept
: data_mask(AdvDataType::NONE), flags(GAPFlags::NONE), name(), name_short(), tx_power(127),
  msd(nullptr), services(), services_complete(false)
{ }

void AdvPayload::clear() noexcept {
    data_mask = AdvDataType::NONE;
    flags = GAPFlags::NONE;
    name.clear();
    name_short.clear();
    tx_power = 127;
    msd = nullptr;
    services.clear();
    services_complete = false;
}

void AdvPayload::setManufactureSpecificData(const ManufactureSpecificData& msd_) noexcept {
    msd = std::make_shared<ManufactureSpecificData>(msd_.company,
              msd_.data.size() > 0 ? msd_.data.get_ptr() : nullptr, msd_.data.size());
    set(data_mask, AdvDataType::MANUF_DATA);
}

bool AdvPayload::addService(const std::shared_ptr<const jau::uuid_t>& uuid) noexcept {
    if( nullptr == uuid ) {
        return false;
    }
    auto begin = services.begin();
    auto it = std::find_if(begin, services.end(), [&](std::shared_ptr<const jau::uuid_t> const& p) {
        return *p == *uuid;
    });
    if ( it == services.end() ) {
        services.push_back(uuid);
        set(data_mask, AdvDataType::SERVICE_UUID);
        return true;
    } else {
        return false;
    }
}

bool AdvPayload::addService(const jau::uuid_t& uuid) noexcept {
    return addService( std::shared_ptr<const jau::uuid_t>( uuid.clone() ) );
}

bool AdvPayload::hasService(const jau::uuid_t& uuid) const noexcept {
    for(const auto& p : services) {
        if( p->equivalent(uuid) ) {
            return true;
        }
    }
    return false;
}

void AdvPayload::removeServices(const jau::uuid_t::TypeSize ts) noexcept {
    for(auto it = services.begin(); it != services.end(); ) {
        if( (*it)->getTypeSize() == ts ) {
            it = services.erase(it);
        } else {
            ++it;
        }
    }
}

void AdvPayload::readServices(const GAP_T elem_type, uint8_t const * elem_data, const jau::nsize_t elem_len, const jau::uuid_t::TypeSize ts) noexcept {
    const jau::nsize_t ts_int = jau::uuid_t::number(ts);
    // a repeated list of the same width replaces the earlier one
    removeServices(ts);
    setServicesComplete( GAP_T::UUID16_COMPLETE == elem_type ||
                         GAP_T::UUID32_COMPLETE == elem_type ||
                         GAP_T::UUID128_COMPLETE == elem_type );
    for(jau::nsize_t j=0; j<elem_len/ts_int; j++) {
        switch( ts ) {
            case jau::uuid_t::TypeSize::UUID16_SZ:
                addService( std::make_shared<const jau::uuid16_t>(elem_data + j*ts_int, jau::lb_endian::little) );
                break;
            case jau::uuid_t::TypeSize::UUID32_SZ:
                addService( std::make_shared<const jau::uuid32_t>(elem_data + j*ts_int, jau::lb_endian::little) );
                break;
            case jau::uuid_t::TypeSize::UUID128_SZ:
                addService( std::make_shared<const jau::uuid128_t>(elem_data + j*ts_int, jau::lb_endian::little) );
                break;
        }
    }
    set(data_mask, AdvDataType::SERVICE_UUID);
}

int AdvPayload::next_data_elem(uint8_t *elem_len, uint8_t *elem_type, uint8_t const **elem_data,
                               uint8_t const * data, int offset, int const size) noexcept
{
    if (offset < size) {
        uint8_t len = data[offset]; // covers: type + data, less len field itself

        if (len == 0) {
            return 0; // end of significant part
        }

        if (len + offset >= size) {
            return -ENOENT; // truncated
        }

        *elem_type = data[offset + 1];
        *elem_data = data + offset + 2; // net data ptr
        *elem_len = len - 1; // less type -> net data length

        return offset + 1 + len; // next ad_struct offset: + len + type + data
    }
    return -ENOENT;
}

int AdvPayload::read_data(uint8_t const * data, jau::nsize_t const data_length) noexcept {
    int count = 0;
    int offset = 0;
    uint8_t elem_len, elem_type;
    uint8_t const *elem_data;

    if( nullptr == data ) {
        return 0;
    }
    while( 0 < ( offset = next_data_elem( &elem_len, &elem_type, &elem_data, data, offset, static_cast<int>(data_length) ) ) )
    {
        count++;

        // Guaranteed: elem_len >= 0!
        switch ( static_cast<GAP_T>(elem_type) ) {
            case GAP_T::FLAGS:
                if( 1 <= elem_len ) {
                    setFlags(static_cast<GAPFlags>(*elem_data));
                }
                break;

            case GAP_T::UUID16_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID16_COMPLETE:
                readServices(static_cast<GAP_T>(elem_type), elem_data, elem_len, jau::uuid_t::TypeSize::UUID16_SZ);
                break;

            case GAP_T::UUID32_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID32_COMPLETE:
                readServices(static_cast<GAP_T>(elem_type), elem_data, elem_len, jau::uuid_t::TypeSize::UUID32_SZ);
                break;

            case GAP_T::UUID128_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID128_COMPLETE:
                readServices(static_cast<GAP_T>(elem_type), elem_data, elem_len, jau::uuid_t::TypeSize::UUID128_SZ);
                break;

            case GAP_T::NAME_LOCAL_SHORT:
                setShortName( std::string(reinterpret_cast<const char*>(elem_data), elem_len) );
                break;

            case GAP_T::NAME_LOCAL_COMPLETE:
                setName( std::string(reinterpret_cast<const char*>(elem_data), elem_len) );
                break;

            case GAP_T::TX_POWER_LEVEL:
                if( 1 <= elem_len ) {
                    setTxPower( static_cast<int8_t>( *elem_data ) );
                }
                break;

            case GAP_T::MANUFACTURE_SPECIFIC:
                if( 2 <= elem_len ) {
                    const uint16_t company = jau::get_uint16(elem_data + 0, jau::lb_endian::little);
                    const jau::nsize_t data_size = elem_len-2;
                    setManufactureSpecificData( ManufactureSpecificData(company, data_size > 0 ? elem_data+2 : nullptr, data_size) );
                }
                break;

            default:
                DBG_PRINT("AD-Element @ [%d/%zu]: Unhandled type 0x%.2X with %d bytes net",
                          offset, (size_t)data_length, elem_type, elem_len);
                break;
        }
    }
    return count;
}

jau::nsize_t AdvPayload::getEncodedSize(const AdvDataType write_mask) const noexcept {
    const AdvDataType mask = write_mask & data_mask;
    jau::nsize_t count = 0;

    if( is_set(mask, AdvDataType::FLAGS) ) {
        count += 1 + 2;
    }
    if( is_set(mask, AdvDataType::NAME) ) {
        count += 1 + 1 + name.size();
    } else if( is_set(mask, AdvDataType::NAME_SHORT) ) {
        count += 1 + 1 + name_short.size();
    }
    if( is_set(mask, AdvDataType::TX_POWER) ) {
        count += 1 + 2;
    }
    if( is_set(mask, AdvDataType::MANUF_DATA) && nullptr != msd ) {
        count += 1 + 1 + 2 + msd->data.size();
    }
    if( is_set(mask, AdvDataType::SERVICE_UUID) ) {
        jau::nsize_t sz16 = 0, sz32 = 0, sz128 = 0;
        for(const auto& p : services) {
            switch( p->getTypeSize() ) {
                case jau::uuid_t::TypeSize::UUID16_SZ: sz16 += 2; break;
                case jau::uuid_t::TypeSize::UUID32_SZ: sz32 += 4; break;
                case jau::uuid_t::TypeSize::UUID128_SZ: sz128 += 16; break;
            }
        }
        if( sz16 > 0 ) { count += 2 + sz16; }
        if( sz32 > 0 ) { count += 2 + sz32; }
        if( sz128 > 0 ) { count += 2 + sz128; }
    }
    return count;
}

#define _WARN_OOB(a) DBG_PRINT("%s: Out of buffer: count %zu + 1 + ad_sz %zu > data_len %zu -> drop %s", (a), (size_t)count, (size_t)ad_sz, (size_t)data_length, toString().c_str());

static uint8_t* write_uuid_list(const jau::darray<std::shared_ptr<const jau::uuid_t>>& services,
                                const jau::uuid_t::TypeSize ts, const GAP_T type, uint8_t * data_i) noexcept
{
    const uint8_t ts_int = static_cast<uint8_t>( jau::uuid_t::number(ts) );
    uint8_t * const len_p = data_i++;
    *data_i++ = number( type );
    uint8_t ad_sz = 1;
    for(const auto& p : services) {
        if( p->getTypeSize() == ts ) {
            data_i += p->put(data_i + 0, jau::lb_endian::little);
            ad_sz += ts_int;
        }
    }
    *len_p = ad_sz;
    return data_i;
}

jau::nsize_t AdvPayload::write_data(const AdvDataType write_mask, uint8_t * data, jau::nsize_t const data_length) const noexcept {
    jau::nsize_t count = 0;
    uint8_t * data_i = data;
    const AdvDataType mask = write_mask & data_mask;

    if( is_set(mask, AdvDataType::FLAGS) ) {
        const jau::nsize_t ad_sz = 2;
        if( ( count + 1 + ad_sz ) > data_length ) {
            _WARN_OOB("FLAGS");
            return count;
        }
        count    += ad_sz + 1;
        *data_i++ = ad_sz;
        *data_i++ = number( GAP_T::FLAGS );
        *data_i++ = number( getFlags() );
    }
    if( is_set(mask, AdvDataType::NAME) ) {
        const jau::nsize_t ad_sz = 1 + name.size();
        if( ( count + 1 + ad_sz ) > data_length ) {
            _WARN_OOB("NAME");
            return count;
        }
        count    += ad_sz + 1;
        *data_i++ = ad_sz;
        *data_i++ = number( GAP_T::NAME_LOCAL_COMPLETE );
        memcpy(data_i, name.c_str(), ad_sz-1);
        data_i   += ad_sz-1;
    } else if( is_set(mask, AdvDataType::NAME_SHORT) ) {
        const jau::nsize_t ad_sz = 1 + name_short.size();
        if( ( count + 1 + ad_sz ) > data_length ) {
            _WARN_OOB("NAME_SHORT");
            return count;
        }
        count    += ad_sz + 1;
        *data_i++ = ad_sz;
        *data_i++ = number( GAP_T::NAME_LOCAL_SHORT );
        memcpy(data_i, name_short.c_str(), ad_sz-1);
        data_i   += ad_sz-1;
    }
    if( is_set(mask, AdvDataType::TX_POWER) ) {
        const jau::nsize_t ad_sz = 2;
        if( ( count + 1 + ad_sz ) > data_length ) {
            _WARN_OOB("TX_POWER");
            return count;
        }
        count    += ad_sz + 1;
        *data_i++ = ad_sz;
        *data_i++ = number( GAP_T::TX_POWER_LEVEL );
        *data_i++ = static_cast<uint8_t>( tx_power );
    }
    if( is_set(mask, AdvDataType::MANUF_DATA) && nullptr != msd ) {
        const jau::nsize_t msd_data_sz = msd->data.size();
        const jau::nsize_t ad_sz = 1 + 2 + msd_data_sz;
        if( ( count + 1 + ad_sz ) > data_length ) {
            _WARN_OOB("MANUF_DATA");
            return count;
        }
        count    += ad_sz + 1;
        *data_i++ = ad_sz;
        *data_i++ = number( GAP_T::MANUFACTURE_SPECIFIC );
        jau::put_uint16(data_i + 0, msd->company, jau::lb_endian::little);
        data_i += 2;
        if( 0 < msd_data_sz ) {
            memcpy(data_i, msd->data.get_ptr(), msd_data_sz);
            data_i += msd_data_sz;
        }
    }
    if( is_set(mask, AdvDataType::SERVICE_UUID) ) {
        jau::nsize_t n16 = 0, n32 = 0, n128 = 0;
        for(const auto& p : services) {
            switch( p->getTypeSize() ) {
                case jau::uuid_t::TypeSize::UUID16_SZ: ++n16; break;
                case jau::uuid_t::TypeSize::UUID32_SZ: ++n32; break;
                case jau::uuid_t::TypeSize::UUID128_SZ: ++n128; break;
            }
        }
        if( n16 > 0 ) {
            const jau::nsize_t ad_sz = 1 + n16 * 2;
            if( ( count + 1 + ad_sz ) > data_length ) {
                _WARN_OOB("UUID16");
                return count;
            }
            count += ad_sz + 1;
            data_i = write_uuid_list(services, jau::uuid_t::TypeSize::UUID16_SZ,
                                     services_complete ? GAP_T::UUID16_COMPLETE : GAP_T::UUID16_INCOMPLETE, data_i);
        }
        if( n32 > 0 ) {
            const jau::nsize_t ad_sz = 1 + n32 * 4;
            if( ( count + 1 + ad_sz ) > data_length ) {
                _WARN_OOB("UUID32");
                return count;
            }
            count += ad_sz + 1;
            data_i = write_uuid_list(services, jau::uuid_t::TypeSize::UUID32_SZ,
                                     services_complete ? GAP_T::UUID32_COMPLETE : GAP_T::UUID32_INCOMPLETE, data_i);
        }
        if( n128 > 0 ) {
            const jau::nsize_t ad_sz = 1 + n128 * 16;
            if( ( count + 1 + ad_sz ) > data_length ) {
                _WARN_OOB("UUID128");
                return count;
            }
            count += ad_sz + 1;
            data_i = write_uuid_list(services, jau::uuid_t::TypeSize::UUID128_SZ,
                                     services_complete ? GAP_T::UUID128_COMPLETE : GAP_T::UUID128_INCOMPLETE, data_i);
        }
    }
    return count;
}

BTBStatusCode AdvPayload::encode(std::vector<uint8_t>& out, const AdvDataType write_mask) const noexcept {
    const jau::nsize_t required = getEncodedSize(write_mask);
    if( required > MAX_ADV_LENGTH ) {
        WORDY_PRINT("AdvPayload::encode: %zu bytes exceed %zu bytes: %s",
                (size_t)required, (size_t)MAX_ADV_LENGTH, toString().c_str());
        out.clear();
        return BTBStatusCode::PAYLOAD_TOO_LARGE;
    }
    out.resize(MAX_ADV_LENGTH);
    const jau::nsize_t written = write_data(write_mask, out.data(), out.size());
    out.resize(written);
    return BTBStatusCode::SUCCESS;
}

std::string AdvPayload::toString() const noexcept {
    std::string msdstr = nullptr != msd ? msd->toString() : "MSD[null]";
    std::string out("AdvPayload[set "+to_string(data_mask)+", flags "+to_string(flags)+
                    ", name['"+name+"'/'"+name_short+"'], "+msdstr);
    if( isSet(AdvDataType::TX_POWER) ) {
        out.append(", tx-power "+std::to_string(tx_power));
    }
    out.append(", services"+std::string(services_complete ? "" : "(incomplete)")+"[");
    for(jau::nsize_t i=0; i<services.size(); ++i) {
        if( 0 < i ) {
            out.append(", ");
        }
        out.append(services[i]->toString());
    }
    out.append("]]");
    return out;
}

bool bt_bricks::operator==(const AdvPayload& lhs, const AdvPayload& rhs) noexcept {
    if( &lhs == &rhs ) {
        return true;
    }
    if( lhs.getDataMask() != rhs.getDataMask() ||
        lhs.getFlags() != rhs.getFlags() ||
        lhs.getName() != rhs.getName() ||
        lhs.getShortName() != rhs.getShortName() ||
        lhs.getTxPower() != rhs.getTxPower() )
    {
        return false;
    }
    const std::shared_ptr<ManufactureSpecificData> lmsd = lhs.getManufactureSpecificData();
    const std::shared_ptr<ManufactureSpecificData> rmsd = rhs.getManufactureSpecificData();
    if( ( nullptr == lmsd ) != ( nullptr == rmsd ) ) {
        return false;
    }
    if( nullptr != lmsd && !( *lmsd == *rmsd ) ) {
        return false;
    }
    const jau::darray<std::shared_ptr<const jau::uuid_t>>& ls = lhs.getServices();
    const jau::darray<std::shared_ptr<const jau::uuid_t>>& rs = rhs.getServices();
    if( ls.size() != rs.size() ) {
        return false;
    }
    for(const auto& p : ls) {
        if( !rhs.hasService(*p) ) {
            return false;
        }
    }
    return true;
}
