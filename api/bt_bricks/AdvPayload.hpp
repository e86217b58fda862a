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

#ifndef BT_BRICKS_ADV_PAYLOAD_HPP_
#define BT_BRICKS_ADV_PAYLOAD_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <vector>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "BTBTypes.hpp"

namespace bt_bricks {

    /**
     * GAP Advertising Data (AD) element type tags, as used within advertising payloads.
     *
     * Last sync with <https://www.bluetooth.com/specifications/assigned-numbers/generic-access-profile/>,
     * only the subset handled by AdvPayload is listed.
     */
    enum class GAP_T : uint8_t {
        NONE                    = 0x00,

        /** Flags */
        FLAGS                   = 0x01,
        /** Incomplete List of 16-bit Service Class UUID. (Supplement, Part A, section 1.1)*/
        UUID16_INCOMPLETE       = 0x02,
        /** Complete List of 16-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID16_COMPLETE         = 0x03,
        /** Incomplete List of 32-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID32_INCOMPLETE       = 0x04,
        /** Complete List of 32-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID32_COMPLETE         = 0x05,
        /** Incomplete List of 128-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID128_INCOMPLETE      = 0x06,
        /** Complete List of 128-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID128_COMPLETE        = 0x07,
        /** Shortened local name (Supplement, Part A, section 1.2) */
        NAME_LOCAL_SHORT        = 0x08,
        /** Complete local name (Supplement, Part A, section 1.2) */
        NAME_LOCAL_COMPLETE     = 0x09,
        /** Transmit power level (Supplement, Part A, section 1.5) */
        TX_POWER_LEVEL          = 0x0A,

        /** Manufacturer id code and specific opaque data */
        MANUFACTURE_SPECIFIC    = 0xFF
    };
    constexpr uint8_t number(const GAP_T rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }

    enum class GAPFlags : uint8_t {
        NONE                   = 0,
        LE_Ltd_Disc            = (1 << 0),
        LE_Gen_Disc            = (1 << 1),
        BREDR_UNSUP            = (1 << 2),
        Dual_SameCtrl          = (1 << 3),
        Dual_SameHost          = (1 << 4),
        RESERVED1              = (1 << 5),
        RESERVED2              = (1 << 6),
        RESERVED3              = (1 << 7)
    };
    constexpr uint8_t number(const GAPFlags rhs) noexcept { return static_cast<uint8_t>(rhs); }
    constexpr GAPFlags operator |(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return static_cast<GAPFlags> ( number(lhs) | number(rhs) );
    }
    constexpr GAPFlags operator &(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return static_cast<GAPFlags> ( number(lhs) & number(rhs) );
    }
    std::string to_string(const GAPFlags v) noexcept;

    /**
     * Bitmask of AdvPayload data fields, marking which fields are set
     * and selecting which fields to encode.
     */
    enum class AdvDataType : uint32_t {
        NONE         = 0,
        FLAGS        = (1 << 0),
        NAME         = (1 << 1),
        NAME_SHORT   = (1 << 2),
        TX_POWER     = (1 << 3),
        MANUF_DATA   = (1 << 4),
        SERVICE_UUID = (1 << 5),
        ALL          = 0xffffffff
    };
    constexpr uint32_t number(const AdvDataType rhs) noexcept {
        return static_cast<uint32_t>(rhs);
    }
    constexpr AdvDataType operator |(const AdvDataType lhs, const AdvDataType rhs) noexcept {
        return static_cast<AdvDataType> ( number(lhs) | number(rhs) );
    }
    constexpr AdvDataType operator &(const AdvDataType lhs, const AdvDataType rhs) noexcept {
        return static_cast<AdvDataType> ( number(lhs) & number(rhs) );
    }
    constexpr bool is_set(const AdvDataType mask, const AdvDataType bit) noexcept {
        return bit == ( mask & bit );
    }
    constexpr void set(AdvDataType &mask, const AdvDataType bit) noexcept {
        mask = mask | bit;
    }
    std::string to_string(const AdvDataType mask) noexcept;

    /**
     * Manufacturer id code and opaque data of a GAP_T::MANUFACTURE_SPECIFIC element.
     */
    class ManufactureSpecificData {
        public:
            uint16_t company;
            jau::POctets data;

            ManufactureSpecificData(const uint16_t company_) noexcept;
            ManufactureSpecificData(const uint16_t company_, uint8_t const * const data_, jau::nsize_t const data_len) noexcept;

            std::string toString() const noexcept;
    };
    bool operator==(const ManufactureSpecificData& lhs, const ManufactureSpecificData& rhs) noexcept;

    /**
     * Collection of advertising payload fields, i.e. legacy advertising data (AD)
     * of at most MAX_ADV_LENGTH bytes.
     *
     * Decoding tolerates unknown element tags, any element order and duplicate tags,
     * where the last occurrence of a duplicated tag wins.
     * For service UUID lists the last list of one UUID width replaces earlier lists of the same width.
     */
    class AdvPayload {
        public:
            /** Maximum legacy advertising payload size in bytes. */
            static constexpr const jau::nsize_t MAX_ADV_LENGTH = 31;

        private:
            AdvDataType data_mask;
            GAPFlags flags;
            std::string name;
            std::string name_short;
            int8_t tx_power;
            std::shared_ptr<ManufactureSpecificData> msd;
            jau::darray<std::shared_ptr<const jau::uuid_t>> services;
            bool services_complete;

            void removeServices(const jau::uuid_t::TypeSize ts) noexcept;
            void readServices(const GAP_T elem_type, uint8_t const * elem_data, const jau::nsize_t elem_len, const jau::uuid_t::TypeSize ts) noexcept;

            static int next_data_elem(uint8_t *elem_len, uint8_t *elem_type, uint8_t const **elem_data,
                                      uint8_t const * data, int offset, int const size) noexcept;

        public:
            AdvPayload() noexcept;

            AdvPayload(const AdvPayload &o) = default;
            AdvPayload(AdvPayload &&o) = default;
            AdvPayload& operator=(const AdvPayload &o) = default;
            AdvPayload& operator=(AdvPayload &&o) = default;

            void clear() noexcept;

            void setFlags(GAPFlags f) noexcept { flags = f; set(data_mask, AdvDataType::FLAGS); }
            void setName(const std::string& v) noexcept { name = v; set(data_mask, AdvDataType::NAME); }
            void setShortName(const std::string& v) noexcept { name_short = v; set(data_mask, AdvDataType::NAME_SHORT); }
            void setTxPower(int8_t v) noexcept { tx_power = v; set(data_mask, AdvDataType::TX_POWER); }
            void setManufactureSpecificData(const ManufactureSpecificData& msd_) noexcept;

            /** Adds the given service UUID, if not yet contained. */
            bool addService(const std::shared_ptr<const jau::uuid_t>& uuid) noexcept;
            bool addService(const jau::uuid_t& uuid) noexcept;
            void setServicesComplete(const bool v) noexcept { services_complete = v; }

            AdvDataType getDataMask() const noexcept { return data_mask; }
            bool isSet(AdvDataType bit) const noexcept { return is_set(data_mask, bit); }

            GAPFlags getFlags() const noexcept { return flags; }
            const std::string& getName() const noexcept { return name; }
            const std::string& getShortName() const noexcept { return name_short; }

            /** Returns the complete name if set, otherwise the shortened name, which may be empty. */
            const std::string& getBestName() const noexcept { return name.empty() ? name_short : name; }

            int8_t getTxPower() const noexcept { return tx_power; }
            std::shared_ptr<ManufactureSpecificData> getManufactureSpecificData() const noexcept { return msd; }
            const jau::darray<std::shared_ptr<const jau::uuid_t>>& getServices() const noexcept { return services; }
            bool getServicesComplete() const noexcept { return services_complete; }

            /** Returns true if an equivalent service UUID is contained. */
            bool hasService(const jau::uuid_t& uuid) const noexcept;

            /**
             * Reads AD elements from given data.
             *
             * Decoding stops at the first zero length element or at a truncated element,
             * elements read until then are kept.
             *
             * @return number of elements read
             */
            int read_data(uint8_t const * data, jau::nsize_t const data_length) noexcept;

            /**
             * Returns the number of bytes required to encode the fields selected by write_mask.
             */
            jau::nsize_t getEncodedSize(const AdvDataType write_mask) const noexcept;

            /**
             * Writes the fields selected by write_mask, which are also set, into data
             * as long as they fit into data_length.
             *
             * @return number of bytes written
             */
            jau::nsize_t write_data(const AdvDataType write_mask, uint8_t * data, jau::nsize_t const data_length) const noexcept;

            /**
             * Encodes the fields selected by write_mask into out.
             *
             * @return BTBStatusCode::SUCCESS, or BTBStatusCode::PAYLOAD_TOO_LARGE leaving out empty
             *         if the encoded size exceeds MAX_ADV_LENGTH
             */
            BTBStatusCode encode(std::vector<uint8_t>& out, const AdvDataType write_mask=AdvDataType::ALL) const noexcept;

            std::string toString() const noexcept;
    };
    bool operator==(const AdvPayload& lhs, const AdvPayload& rhs) noexcept;
    inline bool operator!=(const AdvPayload& lhs, const AdvPayload& rhs) noexcept
    { return !(lhs == rhs); }

} // namespace bt_bricks

#endif /* BT_BRICKS_ADV_PAYLOAD_HPP_ */
