#ifndef BT_BRICKS_TEST_MOCK_RADIO_HPP_
#define BT_BRICKS_TEST_MOCK_RADIO_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <vector>
#include <array>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include <bt_bricks/BTBTypes.hpp>
#include <bt_bricks/BTAddress.hpp>
#include <bt_bricks/AdvPayload.hpp>
#include <bt_bricks/RadioEvent.hpp>
#include <bt_bricks/RadioControl.hpp>

namespace bt_bricks_test {

    using namespace bt_bricks;

    /**
     * Recording RadioControl, all commands succeed unless configured otherwise via setResult().
     * No events are delivered, tests feed them explicitly.
     */
    class MockRadio : public RadioControl {
        public:
            enum class Cmd : uint8_t {
                START_SCAN = 0, STOP_SCAN, CONNECT, CANCEL_CONNECT, DISCONNECT,
                DISCOVER_SERVICES, DISCOVER_CHARS, GATTC_WRITE, GATTS_NOTIFY, EXCHANGE_MTU,
                REGISTER_SERVICE, START_ADV, STOP_ADV
            };
            static constexpr const jau::nsize_t CMD_COUNT = 13;

            struct Command {
                Cmd cmd;
                uint16_t conn_handle;
                uint16_t value_handle;
                BDAddressAndType peer;
                std::vector<uint8_t> data;
                bool with_response;
                /** scan duration in ms or advertising interval in us */
                int32_t duration;
                uint16_t end_handle;
                uint16_t mtu;
            };

            std::vector<Command> commands;
            std::array<BTBStatusCode, CMD_COUNT> results;
            /** First value handle assigned by registerService() */
            uint16_t next_value_handle;

            MockRadio() noexcept
            : commands(), results(), next_value_handle(0x0010)
            {
                results.fill(BTBStatusCode::SUCCESS);
            }

            void setResult(const Cmd c, const BTBStatusCode r) noexcept { results[static_cast<uint8_t>(c)] = r; }

            jau::nsize_t count(const Cmd c) const noexcept {
                jau::nsize_t n = 0;
                for(const Command & e : commands) {
                    if( c == e.cmd ) {
                        n++;
                    }
                }
                return n;
            }

            /** Returns the last command of the given kind or nullptr */
            const Command* last(const Cmd c) const noexcept {
                for(auto it = commands.rbegin(); it != commands.rend(); ++it) {
                    if( c == it->cmd ) {
                        return &(*it);
                    }
                }
                return nullptr;
            }

            /** Returns all commands of the given kind */
            std::vector<Command> all(const Cmd c) const noexcept {
                std::vector<Command> res;
                for(const Command & e : commands) {
                    if( c == e.cmd ) {
                        res.push_back(e);
                    }
                }
                return res;
            }

            void clear() noexcept { commands.clear(); }

        private:
            BTBStatusCode record(const Cmd c, const uint16_t conn_handle=INVALID_CONN_HANDLE, const uint16_t value_handle=0,
                                 const BDAddressAndType& peer=BDAddressAndType::ANY_DEVICE,
                                 const jau::TROOctets* value=nullptr, const bool with_response=false, const int32_t duration=0,
                                 const uint16_t end_handle=0, const uint16_t mtu=0) {
                std::vector<uint8_t> data;
                if( nullptr != value && 0 < value->size() ) {
                    data.assign(value->get_ptr(), value->get_ptr() + value->size());
                }
                commands.push_back( Command { c, conn_handle, value_handle, peer, data, with_response, duration, end_handle, mtu } );
                return results[static_cast<uint8_t>(c)];
            }

        public:
            BTBStatusCode startScan(const int32_t duration_ms) noexcept override {
                return record(Cmd::START_SCAN, INVALID_CONN_HANDLE, 0, BDAddressAndType::ANY_DEVICE, nullptr, false, duration_ms);
            }
            BTBStatusCode stopScan() noexcept override {
                return record(Cmd::STOP_SCAN);
            }
            BTBStatusCode connect(const BDAddressAndType& peer) noexcept override {
                return record(Cmd::CONNECT, INVALID_CONN_HANDLE, 0, peer);
            }
            BTBStatusCode cancelConnect() noexcept override {
                return record(Cmd::CANCEL_CONNECT);
            }
            BTBStatusCode disconnect(const uint16_t conn_handle) noexcept override {
                return record(Cmd::DISCONNECT, conn_handle);
            }
            BTBStatusCode discoverServices(const uint16_t conn_handle, const jau::uuid_t& service_uuid) noexcept override {
                (void)service_uuid;
                return record(Cmd::DISCOVER_SERVICES, conn_handle);
            }
            BTBStatusCode discoverCharacteristics(const uint16_t conn_handle,
                                                  const uint16_t start_handle, const uint16_t end_handle) noexcept override {
                return record(Cmd::DISCOVER_CHARS, conn_handle, start_handle, BDAddressAndType::ANY_DEVICE, nullptr, false, 0, end_handle);
            }
            BTBStatusCode gattcWrite(const uint16_t conn_handle, const uint16_t value_handle,
                                     const jau::TROOctets& value, const bool with_response) noexcept override {
                return record(Cmd::GATTC_WRITE, conn_handle, value_handle, BDAddressAndType::ANY_DEVICE, &value, with_response);
            }
            BTBStatusCode gattsNotify(const uint16_t conn_handle, const uint16_t value_handle,
                                      const jau::TROOctets& value) noexcept override {
                return record(Cmd::GATTS_NOTIFY, conn_handle, value_handle, BDAddressAndType::ANY_DEVICE, &value);
            }
            BTBStatusCode exchangeMTU(const uint16_t conn_handle, const uint16_t mtu) noexcept override {
                return record(Cmd::EXCHANGE_MTU, conn_handle, 0, BDAddressAndType::ANY_DEVICE, nullptr, false, 0, 0, mtu);
            }
            BTBStatusCode registerService(const jau::uuid_t& service_uuid,
                                          const jau::darray<GattCharDecl>& chars,
                                          jau::darray<uint16_t>& value_handles) noexcept override {
                (void)service_uuid;
                const BTBStatusCode res = record(Cmd::REGISTER_SERVICE);
                if( BTBStatusCode::SUCCESS == res ) {
                    for(jau::nsize_t i=0; i<chars.size(); ++i) {
                        // declaration, value and client configuration descriptor
                        value_handles.push_back(next_value_handle);
                        next_value_handle += 3;
                    }
                }
                return res;
            }
            BTBStatusCode startAdvertising(const int32_t interval_us, const jau::TROOctets& adv_data) noexcept override {
                return record(Cmd::START_ADV, INVALID_CONN_HANDLE, 0, BDAddressAndType::ANY_DEVICE, &adv_data, false, interval_us);
            }
            BTBStatusCode stopAdvertising() noexcept override {
                return record(Cmd::STOP_ADV);
            }

            std::string toString() const noexcept override {
                return "MockRadio[commands "+std::to_string(commands.size())+"]";
            }
    };

    /** Returns an encoded advertising payload with flags, the given name if not empty and service UUID if not nullptr */
    inline std::vector<uint8_t> makeAdvData(const std::string& name, const std::shared_ptr<const jau::uuid_t>& service) {
        AdvPayload adv;
        adv.setFlags(GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP);
        if( !name.empty() ) {
            adv.setName(name);
        }
        if( nullptr != service ) {
            adv.addService(service);
            adv.setServicesComplete(true);
        }
        std::vector<uint8_t> out;
        adv.encode(out);
        return out;
    }

    inline std::unique_ptr<RadioEvent> makeScanResult(const BDAddressAndType& addr, const std::string& name,
                                                      const std::shared_ptr<const jau::uuid_t>& service, const int8_t rssi=-60) {
        const std::vector<uint8_t> adv = makeAdvData(name, service);
        return std::make_unique<RadioEvtScanResult>(addr, 0x00 /* ADV_IND */, rssi, adv.data(), adv.size());
    }

    inline BDAddressAndType makeAddress(const uint8_t last) {
        BDAddressAndType a(jau::EUI48("C0:10:22:33:44:00"), BDAddressType::BDADDR_LE_PUBLIC);
        a.address.b[0] = last;
        return a;
    }

} // namespace bt_bricks_test

#endif /* BT_BRICKS_TEST_MOCK_RADIO_HPP_ */
