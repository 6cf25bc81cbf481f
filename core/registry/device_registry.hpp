#ifndef MICSYNC_REGISTRY_DEVICE_REGISTRY_HPP
#define MICSYNC_REGISTRY_DEVICE_REGISTRY_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vendor/i_vendor_adapter.hpp"

namespace micsync {
namespace registry {

// Registered device (vendor + device metadata)
struct RegisteredDevice {
    std::string vendor_id;  // Configured vendor id (e.g., "shure-main")
    std::string device_id;  // Vendor-local ID
    std::string ip;         // Empty when unknown
    std::string model;
    std::string name;
    nlohmann::json attributes = nlohmann::json::object();

    // Composite key for global device handle
    std::string get_handle() const { return vendor_id + "/" + device_id; }

    nlohmann::json to_json() const;
};

// Read view used by the reconciler for candidates and exclusivity checks
class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    // Distinct vendor ids with a device at this address
    virtual std::vector<std::string> owners_of(const std::string &ip) const = 0;

    // Distinct device addresses registered for a vendor, registration order
    virtual std::vector<std::string> ips_for_vendor(const std::string &vendor_id) const = 0;
};

// Device Registry - Thread-safe inventory of managed devices
/**
 * Thread Safety:
 * - All read methods use shared_lock (concurrent reads safe)
 * - All write methods use unique_lock (exclusive access)
 * - Returns by-value so results stay valid after clear_vendor_devices()
 *
 * One address should belong to one vendor. The registry records what the
 * vendors report and warns on conflicts; the reconciler is what refuses
 * to add a conflicting address to a second vendor.
 */
class DeviceRegistry : public IDeviceRegistry {
public:
    DeviceRegistry() = default;

    // ListDevices (+ DescribeDevice for devices without an address), then
    // replace the vendor's devices. Network I/O happens outside the lock.
    bool refresh_vendor(const std::string &vendor_id, vendor::IVendorAdapter &adapter);

    // Insert or replace by handle
    void upsert_device(const RegisteredDevice &device);

    std::optional<RegisteredDevice> get_device_copy(const std::string &vendor_id, const std::string &device_id) const;
    std::optional<RegisteredDevice> get_device_by_handle_copy(const std::string &handle) const;

    std::vector<RegisteredDevice> get_all_devices() const;
    std::vector<RegisteredDevice> get_devices_for_vendor(const std::string &vendor_id) const;

    void clear_vendor_devices(const std::string &vendor_id);

    std::vector<std::string> owners_of(const std::string &ip) const override;
    std::vector<std::string> ips_for_vendor(const std::string &vendor_id) const override;

    size_t device_count() const;
    std::string last_error() const;

    static RegisteredDevice from_record(const vendor::DeviceRecord &record);

private:
    // Not thread-safe, called under unique_lock
    void rebuild_index();
    void warn_conflicts(const RegisteredDevice &device) const;

    std::vector<RegisteredDevice> devices_;
    std::unordered_map<std::string, size_t> handle_to_index_;  // "vendor/device" -> index

    std::string error_;

    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace micsync

#endif  // MICSYNC_REGISTRY_DEVICE_REGISTRY_HPP
