#include "device_registry.hpp"

#include <algorithm>
#include <unordered_set>

#include "logging/logger.hpp"

namespace micsync {
namespace registry {

nlohmann::json RegisteredDevice::to_json() const {
    return {
        {"handle", get_handle()}, {"vendor_id", vendor_id}, {"device_id", device_id}, {"ip", ip},
        {"model", model},         {"name", name},           {"attributes", attributes},
    };
}

RegisteredDevice DeviceRegistry::from_record(const vendor::DeviceRecord &record) {
    RegisteredDevice device;
    device.vendor_id = record.vendor_id;
    device.device_id = record.device_id;
    device.ip = record.ip;
    device.model = record.model;
    device.name = record.name;
    device.attributes = record.attributes;
    return device;
}

bool DeviceRegistry::refresh_vendor(const std::string &vendor_id, vendor::IVendorAdapter &adapter) {
    LOG_INFO("[Registry] Refreshing vendor: " << vendor_id);

    // Step 1: ListDevices
    std::vector<vendor::DeviceRecord> records;
    if (!adapter.list_devices(records)) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        error_ = "ListDevices failed: " + adapter.last_error();
        LOG_ERROR("[Registry] " << error_);
        return false;
    }

    LOG_INFO("[Registry] Found " << records.size() << " devices");

    // Build devices outside lock (network I/O)
    std::vector<RegisteredDevice> new_devices;
    new_devices.reserve(records.size());

    // Step 2: DescribeDevice only where the list left the address out
    for (auto &record : records) {
        record.vendor_id = vendor_id;
        if (record.ip.empty()) {
            vendor::DeviceRecord detail;
            if (adapter.describe_device(record.device_id, detail)) {
                detail.vendor_id = vendor_id;
                record = std::move(detail);
            } else {
                LOG_WARN("[Registry] DescribeDevice(" << record.device_id << ") failed: " << adapter.last_error());
            }
        }

        RegisteredDevice device = from_record(record);
        LOG_DEBUG("[Registry] Registered: " << device.get_handle() << " ip=" << (device.ip.empty() ? "-" : device.ip));
        new_devices.push_back(std::move(device));
    }

    // Step 3: Swap the vendor's devices under lock
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                      [&vendor_id](const RegisteredDevice &d) { return d.vendor_id == vendor_id; }),
                       devices_.end());
        for (auto &device : new_devices) {
            warn_conflicts(device);
            devices_.push_back(std::move(device));
        }
        rebuild_index();
    }

    return true;
}

void DeviceRegistry::upsert_device(const RegisteredDevice &device) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    warn_conflicts(device);

    auto it = handle_to_index_.find(device.get_handle());
    if (it != handle_to_index_.end()) {
        devices_[it->second] = device;
        return;
    }
    handle_to_index_[device.get_handle()] = devices_.size();
    devices_.push_back(device);
}

std::optional<RegisteredDevice> DeviceRegistry::get_device_copy(const std::string &vendor_id,
                                                                const std::string &device_id) const {
    return get_device_by_handle_copy(vendor_id + "/" + device_id);
}

std::optional<RegisteredDevice> DeviceRegistry::get_device_by_handle_copy(const std::string &handle) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = handle_to_index_.find(handle);
    if (it == handle_to_index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

std::vector<RegisteredDevice> DeviceRegistry::get_all_devices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

std::vector<RegisteredDevice> DeviceRegistry::get_devices_for_vendor(const std::string &vendor_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<RegisteredDevice> result;
    for (const auto &device : devices_) {
        if (device.vendor_id == vendor_id) {
            result.push_back(device);
        }
    }
    return result;
}

void DeviceRegistry::clear_vendor_devices(const std::string &vendor_id) {
    LOG_INFO("[Registry] Clearing devices for vendor: " << vendor_id);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto new_end = std::remove_if(devices_.begin(), devices_.end(),
                                  [&vendor_id](const RegisteredDevice &device) { return device.vendor_id == vendor_id; });

    const auto removed_count = std::distance(new_end, devices_.end());
    devices_.erase(new_end, devices_.end());
    rebuild_index();

    LOG_INFO("[Registry] Removed " << removed_count << " devices from vendor " << vendor_id);
}

std::vector<std::string> DeviceRegistry::owners_of(const std::string &ip) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> owners;
    if (ip.empty()) {
        return owners;
    }
    for (const auto &device : devices_) {
        if (device.ip == ip && std::find(owners.begin(), owners.end(), device.vendor_id) == owners.end()) {
            owners.push_back(device.vendor_id);
        }
    }
    return owners;
}

std::vector<std::string> DeviceRegistry::ips_for_vendor(const std::string &vendor_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ips;
    std::unordered_set<std::string> seen;
    for (const auto &device : devices_) {
        if (device.vendor_id == vendor_id && !device.ip.empty() && seen.insert(device.ip).second) {
            ips.push_back(device.ip);
        }
    }
    return ips;
}

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

std::string DeviceRegistry::last_error() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return error_;
}

void DeviceRegistry::rebuild_index() {
    handle_to_index_.clear();
    for (size_t i = 0; i < devices_.size(); ++i) {
        handle_to_index_[devices_[i].get_handle()] = i;
    }
}

void DeviceRegistry::warn_conflicts(const RegisteredDevice &device) const {
    if (device.ip.empty()) {
        return;
    }
    for (const auto &existing : devices_) {
        if (existing.ip == device.ip && existing.vendor_id != device.vendor_id) {
            LOG_WARN("[Registry] " << device.ip << " reported by " << device.vendor_id << " is already registered to "
                                   << existing.vendor_id);
            return;
        }
    }
}

}  // namespace registry
}  // namespace micsync
