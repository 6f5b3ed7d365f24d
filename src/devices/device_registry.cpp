#include "devices/device_registry.h"

#include "logging/logger.h"

#include <algorithm>

namespace devices {

std::shared_ptr<DeviceRegistry::Entry> DeviceRegistry::findEntry(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(tableMutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<DeviceRegistry::Entry>> DeviceRegistry::snapshotEntries() const {
    std::shared_lock<std::shared_mutex> lock(tableMutex_);
    std::vector<std::shared_ptr<Entry>> entries;
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        entries.push_back(entry);
    }
    return entries;
}

bool DeviceRegistry::add(Device device) {
    if (device.id.empty()) {
        return false;
    }
    auto entry = std::make_shared<Entry>();
    entry->device = std::move(device);
    const std::string id = entry->device.id;

    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    return entries_.emplace(id, std::move(entry)).second;
}

bool DeviceRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    return entries_.erase(id) > 0;
}

bool DeviceRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(tableMutex_);
    return entries_.count(id) > 0;
}

std::optional<Device> DeviceRegistry::get(const std::string& id) const {
    auto entry = findEntry(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->device;
}

std::vector<Device> DeviceRegistry::list() const {
    std::vector<Device> result;
    for (const auto& entry : snapshotEntries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        result.push_back(entry->device);
    }
    std::sort(result.begin(), result.end(),
              [](const Device& a, const Device& b) { return a.id < b.id; });
    return result;
}

std::vector<std::string> DeviceRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(tableMutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(tableMutex_);
    return entries_.size();
}

std::optional<std::string> DeviceRegistry::findByHost(const std::string& hostname) const {
    if (hostname.empty()) {
        return std::nullopt;
    }
    for (const auto& entry : snapshotEntries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->device.hostname == hostname) {
            return entry->device.id;
        }
    }
    return std::nullopt;
}

bool DeviceRegistry::modify(const std::string& id, const Mutator& mutator) {
    auto entry = findEntry(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    const std::string originalId = entry->device.id;
    mutator(entry->device);
    entry->device.id = originalId;  // identity is fixed once registered
    return true;
}

bool DeviceRegistry::transition(const std::string& id, ConnectionStatus to,
                                castgrid::Timestamp now, std::string& error) {
    auto entry = findEntry(id);
    if (!entry) {
        error = "Unknown device: " + id;
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    ConnectionStatus from = entry->device.connectionStatus;
    if (from == to) {
        return true;
    }
    if (!isValidTransition(from, to)) {
        error = std::string("Invalid connection transition ") + connectionStatusToString(from) +
                " -> " + connectionStatusToString(to) + " for " + id;
        return false;
    }
    entry->device.connectionStatus = to;
    entry->device.connectionChangedAt = now;
    LOG_DEBUG("[Registry] {} {} -> {}", id, connectionStatusToString(from),
              connectionStatusToString(to));
    return true;
}

nlohmann::json DeviceRegistry::toJson() const {
    nlohmann::json devicesJson = nlohmann::json::array();
    for (const auto& device : list()) {
        devicesJson.push_back(deviceToJson(device));
    }
    nlohmann::json root;
    root["devices"] = devicesJson;
    root["device_count"] = devicesJson.size();
    return root;
}

void DeviceRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    entries_.clear();
}

}  // namespace devices
