#pragma once

#include "devices/device.h"

#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace devices {

/**
 * @brief In-memory table of device records.
 *
 * The table itself is guarded by a reader/writer lock; every record carries its own
 * mutex so operations on different devices never contend. Readers get copies.
 */
class DeviceRegistry {
   public:
    using Mutator = std::function<void(Device&)>;

    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Returns false if a device with the same id already exists.
    bool add(Device device);

    // Operator removal; the only way a record leaves the table.
    bool remove(const std::string& id);

    bool contains(const std::string& id) const;
    std::optional<Device> get(const std::string& id) const;
    std::vector<Device> list() const;
    std::vector<std::string> ids() const;
    size_t size() const;

    std::optional<std::string> findByHost(const std::string& hostname) const;

    // Runs the mutator under the device's own lock. Returns false for an unknown id.
    bool modify(const std::string& id, const Mutator& mutator);

    // Applies a connection_status change if the state machine allows it.
    // Same-state requests succeed without touching the record.
    bool transition(const std::string& id, ConnectionStatus to, castgrid::Timestamp now,
                    std::string& error);

    nlohmann::json toJson() const;

    // Teardown hook for tests and reloads
    void clear();

   private:
    struct Entry {
        mutable std::mutex mutex;
        Device device;
    };

    std::shared_ptr<Entry> findEntry(const std::string& id) const;
    std::vector<std::shared_ptr<Entry>> snapshotEntries() const;

    mutable std::shared_mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace devices
