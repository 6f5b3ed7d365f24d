#pragma once

#include "core/config_loader.h"
#include "devices/device.h"

#include <string>

namespace discovery {

// Builds the registry record of a device list entry. The id is the configured
// hostname (host part only), so an SSDP reply from the same host merges into it.
// Returns false when the entry's type is unknown or a DLNA action_url is unparsable.
bool deviceFromConfig(const DeviceConfigEntry& entry, devices::Device& out, std::string& error);

}  // namespace discovery
