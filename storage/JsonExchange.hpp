#pragma once

#include <string>
#include "../common/Device.hpp"

namespace netwake::storage
{
    // Export document: metadata plus a flat "devices" array, one entry per stored
    // device with its interface name. Empty fields are left out.
    std::string ExportJson(const common::KnownDeviceStore &store, bool debugMode, double exportedAt);

    // Accepts an export document, or an object mapping interface names to device
    // arrays under "known_devices" or "persistent_data". Entries that are not
    // objects or carry wrongly typed fields are skipped.
    // Throws std::invalid_argument when the text is not JSON or holds no devices.
    common::KnownDeviceStore ImportJson(const std::string &text);
}
