#pragma once
#include <cstdint>
#include <string>

namespace AppConfig {
    static const std::string CONFIG_FILE = "../devtrack.json";
    static const std::string STORAGE_DIR = "devtrack_storage";
    static const std::string TOPOLOGY_FILE = "";
    static const int64_t STORAGE_UPDATE_INTERVAL_MS = 5 * 60 * 1000;
    static const int64_t FLAP_COOLDOWN_MS = 5000;
    static const int64_t DEVICE_TIMEOUT_MS = 60 * 60 * 1000;
    static const int64_t OLD_ATTACHMENT_POINT_TIMEOUT_MS = 60 * 60 * 1000;
    static const int64_t AGING_INTERVAL_S = 15;
    static const size_t DISPATCHER_QUEUE_LIMIT = 4096;
}
