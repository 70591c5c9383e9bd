#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "frame_codec.h"

// One decoded position report, built from a frame and handed to the sink
struct TelemetryRecord {
    std::string                           device_id;
    std::chrono::system_clock::time_point timestamp;
    double                                latitude  = 0.0;
    double                                longitude = 0.0;
    uint32_t                              speed     = 0;
};

// Scale raw wire values into a record for the given device
TelemetryRecord make_record(const std::string& device_id, const TelemetryFields& fields);

// "YYYY-MM-DD HH:MM:SS" in UTC
std::string format_timestamp(std::chrono::system_clock::time_point tp);

int utc_year(std::chrono::system_clock::time_point tp);

// Sanity filter: records stamped outside the current year are treated as
// corrupt clocks and never reach the sink
bool is_current_year(const TelemetryRecord& record, std::chrono::system_clock::time_point now);

// nlohmann ADL hook. ordered_json keeps the keys in wire-report order:
// device_id, timestamp, latitude, longitude, speed
void to_json(nlohmann::ordered_json& j, const TelemetryRecord& record);
