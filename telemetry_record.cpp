#include "telemetry_record.h"

#include <array>
#include <ctime>

#include "protocol.h"

namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm           utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    return utc;
}

}  // namespace

TelemetryRecord make_record(const std::string& device_id, const TelemetryFields& fields) {
    using frame_layout::telemetry::COORDINATE_SCALE;

    TelemetryRecord record;
    record.device_id = device_id;
    record.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(fields.timestamp_epoch));
    record.latitude  = static_cast<double>(fields.latitude_raw) / COORDINATE_SCALE;
    record.longitude = static_cast<double>(fields.longitude_raw) / COORDINATE_SCALE;
    record.speed     = fields.speed;
    return record;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::tm        utc = to_utc_tm(tp);
    std::array<char, 32> buf{};
    const std::size_t    len = std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &utc);
    return std::string(buf.data(), len);
}

int utc_year(std::chrono::system_clock::time_point tp) {
    return to_utc_tm(tp).tm_year + 1900;
}

bool is_current_year(const TelemetryRecord& record, std::chrono::system_clock::time_point now) {
    return utc_year(record.timestamp) == utc_year(now);
}

void to_json(nlohmann::ordered_json& j, const TelemetryRecord& record) {
    j = nlohmann::ordered_json{
        {"device_id", record.device_id},
        {"timestamp", format_timestamp(record.timestamp)},
        {"latitude", record.latitude},
        {"longitude", record.longitude},
        {"speed", record.speed},
    };
}
