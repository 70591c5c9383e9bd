#include "ntc_error.h"

#include <string>

namespace {

class NtcCategory final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "ntc";
    }

    std::string message(int condition) const override {
        switch (static_cast<ntc_errc>(condition)) {
            case ntc_errc::truncated:
                return "frame truncated";
            case ntc_errc::bad_magic:
                return "bad protocol magic";
            case ntc_errc::missing_device_id:
                return "device id is missing";
            case ntc_errc::encoding_error:
                return "device id is not ASCII";
            case ntc_errc::malformed_frame:
                return "malformed telemetry frame";
            case ntc_errc::bad_checksum:
                return "checksum mismatch";
            case ntc_errc::invalid_argument:
                return "invalid frame argument";
            case ntc_errc::peer_disconnected:
                return "peer disconnected";
            case ntc_errc::transport_error:
                return "transport error";
            case ntc_errc::idle_timeout:
                return "idle timeout";
        }
        return "unknown ntc error";
    }
};

}  // namespace

const std::error_category& ntc_category() noexcept {
    static NtcCategory category;
    return category;
}

std::error_code make_error_code(ntc_errc e) noexcept {
    return {static_cast<int>(e), ntc_category()};
}
