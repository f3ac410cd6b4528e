#include "warden/ids.h"
#include "warden/crypto.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {

std::string new_record_id() {
    return random_hex(16);
}

bool is_valid_record_id(const std::string& id) {
    if (id.empty() || id.size() > 64) return false;
    for (char c : id) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

std::string new_job_name() {
    return "job-" + random_hex(4);
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_from_ms(int64_t ms) {
    std::time_t t = (std::time_t)(ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << (ms % 1000) << "Z";
    return oss.str();
}

} // namespace warden
