#include "fluxdb/core/types.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fluxdb {
namespace core {

std::string FormatRFC3339Nano(Timestamp ts) {
    // Floor division so pre-epoch instants keep a positive fraction
    int64_t seconds = ts / 1000000000LL;
    int64_t nanos = ts % 1000000000LL;
    if (nanos < 0) {
        nanos += 1000000000LL;
        seconds -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm.tm_year + 1900) << '-'
        << std::setw(2) << (tm.tm_mon + 1) << '-'
        << std::setw(2) << tm.tm_mday << 'T'
        << std::setw(2) << tm.tm_hour << ':'
        << std::setw(2) << tm.tm_min << ':'
        << std::setw(2) << tm.tm_sec;

    if (nanos != 0) {
        std::string frac = std::to_string(nanos);
        frac.insert(0, 9 - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        oss << '.' << frac;
    }
    oss << 'Z';
    return oss.str();
}

} // namespace core
} // namespace fluxdb
