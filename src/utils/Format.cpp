#include "utils/Format.h"
#include <cstdio>
#include <sstream>

namespace {
    // Howard Hinnant 的 civil_from_days: 1970-01-01 起的天数 -> (年, 月, 日)
    void civilFromDays(long long days, int& year, unsigned& month, unsigned& day) {
        days += 719468;
        const long long era = (days >= 0 ? days : days - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(days - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        day = doy - (153 * mp + 2) / 5 + 1;
        month = mp < 10 ? mp + 3 : mp - 9;
        year = static_cast<int>(static_cast<long long>(yoe) + era * 400) + (month <= 2 ? 1 : 0);
    }

    long long secondsSinceEpoch(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    long long floorDiv(long long a, long long b) {
        long long q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }
}

namespace FormatUtils {

std::string formatSize(std::uintmax_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%ju B", bytes);
    } else if (bytes < 1024ull * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else if (bytes < 1024ull * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f GB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}

std::string formatDate(std::chrono::system_clock::time_point tp) {
    long long secs = secondsSinceEpoch(tp);
    int y;
    unsigned m, d;
    civilFromDays(floorDiv(secs, 86400), y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    long long secs = secondsSinceEpoch(tp);
    long long days = floorDiv(secs, 86400);
    long long rem = secs - days * 86400;
    int y;
    unsigned m, d;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02lld:%02lld:%02lld",
                  y, m, d, rem / 3600, (rem % 3600) / 60, rem % 60);
    return buf;
}

std::string formatPermissions(std::filesystem::perms p) {
    std::ostringstream oss;
    oss << std::oct << (static_cast<unsigned>(p) & 07777u);
    return oss.str();
}

std::chrono::system_clock::time_point toSystemClock(std::filesystem::file_time_type ft) {
    // C++17 没有 clock_cast,按两个时钟的当前时刻做差换算
    auto sysNow = std::chrono::system_clock::now();
    auto fileNow = std::filesystem::file_time_type::clock::now();
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(ft - fileNow + sysNow);
}

}
