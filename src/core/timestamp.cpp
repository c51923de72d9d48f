#include "core/timestamp.h"

#include <cstdio>
#include <ctime>

namespace playdeck {

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    auto micros = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }
    std::time_t seconds = system_clock::to_time_t(tp);

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%06lld", date, static_cast<long long>(micros));
    return buf;
}

}  // namespace playdeck
