#include "core/util/Format.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace mirror {
namespace core {
namespace util {

std::string humanReadableBytes(uint64_t bytes) {
    static const char* suffixes[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t suffixCount = sizeof(suffixes) / sizeof(suffixes[0]);
    double value = static_cast<double>(bytes);
    size_t index = 0;
    while (value >= 1024.0 && index < suffixCount - 1) {
        value /= 1024.0;
        ++index;
    }
    return formatFixed(value, 2) + " " + suffixes[index];
}

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string formatFixed(double value, int precision) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto first = value.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(ws);
    return value.substr(first, last - first + 1);
}

} // namespace util
} // namespace core
} // namespace mirror
