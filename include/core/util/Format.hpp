#pragma once
#include <cstdint>
#include <chrono>
#include <string>

namespace mirror {
namespace core {
namespace util {

// "1.50 KB", "3.00 GB": основание 1024, два знака, максимум TB
std::string humanReadableBytes(uint64_t bytes);

// Локальное время в виде 2024-05-01T12:34:56.123456
std::string isoTimestamp(std::chrono::system_clock::time_point tp);

// Фиксированное число знаков после запятой, без локали
std::string formatFixed(double value, int precision);

std::string toLower(std::string value);
std::string toUpper(std::string value);
std::string trim(const std::string& value);

} // namespace util
} // namespace core
} // namespace mirror
