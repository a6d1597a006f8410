#include "engine/transaction.hpp"

namespace muleguard {
namespace engine {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long daysFromCivil(int year, int month, int day) {
  year -= month <= 2 ? 1 : 0;
  const long era = (year >= 0 ? year : year - 399) / 400;
  const long yoe = year - era * 400;
  const long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

}  // namespace

double hoursBetween(const Timestamp& a, const Timestamp& b) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(b - a).count();
  return static_cast<double>(micros) / 3600000000.0;
}

Timestamp makeTimestamp(int year, int month, int day, int hour, int minute,
                        int second, long microseconds) {
  long long seconds = static_cast<long long>(daysFromCivil(year, month, day)) * 86400LL +
                      hour * 3600LL + minute * 60LL + second;
  return Timestamp(std::chrono::microseconds(seconds * 1000000LL + microseconds));
}

}  // namespace engine
}  // namespace muleguard
