#include "desal/core/calendar.hpp"

#include <cstdio>

#include "desal/core/errors.hpp"

namespace desal {

namespace {

constexpr const char* kMonthNames[12] = {
  "January", "February", "March", "April", "May", "June",
  "July", "August", "September", "October", "November", "December"
};

void check_month(int month) {
  if (month < 1 || month > 12) {
    throw ValidationError("calendar: month must be in [1,12], got " + std::to_string(month));
  }
}

}  // namespace

bool is_leap_year(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
  check_month(month);
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

CalendarDate next_day(const CalendarDate& d) {
  CalendarDate n = d;
  if (n.day < days_in_month(n.year, n.month)) {
    ++n.day;
    return n;
  }
  n.day = 1;
  if (n.month < 12) {
    ++n.month;
  } else {
    n.month = 1;
    ++n.year;
  }
  return n;
}

CalendarDate add_days(CalendarDate d, int n) {
  if (n < 0) throw ValidationError("calendar: add_days requires n >= 0");
  for (int i = 0; i < n; ++i) d = next_day(d);
  return d;
}

std::string to_iso_string(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buf);
}

const char* month_name(int month) {
  check_month(month);
  return kMonthNames[month - 1];
}

}  // namespace desal
