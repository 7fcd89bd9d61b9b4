#pragma once
/*
================================================================================
Core: Gregorian Calendar Helpers
FILE: cpp/desal/core/calendar.hpp

Purpose:
  - Day-by-day date arithmetic for the 365-day synthetic year.
  - Month names for summaries and reports.

Notes:
  - Proleptic Gregorian rules (leap: /4, not /100 unless /400).
  - A simulation starting on Jan 1 of a leap year covers Jan 1..Dec 30.
================================================================================
*/

#include <string>

namespace desal {

struct CalendarDate {
  int year = 2024;
  int month = 1;  // 1..12
  int day = 1;    // 1..days_in_month

  bool operator==(const CalendarDate& o) const {
    return year == o.year && month == o.month && day == o.day;
  }
  bool operator!=(const CalendarDate& o) const { return !(*this == o); }
};

bool is_leap_year(int year) noexcept;

// Throws ValidationError for month outside 1..12.
int days_in_month(int year, int month);

// Next calendar day.
CalendarDate next_day(const CalendarDate& d);

// d advanced by n >= 0 days.
CalendarDate add_days(CalendarDate d, int n);

// "YYYY-MM-DD"
std::string to_iso_string(const CalendarDate& d);

// "January".."December". Throws ValidationError for month outside 1..12.
const char* month_name(int month);

} // namespace desal
