#pragma once
/*
================================================================================
Core: Minimal Deterministic JSON Emitter
FILE: cpp/desal/core/json_writer.hpp

Purpose:
  - Shared by the configuration serializer and the run-summary exporter.
  - Caller controls key order; output is stable between runs.

Number formatting:
  - fixed_point == true  : std::fixed with `precision` decimals (reports)
  - fixed_point == false : general format that reads back bit-exact
                           (configuration files)
  - Non-finite numbers serialize as null.
================================================================================
*/

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <ios>
#include <sstream>
#include <string>

namespace desal {

inline std::string json_escape(const std::string& s) {
  std::ostringstream o;
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          const char* hex = "0123456789ABCDEF";
          const unsigned v = static_cast<unsigned char>(c);
          o << "\\u00" << hex[(v >> 4) & 0xF] << hex[v & 0xF];
        } else {
          o << c;
        }
    }
  }
  o << '"';
  return o.str();
}

struct JsonWriter {
  std::ostringstream out;
  int indent = 2;
  int level = 0;
  bool fixed_point = true;
  int precision = 6;

  void nl() {
    out << "\n" << std::string(static_cast<std::size_t>(level * indent), ' ');
  }

  void obj_begin() { out << "{"; level++; }
  void obj_end()   { level--; nl(); out << "}"; }

  void arr_begin() { out << "["; level++; }
  void arr_end()   { level--; nl(); out << "]"; }

  void key(const std::string& k) {
    out << json_escape(k) << ": ";
  }

  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void b(bool v) { out << (v ? "true" : "false"); }
  void n_null() { out << "null"; }

  void num(double v) {
    if (!std::isfinite(v)) { n_null(); return; }
    if (fixed_point) {
      out.setf(std::ios::fixed, std::ios::floatfield);
      out.precision(precision);
      out << v;
      return;
    }
    out << shortest_round_trip(v);
  }

  // 15 significant digits when that reads back exactly, 17 otherwise.
  static std::string shortest_round_trip(double v) {
    for (int digits : {15, 17}) {
      std::ostringstream s;
      s.unsetf(std::ios::floatfield);
      s.precision(digits);
      s << v;
      if (digits == 17 || std::strtod(s.str().c_str(), nullptr) == v) return s.str();
    }
    return std::string();
  }

  void num_i(long long v) { out << v; }
  void num_u(std::uint64_t v) { out << v; }

  // key + number; non-last fields get ",\n" so obj_end() closes cleanly
  void field(const std::string& k, double v, bool last = false) {
    key(k); num(v);
    if (!last) { comma(); nl(); }
  }
};

} // namespace desal
