#include "desal/core/config_json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

#include "desal/core/errors.hpp"
#include "desal/core/json_writer.hpp"
#include "desal/physics/derived_params.hpp"

namespace desal {
namespace {

// ============================================================================
// Reader
// ============================================================================

struct Cursor {
  const char* p = nullptr;
  const char* b = nullptr;
  const char* e = nullptr;

  size_t offset() const { return static_cast<size_t>(p - b); }
};

struct Loc {
  int line = 1;
  int col = 1;
  size_t offset = 0;
};

static inline void bump_loc(Loc& loc, char c) {
  loc.offset++;
  if (c == '\n') { loc.line++; loc.col = 1; }
  else { loc.col++; }
}

static void set_err(JsonParseError* err, const Loc& loc, std::string msg) {
  if (!err) return;
  err->message = std::move(msg);
  err->offset = loc.offset;
  err->line = loc.line;
  err->col = loc.col;
}

static inline bool eof(const Cursor& c) { return c.p >= c.e; }

static void advance(Cursor& c, Loc& loc) {
  bump_loc(loc, *c.p);
  ++c.p;
}

static void skip_ws(Cursor& c, Loc& loc) {
  while (!eof(c)) {
    const char ch = *c.p;
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      advance(c, loc);
      continue;
    }
    break;
  }
}

static bool expect(Cursor& c, Loc& loc, char ch, JsonParseError* err) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != ch) {
    set_err(err, loc, std::string("Expected '") + ch + "'");
    return false;
  }
  advance(c, loc);
  return true;
}

static bool match_literal(Cursor& c, Loc& loc, const char* lit) {
  const char* q = c.p;
  Loc tmp = loc;
  for (const char* s = lit; *s; ++s) {
    if (q >= c.e || *q != *s) return false;
    bump_loc(tmp, *q);
    ++q;
  }
  c.p = q;
  loc = tmp;
  return true;
}

static bool parse_hex4(Cursor& c, Loc& loc, JsonParseError* err, unsigned& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (eof(c)) {
      set_err(err, loc, "Unexpected EOF in \\uXXXX escape");
      return false;
    }
    const char ch = *c.p;
    unsigned v = 0;
    if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
    else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
    else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
    else {
      set_err(err, loc, "Invalid hex digit in \\uXXXX escape");
      return false;
    }
    out = (out << 4) | v;
    advance(c, loc);
  }
  return true;
}

static void append_utf8(std::string& s, unsigned cp) {
  if (cp <= 0x7F) {
    s.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

static bool parse_string(Cursor& c, Loc& loc, JsonParseError* err, std::string& out) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != '"') {
    set_err(err, loc, "Expected string");
    return false;
  }
  advance(c, loc);
  out.clear();

  while (!eof(c)) {
    const char ch = *c.p;
    if (ch == '"') {
      advance(c, loc);
      return true;
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      set_err(err, loc, "Unescaped control character in string");
      return false;
    }
    if (ch == '\\') {
      advance(c, loc);
      if (eof(c)) {
        set_err(err, loc, "Unexpected EOF in string escape");
        return false;
      }
      const char esc = *c.p;
      advance(c, loc);
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned u = 0;
          if (!parse_hex4(c, loc, err, u)) return false;
          if (u >= 0xD800 && u <= 0xDBFF) {
            if (eof(c) || *c.p != '\\') {
              set_err(err, loc, "High surrogate not followed by low surrogate");
              return false;
            }
            advance(c, loc);
            if (eof(c) || *c.p != 'u') {
              set_err(err, loc, "High surrogate not followed by \\u");
              return false;
            }
            advance(c, loc);
            unsigned u2 = 0;
            if (!parse_hex4(c, loc, err, u2)) return false;
            if (u2 < 0xDC00 || u2 > 0xDFFF) {
              set_err(err, loc, "Invalid low surrogate");
              return false;
            }
            append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
          } else if (u >= 0xDC00 && u <= 0xDFFF) {
            set_err(err, loc, "Unexpected low surrogate");
            return false;
          } else {
            append_utf8(out, u);
          }
        } break;
        default:
          set_err(err, loc, "Invalid escape sequence");
          return false;
      }
      continue;
    }
    out.push_back(ch);
    advance(c, loc);
  }

  set_err(err, loc, "Unterminated string");
  return false;
}

static bool is_digit(const Cursor& c) {
  return !eof(c) && std::isdigit(static_cast<unsigned char>(*c.p));
}

static bool parse_number(Cursor& c, Loc& loc, JsonParseError* err, double& out) {
  skip_ws(c, loc);
  const char* start = c.p;
  const Loc start_loc = loc;

  // JSON number grammar (no leading '+', no NaN/Inf).
  if (!eof(c) && *c.p == '-') advance(c, loc);

  if (eof(c)) {
    set_err(err, loc, "Expected digits after '-'");
    return false;
  }
  if (*c.p == '0') {
    advance(c, loc);
  } else if (*c.p >= '1' && *c.p <= '9') {
    while (is_digit(c)) advance(c, loc);
  } else {
    set_err(err, loc, "Invalid number");
    return false;
  }

  if (!eof(c) && *c.p == '.') {
    advance(c, loc);
    if (!is_digit(c)) {
      set_err(err, loc, "Expected digits after '.'");
      return false;
    }
    while (is_digit(c)) advance(c, loc);
  }

  if (!eof(c) && (*c.p == 'e' || *c.p == 'E')) {
    advance(c, loc);
    if (!eof(c) && (*c.p == '+' || *c.p == '-')) advance(c, loc);
    if (!is_digit(c)) {
      set_err(err, loc, "Expected digits in exponent");
      return false;
    }
    while (is_digit(c)) advance(c, loc);
  }

  const std::string tmp(start, c.p);
  errno = 0;
  char* endptr = nullptr;
  const double v = std::strtod(tmp.c_str(), &endptr);
  if (endptr == tmp.c_str() || *endptr != '\0') {
    set_err(err, start_loc, "Failed to parse number");
    return false;
  }
  if (errno == ERANGE || !std::isfinite(v)) {
    set_err(err, start_loc, "Number out of range");
    return false;
  }
  out = v;
  return true;
}

enum class JType { kNull, kBool, kNum, kStr, kObj, kArr };

struct JVal {
  JType t = JType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::unordered_map<std::string, JVal> obj;
  std::vector<JVal> arr;
  Loc loc;  // where the value starts
};

static const char* type_name(JType t) {
  switch (t) {
    case JType::kNull: return "null";
    case JType::kBool: return "boolean";
    case JType::kNum:  return "number";
    case JType::kStr:  return "string";
    case JType::kObj:  return "object";
    case JType::kArr:  return "array";
  }
  return "unknown";
}

static bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JVal& out);

static bool parse_array(Cursor& c, Loc& loc, JsonParseError* err, JVal& out) {
  if (!expect(c, loc, '[', err)) return false;
  out.t = JType::kArr;
  out.arr.clear();

  skip_ws(c, loc);
  if (!eof(c) && *c.p == ']') {
    advance(c, loc);
    return true;
  }

  while (true) {
    JVal v;
    if (!parse_value(c, loc, err, v)) return false;
    out.arr.emplace_back(std::move(v));

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, loc, "Unexpected EOF in array");
      return false;
    }
    if (*c.p == ',') { advance(c, loc); continue; }
    if (*c.p == ']') { advance(c, loc); return true; }
    set_err(err, loc, "Expected ',' or ']'");
    return false;
  }
}

static bool parse_object(Cursor& c, Loc& loc, JsonParseError* err, JVal& out) {
  if (!expect(c, loc, '{', err)) return false;
  out.t = JType::kObj;
  out.obj.clear();

  skip_ws(c, loc);
  if (!eof(c) && *c.p == '}') {
    advance(c, loc);
    return true;
  }

  while (true) {
    std::string key;
    if (!parse_string(c, loc, err, key)) return false;
    if (!expect(c, loc, ':', err)) return false;

    JVal val;
    if (!parse_value(c, loc, err, val)) return false;
    out.obj[std::move(key)] = std::move(val);

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, loc, "Unexpected EOF in object");
      return false;
    }
    if (*c.p == ',') { advance(c, loc); continue; }
    if (*c.p == '}') { advance(c, loc); return true; }
    set_err(err, loc, "Expected ',' or '}'");
    return false;
  }
}

static bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JVal& out) {
  skip_ws(c, loc);
  if (eof(c)) {
    set_err(err, loc, "Unexpected EOF");
    return false;
  }
  out.loc = loc;

  const char ch = *c.p;
  if (ch == '{') return parse_object(c, loc, err, out);
  if (ch == '[') return parse_array(c, loc, err, out);
  if (ch == '"') {
    out.t = JType::kStr;
    return parse_string(c, loc, err, out.str);
  }
  if (ch == 't' || ch == 'f') {
    const bool v = (ch == 't');
    if (!match_literal(c, loc, v ? "true" : "false")) {
      set_err(err, loc, "Invalid literal");
      return false;
    }
    out.t = JType::kBool;
    out.b = v;
    return true;
  }
  if (ch == 'n') {
    if (!match_literal(c, loc, "null")) {
      set_err(err, loc, "Invalid literal");
      return false;
    }
    out.t = JType::kNull;
    return true;
  }
  if (ch == '-' || (ch >= '0' && ch <= '9')) {
    out.t = JType::kNum;
    return parse_number(c, loc, err, out.num);
  }

  set_err(err, loc, "Unexpected token");
  return false;
}

// ============================================================================
// Schema mapping
// ============================================================================

static const JVal* obj_get(const JVal& o, const char* k) {
  if (o.t != JType::kObj) return nullptr;
  auto it = o.obj.find(k);
  return (it == o.obj.end()) ? nullptr : &it->second;
}

static bool type_err(JsonParseError* err, const JVal& v, const std::string& path, const char* want) {
  set_err(err, v.loc, path + " must be " + want + ", got " + type_name(v.t));
  return false;
}

// Missing -> untouched; anything other than a finite number -> error.
static bool read_number(const JVal& o, const char* k, const std::string& path, double& out, JsonParseError* err) {
  const JVal* v = obj_get(o, k);
  if (!v) return true;
  if (v->t != JType::kNum) return type_err(err, *v, path + "." + k, "a number");
  out = v->num;
  return true;
}

static bool read_int(const JVal& o, const char* k, const std::string& path, int& out, JsonParseError* err) {
  const JVal* v = obj_get(o, k);
  if (!v) return true;
  if (v->t != JType::kNum) return type_err(err, *v, path + "." + k, "an integer");
  if (std::floor(v->num) != v->num ||
      v->num < static_cast<double>(std::numeric_limits<int>::min()) ||
      v->num > static_cast<double>(std::numeric_limits<int>::max())) {
    set_err(err, v->loc, path + "." + k + " must be an integer");
    return false;
  }
  out = static_cast<int>(v->num);
  return true;
}

static bool read_string(const JVal& o, const char* k, const std::string& path, std::string& out, JsonParseError* err) {
  const JVal* v = obj_get(o, k);
  if (!v) return true;
  if (v->t != JType::kStr) return type_err(err, *v, path + "." + k, "a string");
  out = v->str;
  return true;
}

template <typename Enum>
static bool read_enum(const JVal& o, const char* k, const std::string& path, Enum& out,
                      bool (*parse)(const std::string&, Enum*) noexcept, JsonParseError* err) {
  const JVal* v = obj_get(o, k);
  if (!v) return true;
  if (v->t != JType::kStr) return type_err(err, *v, path + "." + k, "a string");
  Enum tmp{};
  if (!parse(v->str, &tmp)) {
    set_err(err, v->loc, path + "." + k + ": unknown value '" + v->str + "'");
    return false;
  }
  out = tmp;
  return true;
}

// Returns the section object (nullptr when absent). *ok=false on a type error.
static const JVal* section(const JVal& root, const char* k, bool* ok, JsonParseError* err) {
  *ok = true;
  const JVal* v = obj_get(root, k);
  if (v && v->t != JType::kObj) {
    *ok = type_err(err, *v, k, "an object");
    return nullptr;
  }
  return v;
}

static bool fill_config_from_root(const JVal& root, Configuration& cfg, JsonParseError* err) {
  if (root.t != JType::kObj) return type_err(err, root, "root", "an object");

  bool ok = true;

  if (const JVal* s = section(root, "dimensions", &ok, err)) {
    auto& d = cfg.dimensions;
    if (!read_number(*s, "length_m", "dimensions", d.length_m, err)) return false;
    if (!read_number(*s, "width_m", "dimensions", d.width_m, err)) return false;
    if (!read_number(*s, "height_m", "dimensions", d.height_m, err)) return false;
  }
  if (!ok) return false;

  if (const JVal* s = section(root, "thermal", &ok, err)) {
    auto& t = cfg.thermal;
    if (!read_number(*s, "absorptivity", "thermal", t.absorptivity, err)) return false;
    if (!read_number(*s, "incidence_angle_deg", "thermal", t.incidence_angle_deg, err)) return false;
    if (!read_string(*s, "box_material", "thermal", t.box_material, err)) return false;
    if (!read_enum(*s, "unknown_material", "thermal", t.unknown_material, &parse_material_policy, err)) return false;
  }
  if (!ok) return false;

  if (const JVal* s = section(root, "water", &ok, err)) {
    auto& w = cfg.water;
    if (!read_number(*s, "specific_heat_J_kgK", "water", w.specific_heat_J_kgK, err)) return false;
    if (!read_number(*s, "latent_heat_J_kg", "water", w.latent_heat_J_kg, err)) return false;
    if (!read_number(*s, "initial_temp_K", "water", w.initial_temp_K, err)) return false;
    if (!read_number(*s, "boiling_temp_K", "water", w.boiling_temp_K, err)) return false;
  }
  if (!ok) return false;

  if (const JVal* s = section(root, "material_conductivity_W_mK", &ok, err)) {
    std::map<std::string, double> table;
    for (const auto& kv : s->obj) {
      if (kv.second.t != JType::kNum) {
        return type_err(err, kv.second, "material_conductivity_W_mK." + kv.first, "a number");
      }
      table[kv.first] = kv.second.num;
    }
    cfg.material_conductivity_W_mK = std::move(table);
  }
  if (!ok) return false;

  if (const JVal* s = section(root, "operation", &ok, err)) {
    auto& op = cfg.operation;
    if (!read_number(*s, "useful_sun_hours", "operation", op.useful_sun_hours, err)) return false;
    if (!read_number(*s, "water_mass_kg", "operation", op.water_mass_kg, err)) return false;
    if (!read_enum(*s, "hemisphere", "operation", op.hemisphere, &parse_hemisphere, err)) return false;
    if (!read_number(*s, "latitude_deg", "operation", op.latitude_deg, err)) return false;
  }
  if (!ok) return false;

  if (const JVal* s = section(root, "simulation", &ok, err)) {
    auto& sim = cfg.simulation;
    if (!read_number(*s, "base_irradiance_Wm2", "simulation", sim.base_irradiance_Wm2, err)) return false;
    if (!read_number(*s, "seasonal_amplitude_Wm2", "simulation", sim.seasonal_amplitude_Wm2, err)) return false;
    if (!read_number(*s, "daily_stddev_Wm2", "simulation", sim.daily_stddev_Wm2, err)) return false;
    if (!read_int(*s, "epoch_year", "simulation", sim.epoch_year, err)) return false;
    if (!read_enum(*s, "band_source", "simulation", sim.band_source, &parse_band_source, err)) return false;

    if (const JVal* bands = obj_get(*s, "efficiency_bands")) {
      if (bands->t != JType::kArr) return type_err(err, *bands, "simulation.efficiency_bands", "an array");
      std::vector<EfficiencyBand> out;
      out.reserve(bands->arr.size());
      for (size_t i = 0; i < bands->arr.size(); ++i) {
        const JVal& it = bands->arr[i];
        const std::string at = "simulation.efficiency_bands[" + std::to_string(i) + "]";
        if (it.t != JType::kObj) return type_err(err, it, at, "an object");
        EfficiencyBand band;
        const JVal* th = obj_get(it, "min_irradiance_Wm2");
        const JVal* f = obj_get(it, "factor");
        if (!th || !f) {
          set_err(err, it.loc, at + " requires min_irradiance_Wm2 and factor");
          return false;
        }
        if (!read_number(it, "min_irradiance_Wm2", at, band.min_irradiance_Wm2, err)) return false;
        if (!read_number(it, "factor", at, band.factor, err)) return false;
        out.push_back(band);
      }
      sim.efficiency_bands = std::move(out);
    }
  }
  return ok;
}

}  // namespace

// ============================================================================
// Writer
// ============================================================================

void emit_derived_object(JsonWriter& j, const DerivedParameters& p) {
  j.obj_begin(); j.nl();
  j.field("captured_area_m2", p.captured_area_m2);
  j.field("wall_area_m2", p.wall_area_m2);
  j.field("total_area_m2", p.total_area_m2);
  j.field("volume_L", p.volume_L);
  j.field("water_depth_m", p.water_depth_m);
  j.field("cos_incidence", p.cos_incidence);
  j.field("useful_seconds", p.useful_seconds);
  j.key("box_material"); j.str(p.box_material); j.comma(); j.nl();
  j.field("box_conductivity_W_mK", p.box_conductivity_W_mK);
  j.key("box_conductivity_fallback"); j.b(p.box_conductivity_fallback); j.comma(); j.nl();

  j.key("heat_transfer_W_m2K"); j.obj_begin(); j.nl();
  j.field("natural_convection", p.natural_convection_W_m2K);
  j.field("water_convection", p.water_convection_W_m2K);
  j.field("evaporation", p.evaporation_coefficient_W_m2K);
  j.field("condensation", p.condensation_W_m2K, true);
  j.obj_end(); j.comma(); j.nl();

  j.key("resistances_K_W"); j.obj_begin(); j.nl();
  j.field("conduction", p.resistances.R_cond_K_W);
  j.field("insulation", p.resistances.R_insulation_K_W);
  j.field("walls", p.resistances.R_walls_K_W);
  j.field("glass", p.resistances.R_glass_K_W);
  j.field("exterior_convection", p.resistances.R_conv_ext_K_W);
  j.field("total", p.resistances.R_total_K_W, true);
  j.obj_end(); j.comma(); j.nl();

  j.key("energy_J"); j.obj_begin(); j.nl();
  j.field("heating", p.energy.heating_J);
  j.field("evaporation", p.energy.evaporation_J);
  j.field("total_required", p.energy.total_required_J);
  j.field("per_kg", p.energy.per_kg_J, true);
  j.obj_end();

  j.obj_end();
}

void emit_config_object(JsonWriter& j, const Configuration& cfg, const DerivedParameters* derived) {
  j.obj_begin(); j.nl();

  j.key("dimensions"); j.obj_begin(); j.nl();
  j.field("length_m", cfg.dimensions.length_m);
  j.field("width_m", cfg.dimensions.width_m);
  j.field("height_m", cfg.dimensions.height_m, true);
  j.obj_end(); j.comma(); j.nl();

  j.key("thermal"); j.obj_begin(); j.nl();
  j.field("absorptivity", cfg.thermal.absorptivity);
  j.field("incidence_angle_deg", cfg.thermal.incidence_angle_deg);
  j.key("box_material"); j.str(cfg.thermal.box_material); j.comma(); j.nl();
  j.key("unknown_material"); j.str(to_string(cfg.thermal.unknown_material));
  j.obj_end(); j.comma(); j.nl();

  j.key("water"); j.obj_begin(); j.nl();
  j.field("specific_heat_J_kgK", cfg.water.specific_heat_J_kgK);
  j.field("latent_heat_J_kg", cfg.water.latent_heat_J_kg);
  j.field("initial_temp_K", cfg.water.initial_temp_K);
  j.field("boiling_temp_K", cfg.water.boiling_temp_K, true);
  j.obj_end(); j.comma(); j.nl();

  j.key("material_conductivity_W_mK"); j.obj_begin();
  {
    size_t i = 0;
    for (const auto& kv : cfg.material_conductivity_W_mK) {
      j.nl();
      j.key(kv.first); j.num(kv.second);
      if (++i < cfg.material_conductivity_W_mK.size()) j.comma();
    }
  }
  j.obj_end(); j.comma(); j.nl();

  j.key("operation"); j.obj_begin(); j.nl();
  j.field("useful_sun_hours", cfg.operation.useful_sun_hours);
  j.field("water_mass_kg", cfg.operation.water_mass_kg);
  j.key("hemisphere"); j.str(to_string(cfg.operation.hemisphere)); j.comma(); j.nl();
  j.field("latitude_deg", cfg.operation.latitude_deg, true);
  j.obj_end(); j.comma(); j.nl();

  const auto& sim = cfg.simulation;
  j.key("simulation"); j.obj_begin(); j.nl();
  j.field("base_irradiance_Wm2", sim.base_irradiance_Wm2);
  j.field("seasonal_amplitude_Wm2", sim.seasonal_amplitude_Wm2);
  j.field("daily_stddev_Wm2", sim.daily_stddev_Wm2);
  j.key("epoch_year"); j.num_i(sim.epoch_year); j.comma(); j.nl();
  j.key("band_source"); j.str(to_string(sim.band_source)); j.comma(); j.nl();
  j.key("efficiency_bands"); j.arr_begin();
  for (size_t i = 0; i < sim.efficiency_bands.size(); ++i) {
    j.nl(); j.obj_begin(); j.nl();
    j.field("min_irradiance_Wm2", sim.efficiency_bands[i].min_irradiance_Wm2);
    j.field("factor", sim.efficiency_bands[i].factor, true);
    j.obj_end();
    if (i + 1 < sim.efficiency_bands.size()) j.comma();
  }
  j.arr_end();
  j.obj_end();

  if (derived) {
    j.comma(); j.nl();
    j.key("derived"); emit_derived_object(j, *derived);
  }

  j.obj_end();
}

std::string config_to_json(const Configuration& cfg, bool include_derived, int indent_spaces) {
  JsonWriter j;
  j.indent = indent_spaces;
  j.fixed_point = false;

  if (include_derived) {
    const DerivedParameters derived = DerivedParameters::from(cfg);
    emit_config_object(j, cfg, &derived);
  } else {
    emit_config_object(j, cfg, nullptr);
  }
  j.out << "\n";
  return j.out.str();
}

bool write_config_json_file(const Configuration& cfg, const std::string& file_path, bool include_derived) {
  const std::string text = config_to_json(cfg, include_derived);
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << text;
  f.close();
  return !f.fail();
}

bool parse_config_json(std::string_view json, Configuration* out, JsonParseError* err) {
  if (!out) return false;

  Cursor c;
  c.b = json.data();
  c.p = json.data();
  c.e = json.data() + json.size();
  Loc loc;

  JVal root;
  if (!parse_value(c, loc, err, root)) return false;

  skip_ws(c, loc);
  if (!eof(c)) {
    set_err(err, loc, "Trailing characters after JSON");
    return false;
  }

  Configuration cfg = Configuration::defaults();
  if (!fill_config_from_root(root, cfg, err)) return false;

  *out = std::move(cfg);
  return true;
}

bool parse_config_json(std::istream& is, Configuration* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  const std::string buf = ss.str();
  return parse_config_json(std::string_view(buf), out, err);
}

bool load_config_json_file(const std::string& file_path, Configuration* out, JsonParseError* err) {
  std::ifstream f(file_path, std::ios::binary);
  if (!f.is_open()) throw IOError("cannot open configuration file: " + file_path);
  return parse_config_json(f, out, err);
}

}  // namespace desal
