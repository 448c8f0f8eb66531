// param_store.cpp
#include <ArduinoJson.h>
#include <math.h>

#include "logging.h"
#include "param_store.h"

static const size_t DOC_SIZE = 1024;

// ----------------------------------------------------------
//                    PARAM
// ----------------------------------------------------------

ParamStore::ParamStore() {
  add("L_mm", 240.0, 0.0, true);
  add("s_mm", 103.0, 0.0, true);
  add("slope_tol", 1e-3, 0.0, true);
  add("segment_samples", 400.0, 1.0, false);
  add("swap", 0.0, 0.0, false, true);
}

void ParamStore::add(const char *key, double def, double min_val, bool min_exclusive, bool is_flag) {
  Param p;
  p.value = def;
  p.def = def;
  p.min_val = min_val;
  p.min_exclusive = min_exclusive;
  p.is_flag = is_flag;
  params[key] = p;
}

bool ParamStore::valid(const Param &p, double value) const {
  if (!isfinite(value)) return false;
  if (p.is_flag) return value == 0.0 || value == 1.0;
  if (p.min_exclusive) return value > p.min_val;
  return value >= p.min_val;
}

bool ParamStore::has(const char *key) const {
  return key && params.count(key) > 0;
}

// ------------------------------------------------------
// Get parameter (unknown key reads as NaN)
// ------------------------------------------------------
double ParamStore::get(const char *key) const {
  if (!key) return NAN;
  auto it = params.find(key);
  if (it == params.end()) return NAN;
  return it->second.value;
}

// ------------------------------------------------------
// Set parameter
// ------------------------------------------------------
bool ParamStore::set(const char *key, double value) {
  if (!key) return false;
  auto it = params.find(key);
  if (it == params.end()) {
    LOG_PRINTF("set param unknown key{%s}", key);
    return false;
  }
  if (!valid(it->second, value)) {
    LOG_PRINTF("set param key{%s} rejected val{%g}", key, value);
    return false;
  }
  it->second.value = value;
  LOG_PRINTF("set param key{%s} val{%g}", key, value);
  return true;
}

void ParamStore::reset() {
  for (auto &kv : params) kv.second.value = kv.second.def;
}

DepthGeometry ParamStore::geometry() const {
  DepthGeometry g;
  g.s_mm = get("s_mm");
  g.L_mm = get("L_mm");
  g.slope_tol = get("slope_tol");
  return g;
}

bool ParamStore::swapOn() const {
  return get("swap") != 0.0;
}

// ------------------------------------------------------
// Load parameters from a JSON object
// ------------------------------------------------------
bool ParamStore::load_json(const std::string &text, std::string *err) {
  LOG_SECTION_START("load params json");

  DynamicJsonDocument doc(DOC_SIZE);
  DeserializationError derr = deserializeJson(doc, text);
  if (derr) {
    if (err) *err = std::string("json: ") + derr.c_str();
    LOG_PRINTF("deserialize failed {%s}", derr.c_str());
    LOG_SECTION_END();
    return false;
  }
  if (!doc.is<JsonObject>()) {
    if (err) *err = "json: expected an object";
    LOG_PRINTF("json root is not an object");
    LOG_SECTION_END();
    return false;
  }

  // validate everything first, then apply
  std::map<std::string, double> staged;
  for (JsonPair kv : doc.as<JsonObject>()) {
    const char *key = kv.key().c_str();
    JsonVariant v = kv.value();

    auto it = params.find(key);
    if (it == params.end()) {
      if (err) *err = std::string("unknown key: ") + key;
      LOG_PRINTF("unknown key {%s}", key);
      LOG_SECTION_END();
      return false;
    }

    double value;
    if (v.is<bool>()) {
      value = v.as<bool>() ? 1.0 : 0.0;
    } else if (v.is<double>() || v.is<long>()) {
      value = v.as<double>();
    } else {
      if (err) *err = std::string("not a number: ") + key;
      LOG_PRINTF("not a number {%s}", key);
      LOG_SECTION_END();
      return false;
    }

    if (!valid(it->second, value)) {
      if (err) *err = std::string("out of range: ") + key;
      LOG_PRINTF("out of range {%s} val{%g}", key, value);
      LOG_SECTION_END();
      return false;
    }
    staged[key] = value;
  }

  for (auto &kv : staged) {
    params[kv.first].value = kv.second;
    LOG_VAR(kv.first.c_str(), kv.second);
  }

  LOG_SECTION_END();
  return true;
}

// ------------------------------------------------------
// Dump all parameters as a JSON object
// ------------------------------------------------------
std::string ParamStore::to_json() const {
  DynamicJsonDocument doc(DOC_SIZE);
  for (auto &kv : params) {
    if (kv.second.is_flag)
      doc[kv.first] = kv.second.value != 0.0;
    else
      doc[kv.first] = kv.second.value;
  }
  std::string out;
  serializeJson(doc, out);
  return out;
}

void ParamStore::list_params() const {
  if (!logging_on) return;
  LOG_SECTION_START("params");
  for (auto &kv : params) {
    log_indent();
    log_printf("%s {%g}", kv.first.c_str(), kv.second.value);
    LOG_VAR_CONT("default", kv.second.def);
  }
  LOG_SECTION_END();
}
