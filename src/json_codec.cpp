// json_codec.cpp

#include "json_codec.h"

#include <mbedtls/base64.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <type_traits>

namespace oscbridge {

using nlohmann::json;

static constexpr char kImmediate[] = "immediate";

// ── Time tags ────────────────────────────────────────────────────────────────

std::string format_timetag(TimeTag tag) {
  if (tag.is_immediate()) return kImmediate;

  using namespace std::chrono;
  const auto since_epoch = duration_cast<nanoseconds>(tag.to_time_point().time_since_epoch());
  const auto secs = floor<seconds>(since_epoch);
  auto nanos = static_cast<uint32_t>((since_epoch - secs).count());

  std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm{};
  ::gmtime_r(&t, &tm);

  char buf[64]{};
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string out(buf, n);
  if (nanos != 0) {
    char frac[16]{};
    std::snprintf(frac, sizeof(frac), ".%09u", nanos);
    std::string f(frac);
    while (f.back() == '0') f.pop_back();
    out += f;
  }
  out += 'Z';
  return out;
}

TimeTag parse_timetag(const std::string& text) {
  if (text == kImmediate) return TimeTag::immediate();

  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    throw CodecError("invalid timetag '" + text + "'");
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  size_t pos = static_cast<size_t>(consumed);
  int64_t nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) throw CodecError("invalid timetag '" + text + "'");
    for (; digits < 9; ++digits) nanos *= 10;
  }

  int64_t offset_s = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int oh = 0, om = 0, n = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &n) != 2) {
      throw CodecError("invalid timetag offset '" + text + "'");
    }
    offset_s = (oh * 3600 + om * 60) * (text[pos] == '-' ? -1 : 1);
    pos += 1 + static_cast<size_t>(n);
  } else {
    throw CodecError("timetag '" + text + "' has no zone designator");
  }
  if (pos != text.size()) throw CodecError("trailing characters in timetag '" + text + "'");

  const std::time_t t = ::timegm(&tm);
  using namespace std::chrono;
  const auto tp = system_clock::time_point(
      duration_cast<system_clock::duration>(seconds(t - offset_s) + nanoseconds(nanos)));
  return TimeTag::from_time_point(tp);
}

// ── Base64 ───────────────────────────────────────────────────────────────────

std::string base64_encode(const Blob& data) {
  if (data.empty()) return {};
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  size_t written = 0;
  int rc = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(out.data()), out.size(), &written,
                                 data.data(), data.size());
  if (rc != 0) throw CodecError("base64 encode: mbedtls error " + std::to_string(rc));
  out.resize(written);
  return out;
}

// ── Arguments ────────────────────────────────────────────────────────────────

// Widen a float through its shortest decimal form so 0.1f prints as 0.1.
static double widen(float v) {
  char buf[32]{};
  auto res = std::to_chars(buf, buf + sizeof(buf) - 1, v);
  if (res.ec != std::errc{}) return static_cast<double>(v);
  *res.ptr = '\0';
  return std::strtod(buf, nullptr);
}

json argument_to_json(const Argument& arg) {
  return std::visit(
      [](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Nil>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, float>) {
          return widen(v);
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int32_t> ||
                             std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, TimeTag>) {
          return format_timetag(v);
        } else if constexpr (std::is_same_v<T, Blob>) {
          return base64_encode(v);
        } else {
          static_assert(sizeof(T) == 0, "unhandled Argument alternative");
        }
      },
      arg);
}

json arguments_to_json(const ArgumentList& args) {
  json out = json::array();
  for (const auto& arg : args) out.push_back(argument_to_json(arg));
  return out;
}

static Argument argument_from_json(const json& j, size_t index) {
  if (j.is_null()) return Nil{};
  if (j.is_boolean()) return j.get<bool>();
  if (j.is_number_unsigned()) {
    const auto v = j.get<uint64_t>();
    if (v <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
      return static_cast<int32_t>(v);
    }
    if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(v);
    }
    throw CodecError("argument " + std::to_string(index) + ": integer out of range");
  }
  if (j.is_number_integer()) {
    const auto v = j.get<int64_t>();
    if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
      return static_cast<int32_t>(v);
    }
    return v;
  }
  if (j.is_number_float()) return static_cast<float>(j.get<double>());
  if (j.is_string()) return j.get<std::string>();
  throw CodecError("argument " + std::to_string(index) + ": expected a scalar, got " +
                   std::string(j.type_name()));
}

ArgumentList arguments_from_json(const json& j) {
  if (j.is_null()) return {};
  if (!j.is_array()) {
    throw CodecError(std::string("expected a JSON array of arguments, got ") + j.type_name());
  }
  ArgumentList out;
  out.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) out.push_back(argument_from_json(j[i], i));
  return out;
}

// ── Bundles ──────────────────────────────────────────────────────────────────

json bundle_to_json(const ControlBundle& bundle) {
  json messages = json::array();
  for (const auto& m : bundle.messages) {
    messages.push_back({{"address", m.address}, {"arguments", arguments_to_json(m.arguments)}});
  }
  json bundles = json::array();
  for (const auto& b : bundle.bundles) bundles.push_back(bundle_to_json(b));

  return {{"timetag", format_timetag(bundle.timetag)},
          {"messages", std::move(messages)},
          {"bundles", std::move(bundles)}};
}

// Missing and null lists are both empty.
static const json* list_member(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_array()) throw CodecError(std::string("bundle '") + key + "' must be an array");
  return &*it;
}

ControlBundle bundle_from_json(const json& j) {
  if (!j.is_object()) {
    throw CodecError(std::string("expected a JSON bundle object, got ") + j.type_name());
  }

  ControlBundle out;
  auto tt = j.find("timetag");
  if (tt != j.end() && !tt->is_null()) {
    if (!tt->is_string()) throw CodecError("bundle 'timetag' must be a string");
    out.timetag = parse_timetag(tt->get<std::string>());
  }

  if (const json* messages = list_member(j, "messages")) {
    for (const auto& m : *messages) {
      if (!m.is_object()) throw CodecError("bundle message must be an object");
      auto addr = m.find("address");
      if (addr == m.end() || !addr->is_string()) {
        throw CodecError("bundle message has no 'address' string");
      }
      ControlMessage msg;
      msg.address = addr->get<std::string>();
      auto args = m.find("arguments");
      if (args != m.end()) msg.arguments = arguments_from_json(*args);
      out.messages.push_back(std::move(msg));
    }
  }

  if (const json* bundles = list_member(j, "bundles")) {
    for (const auto& b : *bundles) out.bundles.push_back(bundle_from_json(b));
  }
  return out;
}

// ── Payloads ─────────────────────────────────────────────────────────────────

std::string to_payload(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static json parse_payload(const std::string& payload) {
  try {
    return json::parse(payload);
  } catch (const json::exception& e) {
    throw CodecError(std::string("JSON: ") + e.what());
  }
}

ArgumentList parse_arguments(const std::string& payload) {
  return arguments_from_json(parse_payload(payload));
}

ControlBundle parse_bundle(const std::string& payload) {
  return bundle_from_json(parse_payload(payload));
}

}  // namespace oscbridge
