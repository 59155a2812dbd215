// bundle_codec.cpp

#include "bundle_codec.h"

#include <string>
#include <type_traits>

namespace oscbridge {

// ── Wire -> portable ─────────────────────────────────────────────────────────

static Argument argument_to_portable(const osc::ReceivedMessageArgument& arg) {
  switch (arg.TypeTag()) {
    case osc::TRUE_TYPE_TAG:
    case osc::FALSE_TYPE_TAG:
      return arg.AsBool();
    case osc::NIL_TYPE_TAG:
      return Nil{};
    case osc::INT32_TYPE_TAG:
      return static_cast<int32_t>(arg.AsInt32());
    case osc::INT64_TYPE_TAG:
      return static_cast<int64_t>(arg.AsInt64());
    case osc::FLOAT_TYPE_TAG:
      return arg.AsFloat();
    case osc::DOUBLE_TYPE_TAG:
      return arg.AsDouble();
    case osc::STRING_TYPE_TAG:
      return std::string(arg.AsString());
    case osc::SYMBOL_TYPE_TAG:
      return std::string(arg.AsSymbol());
    case osc::CHAR_TYPE_TAG:
      return std::string(1, arg.AsChar());
    case osc::TIME_TAG_TYPE_TAG:
      return TimeTag{static_cast<uint64_t>(arg.AsTimeTag())};
    case osc::BLOB_TYPE_TAG: {
      const void* data = nullptr;
      osc::osc_bundle_element_size_t size = 0;
      arg.AsBlob(data, size);
      const auto* bytes = static_cast<const uint8_t*>(data);
      return Blob(bytes, bytes + size);
    }
    default:
      break;
  }
  throw CodecError(std::string("unsupported OSC argument type '") + arg.TypeTag() + "'");
}

ControlMessage to_portable(const osc::ReceivedMessage& message) {
  ControlMessage out;
  out.address = message.AddressPattern();
  out.arguments.reserve(message.ArgumentCount());
  for (auto it = message.ArgumentsBegin(); it != message.ArgumentsEnd(); ++it) {
    out.arguments.push_back(argument_to_portable(*it));
  }
  return out;
}

ControlBundle to_portable(const osc::ReceivedBundle& bundle) {
  ControlBundle out;
  out.timetag = TimeTag{static_cast<uint64_t>(bundle.TimeTag())};
  for (auto it = bundle.ElementsBegin(); it != bundle.ElementsEnd(); ++it) {
    if (it->IsBundle()) {
      out.bundles.push_back(to_portable(osc::ReceivedBundle(*it)));
    } else {
      out.messages.push_back(to_portable(osc::ReceivedMessage(*it)));
    }
  }
  return out;
}

// ── Portable -> wire ─────────────────────────────────────────────────────────

static void argument_to_wire(const Argument& arg, osc::OutboundPacketStream& out) {
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Nil>) {
          out << osc::OscNil;
        } else if constexpr (std::is_same_v<T, bool>) {
          out << v;
        } else if constexpr (std::is_same_v<T, int32_t>) {
          out << static_cast<osc::int32>(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          out << static_cast<osc::int64>(v);
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
          out << v;
        } else if constexpr (std::is_same_v<T, std::string>) {
          out << v.c_str();
        } else if constexpr (std::is_same_v<T, TimeTag>) {
          out << osc::TimeTag(v.ntp);
        } else if constexpr (std::is_same_v<T, Blob>) {
          out << osc::Blob(v.data(), static_cast<osc::osc_bundle_element_size_t>(v.size()));
        } else {
          static_assert(sizeof(T) == 0, "unhandled Argument alternative");
        }
      },
      arg);
}

void to_wire(const ControlMessage& message, osc::OutboundPacketStream& out) {
  out << osc::BeginMessage(message.address.c_str());
  for (const auto& arg : message.arguments) argument_to_wire(arg, out);
  out << osc::EndMessage;
}

void to_wire(const ControlBundle& bundle, osc::OutboundPacketStream& out) {
  out << osc::BeginBundle(bundle.timetag.ntp);
  for (const auto& message : bundle.messages) to_wire(message, out);
  for (const auto& child : bundle.bundles) to_wire(child, out);
  out << osc::EndBundle;
}

// ── Whole packets ────────────────────────────────────────────────────────────

std::vector<char> encode_packet(const Packet& packet) {
  if (std::holds_alternative<std::monostate>(packet)) return {};

  std::vector<char> buf(kMaxPacketSize);
  osc::OutboundPacketStream out(buf.data(), buf.size());
  try {
    if (const auto* message = std::get_if<ControlMessage>(&packet)) {
      to_wire(*message, out);
    } else {
      to_wire(std::get<ControlBundle>(packet), out);
    }
  } catch (const osc::Exception& e) {
    throw CodecError(std::string("OSC encode: ") + e.what());
  }
  buf.resize(out.Size());
  return buf;
}

Packet decode_packet(const char* data, size_t size) {
  if (size == 0) return std::monostate{};
  try {
    if (data[0] == '#') {
      osc::ReceivedPacket packet(data, size);
      return to_portable(osc::ReceivedBundle(packet));
    }
    if (data[0] == '/') {
      osc::ReceivedPacket packet(data, size);
      return to_portable(osc::ReceivedMessage(packet));
    }
  } catch (const osc::Exception& e) {
    throw CodecError(std::string("OSC decode: ") + e.what());
  }
  return std::monostate{};
}

}  // namespace oscbridge
