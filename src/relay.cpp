// relay.cpp

#include "relay.h"

#include <utility>

#include "bundle_codec.h"
#include "config_loader.h"
#include "json_codec.h"

namespace oscbridge {

Relay::Relay(RelayConfig config, std::unique_ptr<BrokerClient> broker,
             std::unique_ptr<OscTransport> transport, Logger& logger)
    : config_(std::move(config)),
      logger_(logger, config_.mqtt_topic, config_.log_level),
      broker_(std::move(broker)),
      transport_(std::move(transport)),
      router_(config_, *transport_, [this] { send_status(); }, logger_),
      scheduler_(config_.osc_subscriptions, *transport_, logger_) {
}

Relay::~Relay() {
  stop();
}

void Relay::start() {
  broker_->set_message_handler(
      [this](const std::string& topic, const std::string& payload) {
        on_broker_message(topic, payload);
      });
  broker_->connect();
  logger_.debug("Connected to MQTT %s:%d", config_.mqtt_host.c_str(), config_.mqtt_port);

  transport_->start([this](const char* data, size_t size) { on_datagram(data, size); });
  if (config_.bidirectional()) {
    logger_.debug("OSC bidirectional on %s:%d <-> %s:%d", config_.osc_bind_addr.c_str(),
                  config_.osc_bind_port, config_.osc_host.c_str(), config_.osc_port);
  }

  for (const auto& topic : router_.subscriptions()) {
    broker_->subscribe(topic);
    logger_.debug("Subscribed to %s", topic.c_str());
  }

  scheduler_.start();

  if (!config_.mqtt_disable_config_send) send_status();
}

void Relay::stop() {
  broker_->disconnect();
  scheduler_.stop();
  transport_->stop();
}

void Relay::send_status() {
  publish(config_.mqtt_topic + "/status", to_payload(relay_to_json(config_)));
}

// ── MQTT → OSC ───────────────────────────────────────────────────────────────

void Relay::on_broker_message(const std::string& topic, const std::string& payload) {
  logger_.receive("<- [MQTT] %s: %s", topic.c_str(), payload.c_str());
  router_.route(topic, payload);
}

// ── OSC → MQTT ───────────────────────────────────────────────────────────────

void Relay::on_datagram(const char* data, size_t size) {
  Packet packet;
  try {
    packet = decode_packet(data, size);
  } catch (const CodecError& e) {
    logger_.error("OSC decode: %s", e.what());
    return;
  }

  if (const auto* message = std::get_if<ControlMessage>(&packet)) {
    const std::string args = to_payload(arguments_to_json(message->arguments));
    logger_.receive("<- [OSC] %s: %s", message->address.c_str(), args.c_str());
    publish(config_.mqtt_topic + "/cmd" + message->address, args);
  } else if (const auto* bundle = std::get_if<ControlBundle>(&packet)) {
    logger_.receive("<- [OSC] Bundle %s", format_timetag(bundle->timetag).c_str());
    publish(config_.mqtt_topic + "/bundle", to_payload(bundle_to_json(*bundle)));
  } else {
    logger_.error("Unknown OSC packet received.");
  }
}

void Relay::publish(const std::string& topic, const std::string& payload) {
  logger_.send("-> [MQTT] %s: %s", topic.c_str(), payload.c_str());
  try {
    broker_->publish(topic, payload, /*retain=*/true);
  } catch (const BrokerError& e) {
    logger_.error("Publish Error: %s", e.what());
  }
}

}  // namespace oscbridge
