#pragma once
// config_validator.h: Structural and cross-relay checks on loaded relays.

#include <stdexcept>
#include <vector>

#include "oscbridge/relay_config.hpp"

namespace oscbridge {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Validate relay drafts and return the final configurations.
//
// Fills osc_bind_port from osc_port when a bind address is given without a
// port. Throws ConfigError naming the first offending relay index; no relay
// may start from a partially valid list.
std::vector<RelayConfig> validate_relays(std::vector<RelayConfig> drafts);

}  // namespace oscbridge
