#include "relay/relay.hpp"

#include "core/version.hpp"

namespace relay {

std::string version() {
  return RELAY_VERSION_STRING;
}

}  // namespace relay
