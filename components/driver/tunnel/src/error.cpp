/**
 * @file error.cpp
 * @brief Tunnel error names
 */

#include "tunnel/error.hpp"

namespace driver::tunnel {

const char *error_name(esp_err_t err) {
  switch (err) {
  case ERR_PORT:
    return "ERR_PORT";
  case ERR_ECHO_MISMATCH:
    return "ERR_ECHO_MISMATCH";
  case ERR_PARSE:
    return "ERR_PARSE";
  case ERR_OUT_OF_RANGE:
    return "ERR_OUT_OF_RANGE";
  case ERR_UNSUPPORTED_VALUE:
    return "ERR_UNSUPPORTED_VALUE";
  case ERR_BUS_BUSY:
    return "ERR_BUS_BUSY";
  case ERR_ACK_FAILURE:
    return "ERR_ACK_FAILURE";
  default:
    return esp_err_to_name(err);
  }
}

} // namespace driver::tunnel
