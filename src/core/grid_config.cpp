/**
 * @file grid_config.cpp
 * @brief GridConfig JSON conversion.
 */

#include "core/grid_config.h"

#include <sstream>

namespace chordgrid {

std::string GridConfig::toJson(bool pretty) const {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject();
  writeTo(w);
  w.endObject();
  return oss.str();
}

GridConfig GridConfig::fromJson(const std::string& text) {
  GridConfig config;
  config.readFrom(json::Parser(text));
  return config;
}

}  // namespace chordgrid
