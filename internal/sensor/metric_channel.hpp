#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/sensor/channel_attribute.hpp"

namespace jobprobe::sensor {

/*
  One named result channel: a value plus the optional attributes PRTG reads
  for units, limits and lookups.

  Setters reject empty values with InputValidationError. Assigning a value
  lookup pins Unit to "Custom".
*/
class MetricChannel {
 public:
  explicit MetricChannel(std::string name);

  const std::string& Name() const {
    return name_;
  }

  void SetValue(std::string value);

  const std::optional<std::string>& GetValue() const {
    return value_;
  }

  void SetLookup(std::string lookup_id);

  void SetAttribute(ChannelAttribute attribute, std::string value);
  void SetAttribute(std::string_view name, std::string value);
  void SetAttributes(const std::map<std::string, std::string>& attributes);

  const std::optional<std::string>& GetAttribute(ChannelAttribute attribute) const;
  const std::optional<std::string>& GetAttribute(std::string_view name) const;

  const std::array<std::optional<std::string>, kChannelAttributeCount>& Attributes() const {
    return attributes_;
  }

 private:
  static ChannelAttribute ResolveAttribute(std::string_view name);

  std::optional<std::string>& Slot(ChannelAttribute attribute) {
    return attributes_[static_cast<std::size_t>(attribute)];
  }

  std::string                                                  name_;
  std::optional<std::string>                                   value_;
  std::array<std::optional<std::string>, kChannelAttributeCount> attributes_{};
};

} // namespace jobprobe::sensor
