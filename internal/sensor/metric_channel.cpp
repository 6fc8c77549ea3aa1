#include "metric_channel.hpp"

#include "internal/util/errors.hpp"

namespace jobprobe::sensor {

using jobprobe::util::InputValidationError;

MetricChannel::MetricChannel(std::string name) : name_(std::move(name)) {
  if (name_.empty()) {
    throw InputValidationError("channel name is empty");
  }
}

void MetricChannel::SetValue(std::string value) {
  if (value.empty()) {
    throw InputValidationError("channel '" + name_ + "': value is empty");
  }
  value_ = std::move(value);
}

void MetricChannel::SetLookup(std::string lookup_id) {
  if (lookup_id.empty()) {
    throw InputValidationError("channel '" + name_ + "': value lookup id is empty");
  }
  Slot(ChannelAttribute::kValueLookup) = std::move(lookup_id);
  Slot(ChannelAttribute::kUnit)        = std::string(kCustomUnit);
}

void MetricChannel::SetAttribute(ChannelAttribute attribute, std::string value) {
  if (value.empty()) {
    throw InputValidationError("channel '" + name_ + "': attribute " + std::string(ToString(attribute)) + " is empty");
  }

  switch (attribute) {
    case ChannelAttribute::kValueLookup:
      SetLookup(std::move(value));
      return;
    case ChannelAttribute::kUnit:
      if (GetAttribute(ChannelAttribute::kValueLookup) && value != kCustomUnit) {
        throw InputValidationError("channel '" + name_ + "': Unit must stay Custom while a value lookup is assigned");
      }
      break;
    default:
      break;
  }
  Slot(attribute) = std::move(value);
}

void MetricChannel::SetAttribute(std::string_view name, std::string value) {
  SetAttribute(ResolveAttribute(name), std::move(value));
}

void MetricChannel::SetAttributes(const std::map<std::string, std::string>& attributes) {
  // Names and values are checked up front so a typo does not leave a half-applied set.
  for (const auto& [name, value] : attributes) {
    ResolveAttribute(name);
    if (value.empty()) {
      throw InputValidationError("channel '" + name_ + "': attribute " + name + " is empty");
    }
  }
  for (const auto& [name, value] : attributes) {
    SetAttribute(name, value);
  }
}

const std::optional<std::string>& MetricChannel::GetAttribute(ChannelAttribute attribute) const {
  return attributes_[static_cast<std::size_t>(attribute)];
}

const std::optional<std::string>& MetricChannel::GetAttribute(std::string_view name) const {
  return GetAttribute(ResolveAttribute(name));
}

ChannelAttribute MetricChannel::ResolveAttribute(std::string_view name) {
  if (name == "Name" || name == "Value") {
    throw InputValidationError(std::string(name) + " is not a channel attribute");
  }
  const auto attribute = ParseChannelAttribute(name);
  if (!attribute) {
    throw InputValidationError("unknown channel attribute '" + std::string(name) + "'");
  }
  return *attribute;
}

} // namespace jobprobe::sensor
