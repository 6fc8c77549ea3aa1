#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace jobprobe::sensor {

/*
  Optional descriptive attributes of a PRTG result channel. Name and Value are
  not attributes; they are always present on a channel.
*/
enum class ChannelAttribute : std::uint8_t {
  kUnit,
  kCustomUnit,
  kSpeedSize,
  kVolumeSize,
  kSpeedTime,
  kMode,
  kFloat,
  kDecimalMode,
  kWarning,
  kShowChart,
  kShowTable,
  kLimitMaxError,
  kLimitMaxWarning,
  kLimitMinWarning,
  kLimitMinError,
  kLimitErrorMsg,
  kLimitWarningMsg,
  kLimitMode,
  kValueLookup,
  kNotifyChanged,
};

inline constexpr std::size_t kChannelAttributeCount = static_cast<std::size_t>(ChannelAttribute::kNotifyChanged) + 1;

// Element names as written in the document, indexed by ChannelAttribute.
inline constexpr std::array<std::string_view, kChannelAttributeCount> kChannelAttributeNames = {
    "Unit",          "CustomUnit",    "SpeedSize",       "VolumeSize",      "SpeedTime",
    "Mode",          "Float",         "DecimalMode",     "Warning",         "ShowChart",
    "ShowTable",     "LimitMaxError", "LimitMaxWarning", "LimitMinWarning", "LimitMinError",
    "LimitErrorMsg", "LimitWarningMsg", "LimitMode",     "ValueLookup",     "NotifyChanged",
};

static_assert(kChannelAttributeNames.back() == "NotifyChanged", "attribute name table out of sync with ChannelAttribute");

inline constexpr std::string_view kCustomUnit = "Custom";

constexpr std::string_view ToString(ChannelAttribute attribute) {
  return kChannelAttributeNames[static_cast<std::size_t>(attribute)];
}

// nullopt for unknown names and for Name/Value.
constexpr std::optional<ChannelAttribute> ParseChannelAttribute(std::string_view name) {
  for (std::size_t i = 0; i < kChannelAttributeCount; ++i) {
    if (kChannelAttributeNames[i] == name) {
      return static_cast<ChannelAttribute>(i);
    }
  }
  return std::nullopt;
}

static_assert(ParseChannelAttribute("ValueLookup") == ChannelAttribute::kValueLookup);
static_assert(!ParseChannelAttribute("Name").has_value() && !ParseChannelAttribute("Value").has_value());

} // namespace jobprobe::sensor
