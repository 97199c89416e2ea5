#ifndef SYNAPSE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define SYNAPSE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace synapse::config
{
// Forward declarations
class ConfigKey;

class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace synapse::config

#endif  // SYNAPSE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
