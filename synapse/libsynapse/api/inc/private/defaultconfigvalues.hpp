#ifndef SYNAPSE_API_DEFAULTCONFIGVALUES_HPP_
#define SYNAPSE_API_DEFAULTCONFIGVALUES_HPP_

#include <string>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace synapse
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    explicit DefaultConfigValues(const std::string &data_dir = "./synapse_data");
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace synapse

#endif  // SYNAPSE_API_DEFAULTCONFIGVALUES_HPP_
