#include "config.hpp"

#include "configloader.hpp"

namespace synapse::config
{
ConfigKey::ConfigKey(const std::string &str_key)
    : key_ {KEY_COUNT}
{
    for (int k = FIRST_KEY; k != KEY_COUNT; ++k)
    {
        if (str_key == string_vals[k])
        {
            key_ = EnumType(k);
            break;
        }
    }
}

Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    auto loaded_configuration = config_loader.load();
    for (auto &[str_key, val] : loaded_configuration)
    {
        ConfigKey k {str_key};
        if (k == ConfigKey::KEY_COUNT)
        {
            LOG(WARNING) << "Unknown config key " << str_key;
            continue;
        }
        values_[k] = std::move(val);
    }
}

double Config::get_float(ConfigKey key) const
{
    // JSON does not distinguish 1 from 1.0
    const auto &val = value(key);
    if (const auto *integer = std::any_cast<long long>(&val))
    {
        return double(*integer);
    }
    return get<double>(key);
}

const std::any &Config::value(ConfigKey key) const
{
    if (key < 0 || key >= ConfigKey::KEY_COUNT)
    {
        LOG(FATAL) << "Invalid key " << int(key);
    }
    return values_[key];
}
}  // namespace synapse::config
