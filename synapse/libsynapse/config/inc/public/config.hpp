#ifndef SYNAPSE_CONFIG_CONFIG_HPP_
#define SYNAPSE_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

#include <glog/logging.h>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace synapse::config
{
class ConfigLoader;

class Config
{
public:
    using StringList = std::vector<std::string>;

    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const
    {
        return get<std::string>(key);
    }

    [[nodiscard]] long long get_integer(ConfigKey key) const
    {
        return get<long long>(key);
    }

    [[nodiscard]] double get_float(ConfigKey key) const;

    [[nodiscard]] bool get_bool(ConfigKey key) const
    {
        return get<bool>(key);
    }

    [[nodiscard]] StringList get_string_list(ConfigKey key) const
    {
        return get<StringList>(key);
    }

private:
    template<typename T>
    [[nodiscard]] T get(ConfigKey key) const
    {
        const auto &val = value(key);
        if (!val.has_value())
        {
            LOG(WARNING) << "No config value with key " << key.to_string() << ", using default";
            return get_fallback_value<T>(key);
        }

        try
        {
            return std::any_cast<T>(val);
        }
        catch (const std::bad_any_cast &)
        {
            LOG(ERROR) << "Config value " << key.to_string() << " has type "
                       << val.type().name() << ", expected " << typeid(T).name();
            return get_fallback_value<T>(key);
        }
    }

    template<typename T>
    [[nodiscard]] T get_fallback_value(ConfigKey key) const
    {
        if (!fallback_value_provider_)
        {
            LOG(FATAL) << "Fallback config value provider is missing, cannot continue execution";
        }

        std::any val = fallback_value_provider_->get(key);
        if (!val.has_value())
        {
            LOG(FATAL) << "No fallback config value with key " << key.to_string();
        }

        try
        {
            return std::any_cast<T>(val);
        }
        catch (const std::bad_any_cast &)
        {
            LOG(FATAL) << "Fallback value of " << key.to_string() << " has type "
                       << val.type().name() << ", expected " << typeid(T).name();
        }

        return T {};
    }

    [[nodiscard]] const std::any &value(ConfigKey key) const;

    std::array<std::any, ConfigKey::KEY_COUNT>         values_;
    const std::shared_ptr<FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace synapse::config

#endif  // SYNAPSE_CONFIG_CONFIG_HPP_
