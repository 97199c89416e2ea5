#ifndef SYNAPSE_CONFIG_CONFIGLOADER_HPP_
#define SYNAPSE_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace synapse::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace synapse::config

#endif  // SYNAPSE_CONFIG_CONFIGLOADER_HPP_
