#ifndef SYNAPSE_TEST_CONFIGLOADER_MOCK_HPP_
#define SYNAPSE_TEST_CONFIGLOADER_MOCK_HPP_

#include <gmock/gmock.h>

#include <any>
#include <map>
#include <string>

#include "configloader.hpp"

using namespace ::synapse::config;

class ConfigLoaderMock : public ConfigLoader
{
public:
    using ConfigMap = std::map<std::string, std::any>;

    MOCK_METHOD(ConfigMap, load, (), (const, override));
};

#endif  // SYNAPSE_TEST_CONFIGLOADER_MOCK_HPP_
