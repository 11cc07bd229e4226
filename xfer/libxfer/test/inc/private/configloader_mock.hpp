#ifndef XFER_TEST_CONFIGLOADER_MOCK_HPP_
#define XFER_TEST_CONFIGLOADER_MOCK_HPP_

#include <gmock/gmock.h>

#include "configloader.hpp"

using namespace ::xfer::config;

class ConfigLoaderMock : public ConfigLoader
{
public:
    MOCK_METHOD((std::map<std::string, std::any>), load, (), (const, override));
};

#endif  // XFER_TEST_CONFIGLOADER_MOCK_HPP_
