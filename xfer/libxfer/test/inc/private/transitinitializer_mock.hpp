#ifndef XFER_TEST_TRANSITINITIALIZER_MOCK_HPP_
#define XFER_TEST_TRANSITINITIALIZER_MOCK_HPP_

#include <gmock/gmock.h>

#include "transitinitializer.hpp"

using namespace ::xfer::transit;

class TransitInitializerMock : public TransitInitializer
{
public:
    MOCK_METHOD(std::future<std::unique_ptr<TransitConnector>>, init,
        (Abilities, std::vector<RelayHint>), (override));
};

#endif  // XFER_TEST_TRANSITINITIALIZER_MOCK_HPP_
