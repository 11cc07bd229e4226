#ifndef XFER_TEST_BULKTRANSFER_MOCK_HPP_
#define XFER_TEST_BULKTRANSFER_MOCK_HPP_

#include <gmock/gmock.h>

#include "bulktransfer.hpp"

using namespace ::xfer::bulk;

class BulkTransferMock : public BulkTransfer
{
public:
    MOCK_METHOD(bool, send,
        (::xfer::transit::TransitChannel &, std::istream &, uint64_t, const ProgressHandler &,
            ::xfer::transfer::TransferError &),
        (override));
    MOCK_METHOD(bool, receive,
        (::xfer::transit::TransitChannel &, uint64_t, const ProgressHandler &, std::ostream &,
            ::xfer::transfer::TransferError &),
        (override));
};

#endif  // XFER_TEST_BULKTRANSFER_MOCK_HPP_
