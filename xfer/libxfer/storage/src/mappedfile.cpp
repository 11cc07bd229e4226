#include "mappedfile.hpp"

#include <algorithm>
#include <filesystem>

#include <glog/logging.h>

namespace xfer::storage
{
MappedFile::MappedFile(const std::string &path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        LOG(ERROR) << path << " is not a regular file";
        return;
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot stat " << path << ": " << ec.message();
        return;
    }

    if (size != 0)
    {
        try
        {
            boost::interprocess::file_mapping  mapping {path.c_str(), boost::interprocess::read_only};
            boost::interprocess::mapped_region region {mapping, boost::interprocess::read_only};
            mapping_.swap(mapping);
            region_.swap(region);
        }
        catch (const boost::interprocess::interprocess_exception &e)
        {
            LOG(ERROR) << "Cannot map " << path << ": " << e.what();
            return;
        }
    }

    size_    = region_.get_size();
    is_open_ = true;
}

bool MappedFile::is_open() const
{
    return is_open_;
}

const uint8_t *MappedFile::data() const
{
    return static_cast<const uint8_t *>(region_.get_address());
}

uint64_t MappedFile::size() const
{
    return size_;
}

uint64_t MappedFile::available(uint64_t offset, uint64_t count) const
{
    if (offset >= size_)
    {
        return 0;
    }
    return std::min(count, size_ - offset);
}
}  // namespace xfer::storage
