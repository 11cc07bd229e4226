#ifndef XFER_STORAGE_MAPPEDFILE_HPP_
#define XFER_STORAGE_MAPPEDFILE_HPP_

#include <cstdint>
#include <string>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace xfer::storage
{
/**
 * Read-only view of a whole file.
 *
 * Empty files are open but have no mapping, data() is nullptr for them. The view reflects
 * later writes to the file, but its size is fixed when the file is opened.
 */
class MappedFile
{
public:
    explicit MappedFile(const std::string &path);

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    [[nodiscard]] bool           is_open() const;
    [[nodiscard]] const uint8_t *data() const;
    [[nodiscard]] uint64_t       size() const;

    // Bytes from offset up to at most count, clamped to the end of the file
    [[nodiscard]] uint64_t available(uint64_t offset, uint64_t count) const;

private:
    boost::interprocess::file_mapping  mapping_;
    boost::interprocess::mapped_region region_;
    uint64_t                           size_ {};
    bool                               is_open_ {};
};
}  // namespace xfer::storage

#endif  // XFER_STORAGE_MAPPEDFILE_HPP_
