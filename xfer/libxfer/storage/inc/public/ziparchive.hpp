#ifndef XFER_STORAGE_ZIPARCHIVE_HPP_
#define XFER_STORAGE_ZIPARCHIVE_HPP_

#include <cstdint>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>

#include <boost/crc.hpp>

namespace xfer::storage
{
class MappedFile;

/**
 * Uncompressed (stored) zip archive of a folder, produced on the fly.
 *
 * scan() walks the folder once, recording every entry together with its size and CRC-32, so
 * that the exact archive size is known before a single byte is sent. Reader then streams the
 * archive without staging it on disk. If a file changes between the scan and the streaming,
 * the reader stops early and reports skew.
 *
 * No zip64 support: files of 4 GiB or more, archives of 4 GiB or more and more than 65535
 * entries are rejected by scan().
 */
class ZipArchive
{
public:
    struct Entry
    {
        std::string archive_name;
        std::string source_path;
        uint64_t    size;
        uint32_t    crc32;
        uint32_t    external_attributes;
        uint64_t    local_header_offset;
        bool        is_directory;
    };

    class Reader : public std::streambuf
    {
    public:
        explicit Reader(const ZipArchive &archive);
        ~Reader() override;

        [[nodiscard]] bool     skewed() const;
        [[nodiscard]] uint64_t bytes_produced() const;

    protected:
        int_type underflow() override;

    private:
        enum class Phase
        {
            LOCAL_HEADER,
            FILE_DATA,
            CENTRAL_DIRECTORY,
            END_RECORD,
            DONE
        };

        bool fill_buffer();
        bool fill_file_data();
        void next_entry();

        const ZipArchive         &archive_;
        std::vector<char>         buffer_;
        Phase                     phase_;
        size_t                    entry_index_;
        std::unique_ptr<MappedFile> open_file_;
        size_t                    file_offset_;
        boost::crc_32_type        crc_;
        uint64_t                  bytes_produced_;
        bool                      skewed_;
    };

    explicit ZipArchive(std::string folder_path, size_t read_chunk_size = 65536);

    bool scan(std::string &error_message);

    [[nodiscard]] const std::string        &folder_path() const;
    [[nodiscard]] const std::vector<Entry> &entries() const;
    [[nodiscard]] uint64_t                  archive_size() const;
    [[nodiscard]] uint64_t                  central_directory_offset() const;
    [[nodiscard]] uint64_t                  central_directory_size() const;
    [[nodiscard]] uint64_t                  total_file_bytes() const;
    [[nodiscard]] uint64_t                  file_count() const;

private:
    std::string        folder_path_;
    size_t             read_chunk_size_;
    std::vector<Entry> entries_;
    uint64_t           central_directory_offset_;
    uint64_t           central_directory_size_;
    uint64_t           total_file_bytes_;
    uint64_t           file_count_;
};

// Name under which a folder travels as an archive: "photos/" and "photos" both become
// "photos.zip". Applying it to an archive name again changes nothing.
std::string archive_file_name(const std::string &folder_name);
}  // namespace xfer::storage

#endif  // XFER_STORAGE_ZIPARCHIVE_HPP_
