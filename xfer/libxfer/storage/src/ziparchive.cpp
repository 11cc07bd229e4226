#include "ziparchive.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>

#include <glog/logging.h>

#include "mappedfile.hpp"

namespace xfer::storage
{
namespace
{
constexpr uint32_t local_header_signature       = 0x04034b50;
constexpr uint32_t central_header_signature     = 0x02014b50;
constexpr uint32_t end_of_central_dir_signature = 0x06054b50;

constexpr size_t local_header_size       = 30;
constexpr size_t central_header_size     = 46;
constexpr size_t end_of_central_dir_size = 22;

// Version 2.0, made on Unix so that external attributes carry the file mode
constexpr uint16_t version_needed  = 20;
constexpr uint16_t version_made_by = (3 << 8) | 20;
// Entry names are UTF-8
constexpr uint16_t general_purpose_flags = 0x0800;
constexpr uint16_t method_stored         = 0;
// 1980-01-01 00:00:00
constexpr uint16_t dos_time = 0;
constexpr uint16_t dos_date = (1 << 5) | 1;

constexpr uint32_t unix_regular_file   = 0100000;
constexpr uint32_t unix_directory      = 0040000;
constexpr uint32_t dos_directory_flag  = 0x10;
constexpr uint64_t zip32_limit         = std::numeric_limits<uint32_t>::max();
constexpr size_t   max_entry_count     = std::numeric_limits<uint16_t>::max();

void put16(std::vector<char> &out, uint16_t value)
{
    out.push_back(char(value & 0xff));
    out.push_back(char((value >> 8) & 0xff));
}

void put32(std::vector<char> &out, uint32_t value)
{
    for (int i = 0; i != 4; ++i)
    {
        out.push_back(char((value >> (8 * i)) & 0xff));
    }
}

void put_local_header(std::vector<char> &out, const ZipArchive::Entry &entry)
{
    put32(out, local_header_signature);
    put16(out, version_needed);
    put16(out, general_purpose_flags);
    put16(out, method_stored);
    put16(out, dos_time);
    put16(out, dos_date);
    put32(out, entry.crc32);
    put32(out, uint32_t(entry.size));
    put32(out, uint32_t(entry.size));
    put16(out, uint16_t(entry.archive_name.size()));
    put16(out, 0);
    out.insert(out.end(), entry.archive_name.cbegin(), entry.archive_name.cend());
}

void put_central_header(std::vector<char> &out, const ZipArchive::Entry &entry)
{
    put32(out, central_header_signature);
    put16(out, version_made_by);
    put16(out, version_needed);
    put16(out, general_purpose_flags);
    put16(out, method_stored);
    put16(out, dos_time);
    put16(out, dos_date);
    put32(out, entry.crc32);
    put32(out, uint32_t(entry.size));
    put32(out, uint32_t(entry.size));
    put16(out, uint16_t(entry.archive_name.size()));
    put16(out, 0);  // extra field
    put16(out, 0);  // comment
    put16(out, 0);  // disk number
    put16(out, 0);  // internal attributes
    put32(out, entry.external_attributes);
    put32(out, uint32_t(entry.local_header_offset));
    out.insert(out.end(), entry.archive_name.cbegin(), entry.archive_name.cend());
}

void put_end_of_central_directory(std::vector<char> &out, const ZipArchive &archive)
{
    auto count = uint16_t(archive.entries().size());
    put32(out, end_of_central_dir_signature);
    put16(out, 0);
    put16(out, 0);
    put16(out, count);
    put16(out, count);
    put32(out, uint32_t(archive.central_directory_size()));
    put32(out, uint32_t(archive.central_directory_offset()));
    put16(out, 0);
}

bool compute_crc32(const std::string &path, size_t chunk_size, uint64_t &size, uint32_t &crc32)
{
    MappedFile file {path};
    if (!file.is_open())
    {
        return false;
    }

    boost::crc_32_type crc;
    for (uint64_t offset = 0; offset < file.size();)
    {
        auto count = file.available(offset, chunk_size);
        crc.process_bytes(file.data() + offset, count);
        offset += count;
    }

    size  = file.size();
    crc32 = crc.checksum();
    return true;
}
}  // namespace

ZipArchive::ZipArchive(std::string folder_path, size_t read_chunk_size)
    : folder_path_ {std::move(folder_path)}
    , read_chunk_size_ {read_chunk_size == 0 ? 1 : read_chunk_size}
    , central_directory_offset_ {0}
    , central_directory_size_ {0}
    , total_file_bytes_ {0}
    , file_count_ {0}
{
}

bool ZipArchive::scan(std::string &error_message)
{
    namespace fs = std::filesystem;

    entries_.clear();
    central_directory_offset_ = 0;
    central_directory_size_   = 0;
    total_file_bytes_         = 0;
    file_count_               = 0;

    std::error_code ec;
    if (!fs::is_directory(folder_path_, ec))
    {
        error_message = folder_path_ + " is not a directory";
        return false;
    }

    std::vector<fs::path>           paths;
    fs::recursive_directory_iterator it {folder_path_, ec};
    for (; !ec && it != fs::recursive_directory_iterator {}; it.increment(ec))
    {
        paths.push_back(it->path());
    }
    if (ec)
    {
        error_message = "cannot list " + folder_path_ + ": " + ec.message();
        return false;
    }

    const fs::path root {folder_path_};
    std::sort(paths.begin(), paths.end(), [&root](const fs::path &lhs, const fs::path &rhs) {
        return lhs.lexically_relative(root).generic_string() <
               rhs.lexically_relative(root).generic_string();
    });

    uint64_t offset = 0;
    for (const auto &path : paths)
    {
        auto status = fs::status(path, ec);
        if (ec)
        {
            error_message = "cannot stat " + path.string() + ": " + ec.message();
            return false;
        }

        auto  permissions = uint32_t(status.permissions()) & 07777;
        Entry entry {};
        entry.archive_name        = path.lexically_relative(root).generic_string();
        entry.source_path         = path.string();
        entry.local_header_offset = offset;

        if (fs::is_directory(status))
        {
            entry.archive_name += '/';
            entry.is_directory        = true;
            entry.external_attributes = ((unix_directory | permissions) << 16) | dos_directory_flag;
        }
        else if (fs::is_regular_file(status))
        {
            if (!compute_crc32(entry.source_path, read_chunk_size_, entry.size, entry.crc32))
            {
                error_message = "cannot read " + entry.source_path;
                return false;
            }
            if (entry.size >= zip32_limit)
            {
                error_message = entry.source_path + " is too large for a zip archive";
                return false;
            }
            entry.external_attributes = (unix_regular_file | permissions) << 16;
            total_file_bytes_ += entry.size;
            ++file_count_;
        }
        else
        {
            LOG(WARNING) << "Skipping " << entry.source_path << ", not a file or a directory";
            continue;
        }

        if (entry.archive_name.size() > std::numeric_limits<uint16_t>::max())
        {
            error_message = "entry name too long: " + entry.archive_name;
            return false;
        }

        offset += local_header_size + entry.archive_name.size() + entry.size;
        central_directory_size_ += central_header_size + entry.archive_name.size();
        entries_.push_back(std::move(entry));
    }

    central_directory_offset_ = offset;

    if (entries_.size() > max_entry_count)
    {
        error_message = "too many entries for a zip archive: " + std::to_string(entries_.size());
        return false;
    }
    if (central_directory_offset_ + central_directory_size_ > zip32_limit)
    {
        error_message = folder_path_ + " is too large for a zip archive";
        return false;
    }

    LOG(INFO) << "Scanned " << folder_path_ << ": " << entries_.size() << " entries, "
              << file_count_ << " files, " << total_file_bytes_ << " bytes, archive size "
              << archive_size();
    return true;
}

const std::string &ZipArchive::folder_path() const
{
    return folder_path_;
}

const std::vector<ZipArchive::Entry> &ZipArchive::entries() const
{
    return entries_;
}

uint64_t ZipArchive::archive_size() const
{
    return central_directory_offset_ + central_directory_size_ + end_of_central_dir_size;
}

uint64_t ZipArchive::central_directory_offset() const
{
    return central_directory_offset_;
}

uint64_t ZipArchive::central_directory_size() const
{
    return central_directory_size_;
}

uint64_t ZipArchive::total_file_bytes() const
{
    return total_file_bytes_;
}

uint64_t ZipArchive::file_count() const
{
    return file_count_;
}

ZipArchive::Reader::Reader(const ZipArchive &archive)
    : archive_ {archive}
    , phase_ {archive.entries().empty() ? Phase::CENTRAL_DIRECTORY : Phase::LOCAL_HEADER}
    , entry_index_ {0}
    , file_offset_ {0}
    , bytes_produced_ {0}
    , skewed_ {false}
{
}

ZipArchive::Reader::~Reader() = default;

bool ZipArchive::Reader::skewed() const
{
    return skewed_;
}

uint64_t ZipArchive::Reader::bytes_produced() const
{
    return bytes_produced_;
}

ZipArchive::Reader::int_type ZipArchive::Reader::underflow()
{
    if (gptr() < egptr())
    {
        return traits_type::to_int_type(*gptr());
    }

    while (phase_ != Phase::DONE)
    {
        buffer_.clear();
        if (!fill_buffer())
        {
            phase_ = Phase::DONE;
            break;
        }

        if (!buffer_.empty())
        {
            setg(buffer_.data(), buffer_.data(), buffer_.data() + buffer_.size());
            bytes_produced_ += buffer_.size();
            return traits_type::to_int_type(*gptr());
        }
    }

    return traits_type::eof();
}

bool ZipArchive::Reader::fill_buffer()
{
    const auto &entries = archive_.entries();

    switch (phase_)
    {
        case Phase::LOCAL_HEADER:
        {
            const auto &entry = entries[entry_index_];
            put_local_header(buffer_, entry);
            if (entry.is_directory)
            {
                next_entry();
            }
            else
            {
                phase_ = Phase::FILE_DATA;
            }
            return true;
        }
        case Phase::FILE_DATA:
            return fill_file_data();
        case Phase::CENTRAL_DIRECTORY:
            if (entry_index_ < entries.size())
            {
                put_central_header(buffer_, entries[entry_index_++]);
            }
            else
            {
                phase_ = Phase::END_RECORD;
            }
            return true;
        case Phase::END_RECORD:
            put_end_of_central_directory(buffer_, archive_);
            phase_ = Phase::DONE;
            return true;
        case Phase::DONE:
        default:
            return false;
    }
}

bool ZipArchive::Reader::fill_file_data()
{
    const auto &entry = archive_.entries()[entry_index_];

    if (!open_file_)
    {
        open_file_ = std::make_unique<MappedFile>(entry.source_path);
        if (!open_file_->is_open() || open_file_->size() != entry.size)
        {
            LOG(ERROR) << entry.source_path << " changed since the folder was scanned";
            skewed_ = true;
            return false;
        }
        file_offset_ = 0;
        crc_.reset();
    }

    if (file_offset_ < entry.size)
    {
        auto count = open_file_->available(file_offset_, archive_.read_chunk_size_);
        auto first = open_file_->data() + file_offset_;
        buffer_.assign(first, first + count);
        crc_.process_bytes(first, count);
        file_offset_ += count;
        return count != 0;
    }

    if (crc_.checksum() != entry.crc32)
    {
        LOG(ERROR) << "Contents of " << entry.source_path << " changed since the folder was scanned";
        skewed_ = true;
        return false;
    }

    open_file_.reset();
    next_entry();
    return true;
}

void ZipArchive::Reader::next_entry()
{
    if (++entry_index_ == archive_.entries().size())
    {
        phase_       = Phase::CENTRAL_DIRECTORY;
        entry_index_ = 0;
    }
    else
    {
        phase_ = Phase::LOCAL_HEADER;
    }
}

std::string archive_file_name(const std::string &folder_name)
{
    auto trimmed = folder_name;
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\'))
    {
        trimmed.pop_back();
    }
    return std::filesystem::path {trimmed}.replace_extension(".zip").string();
}
}  // namespace xfer::storage
