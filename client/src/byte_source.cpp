#include "formupload/client/byte_source.hpp"

#include <algorithm>
#include <stdexcept>

namespace formupload::client
{

    FileByteSource::FileByteSource(std::filesystem::path path)
        : path_(std::filesystem::absolute(path)),
          size_(std::filesystem::file_size(path_)),
          in_(path_, std::ios::binary)
    {
        if (!in_.is_open())
        {
            throw std::runtime_error("Could not open " + path_.string() + " for reading");
        }
    }

    std::uint64_t FileByteSource::size() const
    {
        return size_;
    }

    std::vector<std::byte> FileByteSource::read(std::uint64_t offset, std::size_t length)
    {
        if (offset >= size_)
        {
            return {};
        }
        const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
        std::vector<std::byte> buffer(count);
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset));
        in_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(count));
        if (static_cast<std::size_t>(in_.gcount()) != count)
        {
            throw std::runtime_error("Short read from " + path_.string());
        }
        return buffer;
    }

    std::optional<std::filesystem::path> FileByteSource::origin() const
    {
        return path_;
    }

    MemoryByteSource::MemoryByteSource(std::vector<std::byte> data)
        : data_(std::move(data)) {}

    std::uint64_t MemoryByteSource::size() const
    {
        return data_.size();
    }

    std::vector<std::byte> MemoryByteSource::read(std::uint64_t offset, std::size_t length)
    {
        if (offset >= data_.size())
        {
            return {};
        }
        const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
        const auto count = std::min<std::uint64_t>(length, data_.size() - offset);
        return std::vector<std::byte>(begin, begin + static_cast<std::ptrdiff_t>(count));
    }

} // namespace formupload::client
