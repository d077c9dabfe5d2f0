#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace formupload::client
{

    // Random-access view over the bytes of one selected file.
    class ByteRangeSource
    {
    public:
        virtual ~ByteRangeSource() = default;

        virtual std::uint64_t size() const = 0;

        // Returns at most length bytes starting at offset. Throws std::runtime_error on I/O failure.
        virtual std::vector<std::byte> read(std::uint64_t offset, std::size_t length) = 0;

        // Location the bytes can be re-opened from after a restart, if any.
        virtual std::optional<std::filesystem::path> origin() const { return std::nullopt; }
    };

    class FileByteSource : public ByteRangeSource
    {
    public:
        explicit FileByteSource(std::filesystem::path path);

        std::uint64_t size() const override;
        std::vector<std::byte> read(std::uint64_t offset, std::size_t length) override;
        std::optional<std::filesystem::path> origin() const override;

    private:
        std::filesystem::path path_;
        std::uint64_t size_{};
        std::ifstream in_;
    };

    class MemoryByteSource : public ByteRangeSource
    {
    public:
        explicit MemoryByteSource(std::vector<std::byte> data);

        std::uint64_t size() const override;
        std::vector<std::byte> read(std::uint64_t offset, std::size_t length) override;

    private:
        std::vector<std::byte> data_;
    };

} // namespace formupload::client
