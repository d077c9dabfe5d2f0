#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "formupload/client/file_state.hpp"
#include "formupload/error_codes.hpp"

namespace formupload::client
{

    class StoreError : public std::runtime_error
    {
    public:
        StoreError(formupload::ErrorCode code, std::string message);

        formupload::ErrorCode code() const noexcept { return code_; }

    private:
        formupload::ErrorCode code_;
    };

    struct ChunkKey
    {
        std::string session_id;
        std::string input_name;
        std::uint32_t file_index{};
        std::uint32_t chunk_index{};
    };

    // Local persistence for file records and not-yet-confirmed chunk bytes.
    // Every operation may throw StoreError; callers treat failures as advisory.
    class ChunkStore
    {
    public:
        virtual ~ChunkStore() = default;

        // Upsert keyed by (session_id, input_name, file_index).
        virtual void put_file_record(const FileRecord &record) = 0;

        virtual std::vector<FileRecord> list_file_records(const std::string &session_id) = 0;

        virtual void put_chunk(const ChunkKey &key, std::span<const std::byte> data) = 0;

        // Nothing if the chunk was never stored or already pruned.
        virtual std::optional<std::vector<std::byte>> get_chunk(const ChunkKey &key) = 0;

        virtual void delete_chunk(const ChunkKey &key) = 0;

        // Removes the file record together with all of its chunks.
        virtual void delete_file(const std::string &session_id, const std::string &input_name,
                                 std::uint32_t file_index) = 0;
    };

    // One directory per session: files/<input>-<index>.json, chunks/<input>-<index>/<chunk>.bin (+ .hash).
    // Writes go to a temporary file first and are renamed into place.
    class DiskChunkStore : public ChunkStore
    {
    public:
        explicit DiskChunkStore(std::filesystem::path root);

        void put_file_record(const FileRecord &record) override;
        std::vector<FileRecord> list_file_records(const std::string &session_id) override;
        void put_chunk(const ChunkKey &key, std::span<const std::byte> data) override;
        std::optional<std::vector<std::byte>> get_chunk(const ChunkKey &key) override;
        void delete_chunk(const ChunkKey &key) override;
        void delete_file(const std::string &session_id, const std::string &input_name,
                         std::uint32_t file_index) override;

        const std::filesystem::path &root() const noexcept { return root_; }

    private:
        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path record_path(const std::string &session_id, const std::string &input_name,
                                          std::uint32_t file_index) const;
        std::filesystem::path chunk_dir(const std::string &session_id, const std::string &input_name,
                                        std::uint32_t file_index) const;
        std::filesystem::path chunk_path(const ChunkKey &key) const;

        std::filesystem::path root_;
    };

} // namespace formupload::client
