#include "formupload/client/chunk_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

#include "formupload/crypto.hpp"

namespace formupload::client
{

    namespace
    {
        constexpr auto kSessionsDir = "sessions";
        constexpr auto kFilesDir = "files";
        constexpr auto kChunksDir = "chunks";

        std::string hex_encode(const std::string &value)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.reserve(value.size() * 2);
            for (const unsigned char ch : value)
            {
                result.push_back(kHexDigits[(ch >> 4) & 0x0F]);
                result.push_back(kHexDigits[ch & 0x0F]);
            }
            return result;
        }

        std::string file_stem(const std::string &input_name, std::uint32_t file_index)
        {
            return hex_encode(input_name) + '-' + std::to_string(file_index);
        }

        void validate_session_id(const std::string &session_id)
        {
            const bool safe = !session_id.empty() &&
                              session_id.find_first_not_of("0123456789abcdefABCDEF-_") == std::string::npos;
            if (!safe)
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable, "Invalid session id: " + session_id);
            }
        }

        void create_directories_or_throw(const std::filesystem::path &dir)
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable,
                                 "Failed to create " + dir.string() + ": " + ec.message());
            }
        }

        void write_atomically(const std::filesystem::path &target, const char *data, std::size_t size)
        {
            create_directories_or_throw(target.parent_path());
            auto temp = target;
            temp += ".tmp";
            {
                std::ofstream out(temp, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to open " + temp.string());
                }
                out.write(data, static_cast<std::streamsize>(size));
                out.flush();
                if (!out)
                {
                    throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to write " + temp.string());
                }
            }
            std::error_code ec;
            std::filesystem::rename(temp, target, ec);
            if (ec)
            {
                std::filesystem::remove(temp, ec);
                throw StoreError(formupload::ErrorCode::StoreUnavailable,
                                 "Failed to commit " + target.string() + ": " + ec.message());
            }
        }

        std::string read_all(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to open " + path.string());
            }
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        void remove_or_throw(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable,
                                 "Failed to remove " + path.string() + ": " + ec.message());
            }
        }

        std::filesystem::path hash_path_for(const std::filesystem::path &chunk)
        {
            auto path = chunk;
            path.replace_extension(".hash");
            return path;
        }

    } // namespace

    StoreError::StoreError(formupload::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    DiskChunkStore::DiskChunkStore(std::filesystem::path root)
        : root_(std::move(root))
    {
        std::error_code ec;
        std::filesystem::create_directories(root_ / kSessionsDir, ec);
    }

    void DiskChunkStore::put_file_record(const FileRecord &record)
    {
        validate_session_id(record.session_id);
        const auto text = protocol::dump_json(nlohmann::json(record), 2);
        write_atomically(record_path(record.session_id, record.input_name, record.file_index), text.data(),
                         text.size());
    }

    std::vector<FileRecord> DiskChunkStore::list_file_records(const std::string &session_id)
    {
        validate_session_id(session_id);
        std::vector<FileRecord> records;
        const auto dir = session_dir(session_id) / kFilesDir;
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec))
        {
            return records;
        }
        for (const auto &entry : std::filesystem::directory_iterator(dir, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                auto record = nlohmann::json::parse(read_all(entry.path())).get<FileRecord>();
                if (record.session_id == session_id)
                {
                    records.push_back(std::move(record));
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw StoreError(formupload::ErrorCode::StoreCorrupted,
                                 "Corrupted file record " + entry.path().string() + ": " + ex.what());
            }
        }
        if (ec)
        {
            throw StoreError(formupload::ErrorCode::StoreUnavailable,
                             "Failed to list " + dir.string() + ": " + ec.message());
        }
        return records;
    }

    void DiskChunkStore::put_chunk(const ChunkKey &key, std::span<const std::byte> data)
    {
        validate_session_id(key.session_id);
        const auto path = chunk_path(key);
        write_atomically(path, reinterpret_cast<const char *>(data.data()), data.size());
        const auto digest = crypto::hash_bytes(data);
        write_atomically(hash_path_for(path), digest.data(), digest.size());
    }

    std::optional<std::vector<std::byte>> DiskChunkStore::get_chunk(const ChunkKey &key)
    {
        validate_session_id(key.session_id);
        const auto path = chunk_path(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return std::nullopt;
        }
        const auto raw = read_all(path);
        std::vector<std::byte> data(raw.size());
        std::transform(raw.begin(), raw.end(), data.begin(), [](char ch)
                       { return static_cast<std::byte>(ch); });

        const auto hash_path = hash_path_for(path);
        if (!std::filesystem::exists(hash_path, ec) || read_all(hash_path) != crypto::hash_bytes(data))
        {
            throw StoreError(formupload::ErrorCode::StoreCorrupted, "Chunk integrity check failed: " + path.string());
        }
        return data;
    }

    void DiskChunkStore::delete_chunk(const ChunkKey &key)
    {
        validate_session_id(key.session_id);
        const auto path = chunk_path(key);
        remove_or_throw(path);
        remove_or_throw(hash_path_for(path));
    }

    void DiskChunkStore::delete_file(const std::string &session_id, const std::string &input_name,
                                     std::uint32_t file_index)
    {
        validate_session_id(session_id);
        std::error_code ec;
        std::filesystem::remove_all(chunk_dir(session_id, input_name, file_index), ec);
        if (ec)
        {
            throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to remove chunks: " + ec.message());
        }
        remove_or_throw(record_path(session_id, input_name, file_index));
    }

    std::filesystem::path DiskChunkStore::session_dir(const std::string &session_id) const
    {
        return root_ / kSessionsDir / session_id;
    }

    std::filesystem::path DiskChunkStore::record_path(const std::string &session_id, const std::string &input_name,
                                                      std::uint32_t file_index) const
    {
        return session_dir(session_id) / kFilesDir / (file_stem(input_name, file_index) + ".json");
    }

    std::filesystem::path DiskChunkStore::chunk_dir(const std::string &session_id, const std::string &input_name,
                                                    std::uint32_t file_index) const
    {
        return session_dir(session_id) / kChunksDir / file_stem(input_name, file_index);
    }

    std::filesystem::path DiskChunkStore::chunk_path(const ChunkKey &key) const
    {
        return chunk_dir(key.session_id, key.input_name, key.file_index) / (std::to_string(key.chunk_index) + ".bin");
    }

} // namespace formupload::client
