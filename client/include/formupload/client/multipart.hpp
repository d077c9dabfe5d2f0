#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace formupload::client
{

    // multipart/form-data body builder.
    class MultipartForm
    {
    public:
        explicit MultipartForm(std::string boundary);

        void append_field(std::string_view name, std::string_view value);
        void append_file(std::string_view name, std::string_view file_name, std::string_view mime,
                         std::span<const std::byte> data);

        std::string content_type() const;
        // Closes the body; nothing may be appended afterwards.
        std::string body();

        const std::string &boundary() const noexcept { return boundary_; }

    private:
        void open_part(std::string_view name);

        std::string boundary_;
        std::string body_;
        bool closed_{false};
    };

    // Quotes, CR and LF are escaped in parameter values.
    std::string escape_disposition_value(std::string_view value);

} // namespace formupload::client
