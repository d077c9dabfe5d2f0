#include "formupload/client/multipart.hpp"

#include <stdexcept>

namespace formupload::client
{

    MultipartForm::MultipartForm(std::string boundary)
        : boundary_(std::move(boundary))
    {
        if (boundary_.empty())
        {
            throw std::invalid_argument("multipart boundary must not be empty");
        }
    }

    void MultipartForm::append_field(std::string_view name, std::string_view value)
    {
        open_part(name);
        body_ += "\r\n\r\n";
        body_.append(value);
        body_ += "\r\n";
    }

    void MultipartForm::append_file(std::string_view name, std::string_view file_name, std::string_view mime,
                                    std::span<const std::byte> data)
    {
        open_part(name);
        body_ += "; filename=\"" + escape_disposition_value(file_name) + "\"\r\n";
        body_ += "Content-Type: ";
        body_.append(mime.empty() ? std::string_view("application/octet-stream") : mime);
        body_ += "\r\n\r\n";
        body_.append(reinterpret_cast<const char *>(data.data()), data.size());
        body_ += "\r\n";
    }

    std::string MultipartForm::content_type() const
    {
        return "multipart/form-data; boundary=" + boundary_;
    }

    std::string MultipartForm::body()
    {
        if (!closed_)
        {
            body_ += "--" + boundary_ + "--\r\n";
            closed_ = true;
        }
        return body_;
    }

    void MultipartForm::open_part(std::string_view name)
    {
        if (closed_)
        {
            throw std::logic_error("multipart body already closed");
        }
        body_ += "--" + boundary_ + "\r\n";
        body_ += "Content-Disposition: form-data; name=\"" + escape_disposition_value(name) + "\"";
    }

    std::string escape_disposition_value(std::string_view value)
    {
        std::string result;
        result.reserve(value.size());
        for (const char ch : value)
        {
            switch (ch)
            {
            case '"':
                result += "%22";
                break;
            case '\r':
                result += "%0D";
                break;
            case '\n':
                result += "%0A";
                break;
            default:
                result.push_back(ch);
                break;
            }
        }
        return result;
    }

} // namespace formupload::client
