#include "formupload/client/submission.hpp"

namespace formupload::client
{

    namespace
    {
        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }
    } // namespace

    void to_json(nlohmann::json &json, const PendingSubmission &pending)
    {
        json = {
            {"sessionId", pending.session_id},
            {"method", pending.method},
            {"action", pending.action_url},
            {"payload", pending.payload},
        };
        if (pending.form_id)
        {
            json["formId"] = *pending.form_id;
        }
        if (pending.target_id)
        {
            json["targetId"] = *pending.target_id;
        }
    }

    void from_json(const nlohmann::json &json, PendingSubmission &pending)
    {
        pending.session_id = json.at("sessionId").get<std::string>();
        pending.form_id = optional_string(json, "formId");
        pending.target_id = optional_string(json, "targetId");
        pending.method = json.value("method", std::string{"POST"});
        pending.action_url = json.value("action", std::string{});
        pending.payload = json.value("payload", nlohmann::json::object());
    }

} // namespace formupload::client
