#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace formupload::client
{

    // A form submission captured by the gate while files were still uploading.
    struct PendingSubmission
    {
        std::string session_id;
        std::optional<std::string> form_id;
        // Element id of the submit target, used to pick the target again on replay.
        std::optional<std::string> target_id;
        std::string method{"POST"};
        std::string action_url;
        nlohmann::json payload = nlohmann::json::object();
    };

    void to_json(nlohmann::json &json, const PendingSubmission &pending);
    void from_json(const nlohmann::json &json, PendingSubmission &pending);

    struct FormSubmission
    {
        std::string session_id;
        std::string method{"POST"};
        std::string action_url;
        std::optional<std::string> target_id;
        nlohmann::json payload = nlohmann::json::object();
    };

    struct GateResult
    {
        bool blocked{};
        bool deferred{};
        // Payload with file-input fields replaced by uploaded file identifiers.
        std::optional<nlohmann::json> rewritten_payload;
    };

    // Host-side delivery of form submissions.
    class SubmissionPipeline
    {
    public:
        virtual ~SubmissionPipeline() = default;

        // Confirms that a remembered submit target is still present; nothing falls back to the default.
        virtual std::optional<std::string> resolve_submit_target(const std::optional<std::string> &form_id,
                                                                 const std::optional<std::string> &target_hint) = 0;

        // skip_gate is set for replays so the submission is not intercepted again.
        virtual void submit(const FormSubmission &submission, bool skip_gate) = 0;
    };

} // namespace formupload::client
