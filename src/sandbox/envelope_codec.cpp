#include "sandbox/envelope_codec.hpp"

#include <cmath>

#include "nlohmann/json.hpp"

namespace evalbox::sandbox {

std::string EncodeEnvelope(const OutputEnvelope& envelope) {
    nlohmann::json json = nlohmann::json::object();
    json["text"] = envelope.text;
    json["has_image"] = envelope.has_image;
    json["has_animation"] = envelope.has_animation;
    json["duration"] = std::isfinite(envelope.duration) ? envelope.duration : -1.0;
    if (envelope.error.has_value()) {
        json["error"] = {
            {"kind", ToString(envelope.error->kind)},
            {"message", envelope.error->message}
        };
    } else {
        json["error"] = nullptr;
    }
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

OutputEnvelope DecodeEnvelope(const std::string& payload) {
    if (payload.empty()) {
        return MakeErrorEnvelope(ErrorKind::InternalError, "worker produced no result");
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        return MakeErrorEnvelope(
            ErrorKind::InternalError,
            std::string("worker result is not valid JSON: ") + ex.what());
    }
    if (!data.is_object()) {
        return MakeErrorEnvelope(ErrorKind::InternalError, "worker result is not a JSON object");
    }

    OutputEnvelope envelope{};
    if (data.contains("text") && data["text"].is_string()) {
        envelope.text = data["text"].get<std::string>();
    }
    if (data.contains("has_image") && data["has_image"].is_boolean()) {
        envelope.has_image = data["has_image"].get<bool>();
    }
    if (data.contains("has_animation") && data["has_animation"].is_boolean()) {
        envelope.has_animation = data["has_animation"].get<bool>();
    }
    if (data.contains("duration") && data["duration"].is_number()) {
        envelope.duration = data["duration"].get<double>();
    }
    if (data.contains("error") && !data["error"].is_null() && !data["error"].is_object()) {
        return MakeErrorEnvelope(ErrorKind::InternalError, "worker result has a malformed error");
    }
    if (data.contains("error") && data["error"].is_object()) {
        const auto& error = data["error"];
        if (!error.contains("kind") || !error["kind"].is_string()) {
            return MakeErrorEnvelope(ErrorKind::InternalError, "worker result has a malformed error");
        }
        const auto kind = ErrorKindFromString(error["kind"].get<std::string>());
        if (!kind.has_value()) {
            return MakeErrorEnvelope(
                ErrorKind::InternalError,
                "worker result has unknown error kind '" + error["kind"].get<std::string>() + "'");
        }
        SandboxError sandbox_error{};
        sandbox_error.kind = *kind;
        if (error.contains("message") && error["message"].is_string()) {
            sandbox_error.message = error["message"].get<std::string>();
        }
        envelope.error = sandbox_error;
    }
    return envelope;
}

}  // namespace evalbox::sandbox
