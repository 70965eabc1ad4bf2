#include "WebApiGateway.hpp"
#include "realtime/RtmTypes.hpp"
#include <nlohmann/json.hpp>

namespace rtmlink {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

ConnectResponse parseConnectResponse(std::string_view body) {
    const nlohmann::json j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw TransportError("rtm.connect: reply is not a JSON object");
    }

    ConnectResponse out;
    try {
        out.ok = j.value("ok", false);
        out.error = optionalString(j, "error");
        if (auto w = j.find("warning"); w != j.end() && w->is_string()) {
            // comma-separated list
            const std::string all = w->get<std::string>();
            std::size_t start = 0;
            while (start <= all.size()) {
                const std::size_t comma = all.find(',', start);
                const std::size_t end = comma == std::string::npos ? all.size() : comma;
                if (end > start) out.warnings.push_back(all.substr(start, end - start));
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
        }
        if (!out.ok) {
            if (!out.error) out.error = "unknown_error";
            return out;
        }

        out.url = j.value("url", "");
        if (out.url.empty()) {
            throw TransportError("rtm.connect: ok reply without url");
        }
        if (auto t = j.find("team"); t != j.end() && t->is_object()) {
            out.team.id = t->value("id", "");
            out.team.name = t->value("name", "");
            out.team.domain = t->value("domain", "");
            out.team.enterpriseId = optionalString(*t, "enterprise_id");
            out.team.enterpriseName = optionalString(*t, "enterprise_name");
        }
        if (auto s = j.find("self"); s != j.end() && s->is_object()) {
            out.self.id = s->value("id", "");
            out.self.name = s->value("name", "");
        }
    } catch (const nlohmann::json::type_error& e) {
        throw TransportError(std::string("rtm.connect: unexpected field type: ") + e.what());
    }
    return out;
}

} // namespace rtmlink
