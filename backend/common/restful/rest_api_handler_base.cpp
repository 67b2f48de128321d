#include "rest_api_handler_base.hpp"

namespace common {

StringResponse RestApiHandlerBase::createJsonResponse(http::status status, const nlohmann::json& json) {
  StringResponse res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

StringResponse RestApiHandlerBase::createErrorResponse(http::status status, const std::string& message) {
  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw BadRequest("Invalid JSON in request body");
  }
  return parsed;
}

std::vector<std::string> RestApiHandlerBase::splitTarget(std::string_view target) {
  if (auto query = target.find('?'); query != std::string_view::npos) {
    target = target.substr(0, query);
  }

  std::vector<std::string> segments;
  size_t pos = 0;
  while (pos <= target.size()) {
    auto next = target.find('/', pos);
    if (next == std::string_view::npos) {
      next = target.size();
    }
    if (next > pos) {
      segments.emplace_back(target.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return segments;
}

}
