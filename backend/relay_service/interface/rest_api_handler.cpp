#include "rest_api_handler.hpp"
#include "interface/replies.hpp"

namespace relay_service {

RestApiHandler::RestApiHandler(TaskManager& manager, DownloadRegistry& registry)
    : manager_(manager), registry_(registry) {}

common::StringResponse RestApiHandler::doHandleRequest(common::StringRequest&& req) {
  const auto target = req.target();
  const auto segments = splitTarget(std::string_view(target.data(), target.size()));
  if (segments.size() < 2 || segments[0] != "api") {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }

  if (segments.size() == 2 && segments[1] == "status" && req.method() == http::verb::get) {
    return handleStatus();
  }

  if (segments[1] == "downloads") {
    if (segments.size() == 2 && req.method() == http::verb::post) {
      return handleSubmit(parseRequestBody(req.body()));
    }
    if (segments.size() == 3 && req.method() == http::verb::get) {
      return handleGetDownload(segments[2]);
    }
    if (segments.size() == 3 && req.method() == http::verb::delete_) {
      return handleDeleteDownload(segments[2]);
    }
    return createErrorResponse(http::status::method_not_allowed, "Method not allowed");
  }

  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

common::StringResponse RestApiHandler::handleStatus() {
  const auto size = manager_.queueSize();
  nlohmann::json response_json = {{"success", true},
                                  {"queue_size", size},
                                  {"worker", toString(manager_.workerState())},
                                  {"message", statusMessage(size)}};
  return createJsonResponse(http::status::ok, response_json);
}

common::StringResponse RestApiHandler::handleSubmit(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("url") || !body["url"].is_string()) {
    throw common::BadRequest("Field 'url' is required");
  }
  const auto url = body["url"].get<std::string>();
  if (url.empty()) {
    throw common::BadRequest("Field 'url' must not be empty");
  }

  bool fallback = false;
  if (body.contains("fallback")) {
    if (!body["fallback"].is_boolean()) {
      throw common::BadRequest("Field 'fallback' must be a boolean");
    }
    fallback = body["fallback"].get<bool>();
  }

  auto submission = registry_.submit(url, fallback);
  nlohmann::json response_json = {{"success", true},
                                  {"id", submission.id},
                                  {"position", submission.position},
                                  {"message", acceptMessage(submission.position)}};
  return createJsonResponse(http::status::accepted, response_json);
}

common::StringResponse RestApiHandler::handleGetDownload(const std::string& id) {
  auto snapshot = registry_.status(id);
  if (!snapshot) {
    return createErrorResponse(http::status::not_found, "Unknown download id");
  }

  switch (snapshot->state) {
    case DownloadSnapshot::State::Pending:
      return createJsonResponse(http::status::ok, {{"success", true}, {"status", "pending"}});

    case DownloadSnapshot::State::Failed:
      return createJsonResponse(http::status::ok, {{"success", false},
                                                   {"status", "failed"},
                                                   {"error", failureMessage(snapshot->error)}});

    case DownloadSnapshot::State::Done:
      break;
  }

  nlohmann::json response_json = {{"success", true},
                                  {"status", "done"},
                                  {"video_path", snapshot->video_path.string()},
                                  {"duration", snapshot->metadata.duration},
                                  {"width", snapshot->metadata.width},
                                  {"height", snapshot->metadata.height},
                                  {"bitrate", snapshot->metadata.bitrate}};
  if (snapshot->thumbnail_path) {
    response_json["thumbnail_path"] = snapshot->thumbnail_path->string();
  }
  if (snapshot->reduced_bitrate) {
    response_json["reduced_bitrate"] = *snapshot->reduced_bitrate;
  }
  if (auto warning = bitrateWarning(snapshot->metadata.bitrate, snapshot->reduced_bitrate)) {
    response_json["warning"] = *warning;
  }
  return createJsonResponse(http::status::ok, response_json);
}

common::StringResponse RestApiHandler::handleDeleteDownload(const std::string& id) {
  if (!registry_.release(id)) {
    return createErrorResponse(http::status::not_found, "Unknown download id");
  }
  return createJsonResponse(http::status::ok, {{"success", true}});
}

} // namespace relay_service
