#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

using StringRequest = http::request<http::string_body, http::basic_fields<std::allocator<char>>>;
using StringResponse = http::response<http::string_body>;

// Thrown by handlers for client mistakes; rendered as a 400 response.
class BadRequest : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  StringResponse handleRequest(http::request<Body, http::basic_fields<Allocator>>&& req) {
    const auto version = req.version();
    const bool keep_alive = req.keep_alive();

    StringResponse response;
    try {
      response = doHandleRequest(std::move(req));
    } catch (const BadRequest& e) {
      response = createErrorResponse(http::status::bad_request, e.what());
    } catch (const std::exception& e) {
      response = createErrorResponse(http::status::internal_server_error, 
                                     "Internal server error: " + std::string(e.what()));
    }
    response.version(version);
    response.keep_alive(keep_alive);
    response.prepare_payload();
    return response;
  }

protected:
  virtual StringResponse doHandleRequest(StringRequest&& req) = 0;

  StringResponse createJsonResponse(http::status status, const nlohmann::json& json);
  
  StringResponse createErrorResponse(http::status status, const std::string& message);
  
  // Empty body parses as an empty object; malformed JSON throws BadRequest.
  nlohmann::json parseRequestBody(const std::string& body);

  // "/api/downloads/abc?x=1" -> {"api", "downloads", "abc"}
  static std::vector<std::string> splitTarget(std::string_view target);
};

}
