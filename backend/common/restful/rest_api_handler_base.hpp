#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  // Dispatches to doHandleRequest() and decorates every response with CORS
  // headers and the request's keep-alive flag. Escaped exceptions become a
  // JSON 500.
  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    const bool keep_alive = req.keep_alive();
    const std::string method(req.method_string());
    const std::string target(req.target());

    http::response<http::string_body> response;
    if (req.method() == http::verb::options) {
      response = http::response<http::string_body>{http::status::ok, req.version()};
      response.prepare_payload();
    } else {
      try {
        response = doHandleRequest(std::move(req));
      } catch (const std::exception& e) {
        std::cerr << "[http] " << method << " " << target << " failed: " << e.what() << std::endl;
        response = createErrorResponse(http::status::internal_server_error,
                                       "Internal server error: " + std::string(e.what()));
      }
    }

    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    response.keep_alive(keep_alive);

    std::cout << "[http] " << method << " " << target << " -> " << response.result_int() << std::endl;
    return response;
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);
  
  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  http::response<http::string_body> createTextResponse(
    http::status status, const std::string& text);
};

} // namespace common
