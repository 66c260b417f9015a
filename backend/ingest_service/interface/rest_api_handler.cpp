#include "rest_api_handler.hpp"
#include "common/restful/multipart.hpp"

namespace ingest_service {

namespace {

http::status statusFor(IngestOutcome outcome) {
  switch (outcome) {
    case IngestOutcome::Queued:
    case IngestOutcome::AlreadyExists:
    case IngestOutcome::SkippedDuplicate:
      return http::status::ok;
    case IngestOutcome::QueueFull:
      return http::status::service_unavailable;
    case IngestOutcome::BadRequest:
      return http::status::bad_request;
    case IngestOutcome::Failed:
      break;
  }
  return http::status::internal_server_error;
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<IngestService> ingest_service)
    : ingest_service_(std::move(ingest_service)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  std::string target = std::string(req.target());
  if (auto query = target.find('?'); query != std::string::npos) {
    target.erase(query);
  }

  if (target == "/upload" && req.method() == http::verb::post) {
    return handleUpload(req);
  } else if (target == "/list" && req.method() == http::verb::get) {
    return handleList();
  } else if (target == "/queue-status" && req.method() == http::verb::get) {
    return handleQueueStatus();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::response<http::string_body>
RestApiHandler::handleUpload(const http::request<http::string_body> &req) {
  const auto content_type = req[http::field::content_type];
  auto part = common::findMultipartField(
    req.body(), std::string_view(content_type.data(), content_type.size()), "file");
  if (!part) {
    return createErrorResponse(http::status::bad_request, part.error());
  }
  if (part->filename.empty()) {
    return createErrorResponse(http::status::bad_request, "file field has no filename");
  }

  auto result = ingest_service_->upload(part->filename, part->content);
  nlohmann::json response_json = {
    {"success", statusFor(result.outcome) == http::status::ok},
    {"status", toString(result.outcome)},
    {"name", result.name},
    {"message", result.message}
  };
  return createJsonResponse(statusFor(result.outcome), response_json);
}

http::response<http::string_body> RestApiHandler::handleList() {
  return createJsonResponse(http::status::ok, nlohmann::json(ingest_service_->listVideos()));
}

http::response<http::string_body> RestApiHandler::handleQueueStatus() {
  auto status = ingest_service_->status();
  return createTextResponse(http::status::ok,
                            std::to_string(status.occupancy) + "/" + std::to_string(status.capacity));
}

} // namespace ingest_service
