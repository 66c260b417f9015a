#pragma once
#include "application/ingest_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace ingest_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<IngestService> ingest_service);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<IngestService> ingest_service_;

  http::response<http::string_body> handleUpload(
      const http::request<http::string_body> &req);
  http::response<http::string_body> handleList();
  http::response<http::string_body> handleQueueStatus();
};

} // namespace ingest_service
