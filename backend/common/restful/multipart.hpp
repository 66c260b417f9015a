#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace common {

// One part of a multipart/form-data body. content is a view into the body
// handed to parseMultipart and must not outlive it.
struct MultipartPart {
  std::string name;
  std::string filename;
  std::string content_type;
  std::string_view content;
};

// Extracts the boundary parameter from a Content-Type header value.
std::expected<std::string, std::string> multipartBoundary(std::string_view content_type);

std::expected<std::vector<MultipartPart>, std::string> parseMultipart(
  std::string_view body, std::string_view boundary);

// Convenience lookup of a single named field.
std::expected<MultipartPart, std::string> findMultipartField(
  std::string_view body, std::string_view content_type, std::string_view field);

} // namespace common
