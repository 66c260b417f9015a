#include "multipart.hpp"
#include <algorithm>
#include <cctype>

namespace common {

namespace {

constexpr std::string_view kCrlf = "\r\n";

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Strips the quotes of a quoted-string and resolves its backslash escapes.
std::string unquote(std::string_view s) {
  s = trim(s);
  if (s.size() < 2 || s.front() != '"' || s.back() != '"') {
    return std::string(s);
  }
  s = s.substr(1, s.size() - 2);
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      ++i;
    }
    out += s[i];
  }
  return out;
}

// End of the parameter starting at pos: the next ';' outside a quoted-string.
size_t paramEnd(std::string_view value, size_t pos) {
  bool quoted = false;
  for (; pos < value.size(); ++pos) {
    const char c = value[pos];
    if (quoted && c == '\\') {
      ++pos;
    } else if (c == '"') {
      quoted = !quoted;
    } else if (c == ';' && !quoted) {
      return pos;
    }
  }
  return value.size();
}

// Looks up key=value in a header value of the form "token; key=value; key2=\"v\"".
std::string headerParam(std::string_view value, std::string_view key) {
  size_t pos = 0;
  while (pos < value.size()) {
    const size_t end = paramEnd(value, pos);
    auto item = trim(value.substr(pos, end - pos));
    if (auto eq = item.find('='); eq != std::string_view::npos) {
      if (iequals(trim(item.substr(0, eq)), key)) {
        return unquote(item.substr(eq + 1));
      }
    }
    pos = end + 1;
  }
  return {};
}

} // namespace

std::expected<std::string, std::string> multipartBoundary(std::string_view content_type) {
  auto semi = content_type.find(';');
  auto media = trim(content_type.substr(0, semi));
  if (!iequals(media, "multipart/form-data")) {
    return std::unexpected("Content-Type is not multipart/form-data");
  }
  if (semi == std::string_view::npos) {
    return std::unexpected("multipart boundary missing");
  }
  auto boundary = headerParam(content_type.substr(semi + 1), "boundary");
  if (boundary.empty()) {
    return std::unexpected("multipart boundary missing");
  }
  return boundary;
}

std::expected<std::vector<MultipartPart>, std::string> parseMultipart(
  std::string_view body, std::string_view boundary) {
  const std::string delimiter = "--" + std::string(boundary);
  const std::string inner_delimiter = std::string(kCrlf) + delimiter;

  size_t pos = body.find(delimiter);
  if (pos == std::string_view::npos) {
    return std::unexpected("multipart body has no opening boundary");
  }
  pos += delimiter.size();

  std::vector<MultipartPart> parts;
  while (true) {
    if (body.substr(pos, 2) == "--") {
      return parts;  // closing delimiter
    }
    if (body.substr(pos, 2) != kCrlf) {
      return std::unexpected("malformed multipart boundary line");
    }
    pos += 2;

    auto headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string_view::npos) {
      return std::unexpected("multipart part headers are not terminated");
    }

    MultipartPart part;
    auto headers = body.substr(pos, headers_end - pos);
    size_t line_start = 0;
    while (line_start <= headers.size()) {
      size_t line_end = headers.find(kCrlf, line_start);
      if (line_end == std::string_view::npos) line_end = headers.size();
      auto line = headers.substr(line_start, line_end - line_start);
      if (auto colon = line.find(':'); colon != std::string_view::npos) {
        auto name = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));
        if (iequals(name, "Content-Disposition")) {
          part.name = headerParam(value, "name");
          part.filename = headerParam(value, "filename");
        } else if (iequals(name, "Content-Type")) {
          part.content_type = std::string(value);
        }
      }
      line_start = line_end + 2;
    }

    pos = headers_end + 4;
    auto content_end = body.find(inner_delimiter, pos);
    if (content_end == std::string_view::npos) {
      return std::unexpected("multipart part is not terminated by a boundary");
    }
    part.content = body.substr(pos, content_end - pos);
    parts.push_back(std::move(part));
    pos = content_end + inner_delimiter.size();
  }
}

std::expected<MultipartPart, std::string> findMultipartField(
  std::string_view body, std::string_view content_type, std::string_view field) {
  auto boundary = multipartBoundary(content_type);
  if (!boundary) {
    return std::unexpected(boundary.error());
  }
  auto parts = parseMultipart(body, *boundary);
  if (!parts) {
    return std::unexpected(parts.error());
  }
  for (auto& part : *parts) {
    if (part.name == field) {
      return part;
    }
  }
  return std::unexpected("multipart field '" + std::string(field) + "' not found");
}

} // namespace common
