#include "layercast/url/url.h"

#include <cctype>
#include <string>
#include <vector>

namespace layercast::url {
namespace {

std::string to_lower_ascii(std::string value) {
  for (char& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool is_ascii_alpha(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool is_url_scheme_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '+' || ch == '-' || ch == '.';
}

bool looks_like_windows_drive_path(const std::string& value) {
  if (value.size() < 2 || !is_ascii_alpha(value[0]) || value[1] != ':') {
    return false;
  }
  return value.size() == 2 || value[2] == '/' || value[2] == '\\';
}

bool extract_scheme(const std::string& value, std::string& scheme) {
  scheme.clear();
  const std::size_t colon = value.find(':');
  if (colon == std::string::npos || colon == 0 || !is_ascii_alpha(value[0])) {
    return false;
  }
  for (std::size_t i = 1; i < colon; ++i) {
    if (!is_url_scheme_char(value[i])) {
      return false;
    }
  }
  scheme = to_lower_ascii(value.substr(0, colon));
  return true;
}

struct ReferenceParts {
  std::string path;
  std::string suffix;  // query and fragment, verbatim
};

ReferenceParts split_reference(const std::string& ref) {
  ReferenceParts parts;
  const std::size_t cut = ref.find_first_of("?#");
  if (cut == std::string::npos) {
    parts.path = ref;
  } else {
    parts.path = ref.substr(0, cut);
    parts.suffix = ref.substr(cut);
  }
  return parts;
}

std::string directory_of_path(const std::string& path) {
  const std::size_t slash_pos = path.rfind('/');
  if (slash_pos == std::string::npos) {
    return "/";
  }
  return path.substr(0, slash_pos + 1);
}

// Collapses "." and ".." segments of an absolute path.
std::string normalize_path(const std::string& input) {
  const bool trailing_slash = input.size() > 1 && input.back() == '/';

  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= input.size()) {
    const std::size_t slash = input.find('/', pos);
    const std::string segment =
        (slash == std::string::npos) ? input.substr(pos) : input.substr(pos, slash - pos);
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }

  std::string normalized;
  for (const auto& segment : segments) {
    normalized += "/" + segment;
  }
  if (normalized.empty() || trailing_slash) {
    normalized += "/";
  }
  return normalized;
}

std::string resolve_path(const std::string& base_path, const std::string& ref_path) {
  if (!ref_path.empty() && ref_path.front() == '/') {
    return normalize_path(ref_path);
  }
  return normalize_path(directory_of_path(base_path) + ref_path);
}

int from_hex(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
  if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
  return -1;
}

std::string percent_encode_path(const std::string& path) {
  constexpr char kHexDigits[] = "0123456789ABCDEF";
  std::string output;
  output.reserve(path.size());
  for (const char ch : path) {
    const unsigned char uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || ch == '-' || ch == '.' || ch == '_' || ch == '~' ||
        ch == '/' || ch == ':') {
      output += ch;
      continue;
    }
    output += '%';
    output += kHexDigits[(uch >> 4) & 0x0F];
    output += kHexDigits[uch & 0x0F];
  }
  return output;
}

std::string resolve_hierarchical(const std::string& base_url, const std::string& ref) {
  // base_url is scheme://authority/path?query#fragment
  const std::size_t authority_start = base_url.find("://") + 3;
  std::size_t path_start = base_url.find_first_of("/?#", authority_start);
  if (path_start == std::string::npos) {
    path_start = base_url.size();
  }
  const std::string origin = base_url.substr(0, path_start);
  const ReferenceParts base_parts = split_reference(base_url.substr(path_start));
  const std::string base_path = base_parts.path.empty() ? "/" : base_parts.path;

  if (ref.front() == '#' || ref.front() == '?') {
    std::string base_without = origin + base_path;
    if (ref.front() == '#') {
      const std::size_t fragment = base_parts.suffix.find('#');
      base_without += base_parts.suffix.substr(0, fragment);
    }
    return base_without + ref;
  }

  const ReferenceParts parts = split_reference(ref);
  return origin + resolve_path(base_path, parts.path) + parts.suffix;
}

}  // namespace

bool is_absolute_url(const std::string& value) {
  if (value.empty() || starts_with(value, "//") || looks_like_windows_drive_path(value)) {
    return false;
  }
  std::string scheme;
  return extract_scheme(value, scheme);
}

bool is_file_url(const std::string& value) {
  return scheme_of(value) == "file";
}

bool is_data_url(const std::string& value) {
  return scheme_of(value) == "data";
}

std::string scheme_of(const std::string& value) {
  if (!is_absolute_url(value)) {
    return "";
  }
  std::string scheme;
  extract_scheme(value, scheme);
  return scheme;
}

std::string resolve_url(const std::string& base_url, const std::string& ref, std::string& err) {
  err.clear();

  if (ref.empty()) {
    return base_url;
  }
  if (is_absolute_url(ref)) {
    return ref;
  }

  std::string base_scheme;
  if (!extract_scheme(base_url, base_scheme)) {
    err = "Base URL must include a valid scheme";
    return "";
  }

  if (starts_with(ref, "//")) {
    return base_scheme + ":" + ref;
  }

  if (base_url.find("://") == std::string::npos) {
    err = "Base URL is not hierarchical: " + base_url;
    return "";
  }

  if (base_scheme == "file") {
    std::string base_path;
    if (!file_url_to_path(base_url, base_path, err)) {
      return "";
    }
    const ReferenceParts parts = split_reference(ref);
    if (parts.path.empty()) {
      return path_to_file_url(base_path) + parts.suffix;
    }
    return path_to_file_url(resolve_path(base_path, parts.path)) + parts.suffix;
  }

  return resolve_hierarchical(base_url, ref);
}

bool file_url_to_path(const std::string& file_url, std::string& path, std::string& err) {
  path.clear();
  err.clear();

  if (!is_file_url(file_url)) {
    err = "URL is not a file URL";
    return false;
  }

  std::string remainder = file_url.substr(file_url.find(':') + 1);
  const std::size_t trim_pos = remainder.find_first_of("?#");
  if (trim_pos != std::string::npos) {
    remainder = remainder.substr(0, trim_pos);
  }

  std::string raw_path = remainder;
  if (starts_with(remainder, "//")) {
    const std::size_t authority_end = remainder.find('/', 2);
    const std::string authority = (authority_end == std::string::npos)
                                      ? remainder.substr(2)
                                      : remainder.substr(2, authority_end - 2);
    if (!authority.empty() && to_lower_ascii(authority) != "localhost") {
      err = "Unsupported file URL host: " + authority;
      return false;
    }
    raw_path = (authority_end == std::string::npos) ? "/" : remainder.substr(authority_end);
  }
  if (raw_path.empty()) {
    raw_path = "/";
  }

  if (!percent_decode(raw_path, path, err)) {
    path.clear();
    return false;
  }
  return true;
}

std::string path_to_file_url(const std::string& path) {
  std::string normalized_path = path;
  for (char& ch : normalized_path) {
    if (ch == '\\') {
      ch = '/';
    }
  }
  if (normalized_path.empty()) {
    return "file:///";
  }
  if (normalized_path.front() == '/') {
    return "file://" + percent_encode_path(normalized_path);
  }
  return "file:" + percent_encode_path(normalized_path);
}

bool percent_decode(const std::string& input, std::string& output, std::string& err) {
  output.clear();
  err.clear();

  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if (ch != '%') {
      output += ch;
      continue;
    }
    if (i + 2 >= input.size() || from_hex(input[i + 1]) < 0 || from_hex(input[i + 2]) < 0) {
      err = "Invalid percent-encoding";
      return false;
    }
    output += static_cast<char>((from_hex(input[i + 1]) << 4) | from_hex(input[i + 2]));
    i += 2;
  }
  return true;
}

bool parse_data_url(const std::string& value, DataUrl& out, std::string& err) {
  out = DataUrl{};
  err.clear();

  if (!is_data_url(value)) {
    err = "URL is not a data URL";
    return false;
  }
  const std::size_t comma = value.find(',');
  if (comma == std::string::npos) {
    err = "data URL is missing ','";
    return false;
  }

  const std::string metadata = to_lower_ascii(value.substr(5, comma - 5));
  out.payload = value.substr(comma + 1);

  std::size_t pos = 0;
  bool first = true;
  while (pos <= metadata.size()) {
    const std::size_t semi = metadata.find(';', pos);
    const std::string param =
        (semi == std::string::npos) ? metadata.substr(pos) : metadata.substr(pos, semi - pos);
    if (first) {
      out.media_type = param;
      first = false;
    } else if (param == "base64") {
      out.is_base64 = true;
    }
    if (semi == std::string::npos) {
      break;
    }
    pos = semi + 1;
  }
  if (out.media_type.empty()) {
    out.media_type = "text/plain";
  }
  return true;
}

}  // namespace layercast::url
