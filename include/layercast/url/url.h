#pragma once

#include <string>

namespace layercast::url {

bool is_absolute_url(const std::string& value);
bool is_file_url(const std::string& value);
bool is_data_url(const std::string& value);

// Lowercased scheme of an absolute URL, empty otherwise.
std::string scheme_of(const std::string& value);

// Resolves `ref` against an http(s) or file base URL. Absolute references
// are returned unchanged.
std::string resolve_url(const std::string& base_url, const std::string& ref, std::string& err);

bool file_url_to_path(const std::string& file_url, std::string& path, std::string& err);
std::string path_to_file_url(const std::string& path);

bool percent_decode(const std::string& input, std::string& output, std::string& err);

struct DataUrl {
  std::string media_type;
  bool is_base64 = false;
  std::string payload;  // still encoded (base64 text or percent-encoded)
};

bool parse_data_url(const std::string& value, DataUrl& out, std::string& err);

}  // namespace layercast::url
