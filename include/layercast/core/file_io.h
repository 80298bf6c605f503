#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace layercast::core {

struct FileReadResult {
    bool ok = false;
    std::string contents;
    bool was_compressed = false;
    std::string error;
};

// Reads a whole document file. Input starting with the gzip magic bytes is
// inflated transparently.
FileReadResult read_document_file(const std::string& path);

// Writes `contents` to `path`, gzip-compressing when the path ends in ".gz".
bool write_document_file(const std::string& path, const std::string& contents,
                         std::string& error);

bool is_gzip_data(const std::vector<std::uint8_t>& data);
bool gzip_compress(const std::string& input, std::vector<std::uint8_t>& output);
bool gzip_decompress(const std::vector<std::uint8_t>& input, std::string& output);

}  // namespace layercast::core
