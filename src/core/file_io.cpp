#include "layercast/core/file_io.h"

#include <zlib.h>

#include <fstream>
#include <iterator>

namespace layercast::core {

namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr int kAutoDetectWindowBits = 15 + 32;

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool is_gzip_data(const std::vector<std::uint8_t>& data) {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

bool gzip_decompress(const std::vector<std::uint8_t>& input, std::string& output) {
    output.clear();
    if (input.empty()) return false;

    z_stream strm{};
    if (inflateInit2(&strm, kAutoDetectWindowBits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = const_cast<Bytef*>(input.data());

    unsigned char buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            inflateEnd(&strm);
            return false;
        }
        const std::size_t have = sizeof(buffer) - strm.avail_out;
        output.append(reinterpret_cast<const char*>(buffer), have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

bool gzip_compress(const std::string& input, std::vector<std::uint8_t>& output) {
    output.clear();

    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));

    unsigned char buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return false;
        }
        const std::size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return true;
}

FileReadResult read_document_file(const std::string& path) {
    FileReadResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "Cannot open file: " + path;
        return result;
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    if (file.bad()) {
        result.error = "Read error: " + path;
        return result;
    }

    if (is_gzip_data(bytes)) {
        if (!gzip_decompress(bytes, result.contents)) {
            result.error = "Corrupt gzip data: " + path;
            return result;
        }
        result.was_compressed = true;
    } else {
        result.contents.assign(bytes.begin(), bytes.end());
    }

    result.ok = true;
    return result;
}

bool write_document_file(const std::string& path, const std::string& contents,
                         std::string& error) {
    error.clear();

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "Cannot open file for writing: " + path;
        return false;
    }

    if (ends_with(path, ".gz")) {
        std::vector<std::uint8_t> compressed;
        if (!gzip_compress(contents, compressed)) {
            error = "gzip compression failed: " + path;
            return false;
        }
        file.write(reinterpret_cast<const char*>(compressed.data()),
                   static_cast<std::streamsize>(compressed.size()));
    } else {
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    if (!file) {
        error = "Write error: " + path;
        return false;
    }
    return true;
}

}  // namespace layercast::core
