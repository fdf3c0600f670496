#include "archiver.hpp"
#include "drive_errors.hpp"
#include "file_io.hpp"

#include <zlib.h>
#include <climits>
#include <cstring>
#include <iostream>

namespace {

constexpr int GZIP_WINDOW_BITS = 15 + 16;  // zlib window, gzip wrapper
constexpr size_t CHUNK = 1 << 16;
constexpr size_t MAX_ENTRY_NAME = 256;

} // namespace

std::vector<uint8_t> pack_archive(const std::vector<uint8_t>& content, const std::string& entry_name) {
    if (content.size() > static_cast<size_t>(UINT_MAX))
        throw DriveError("Input too large to archive");

    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw DriveError("deflateInit2 failed");

    std::string name = path_basename(entry_name);
    gz_header header{};
    header.name = reinterpret_cast<Bytef*>(&name[0]);
    header.os = 3; // unix
    if (deflateSetHeader(&zs, &header) != Z_OK) {
        deflateEnd(&zs);
        throw DriveError("deflateSetHeader failed");
    }

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(content.size())) + name.size() + 1);
    zs.next_in = const_cast<Bytef*>(content.data());
    zs.avail_in = static_cast<uInt>(content.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
        throw DriveError("deflate failed (" + std::to_string(rc) + ")");

    out.resize(produced);
    return out;
}

std::vector<uint8_t> pack_archive_file(const std::string& source_path) {
    auto content = read_file(source_path);
    auto archive = pack_archive(content, path_basename(source_path));
    std::cout << "[ARCHIVE] Packed " << content.size() << " -> " << archive.size() << " bytes\n";
    return archive;
}

ArchiveEntry unpack_archive(const std::vector<uint8_t>& archive) {
    if (archive.size() > static_cast<size_t>(UINT_MAX))
        throw ArchiveUnpackFailure("Archive too large");

    z_stream zs{};
    if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK)
        throw ArchiveUnpackFailure("inflateInit2 failed");

    char name_buf[MAX_ENTRY_NAME] = {0};
    gz_header header{};
    header.name = reinterpret_cast<Bytef*>(name_buf);
    header.name_max = sizeof(name_buf) - 1;
    if (inflateGetHeader(&zs, &header) != Z_OK) {
        inflateEnd(&zs);
        throw ArchiveUnpackFailure("inflateGetHeader failed");
    }

    zs.next_in = const_cast<Bytef*>(archive.data());
    zs.avail_in = static_cast<uInt>(archive.size());

    ArchiveEntry entry;
    unsigned char buf[CHUNK];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = buf;
        zs.avail_out = sizeof(buf);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw ArchiveUnpackFailure("Corrupt archive (zlib error " + std::to_string(rc) + ")");
        }
        size_t have = sizeof(buf) - zs.avail_out;
        entry.content.insert(entry.content.end(), buf, buf + have);
        if (rc == Z_OK && zs.avail_in == 0 && have == 0) {
            inflateEnd(&zs);
            throw ArchiveUnpackFailure("Truncated archive");
        }
    }
    inflateEnd(&zs);

    if (header.done == 1)
        entry.name = path_basename(std::string(name_buf, strnlen(name_buf, sizeof(name_buf))));
    return entry;
}

std::vector<std::string> unpack_archive_file(const std::string& archive_path) {
    const std::string ext = ARCHIVE_EXTENSION;
    std::string target = archive_path;
    if (target.size() > ext.size() && target.compare(target.size() - ext.size(), ext.size(), ext) == 0)
        target.resize(target.size() - ext.size());
    else
        target += ".out";

    ArchiveEntry entry = unpack_archive(read_file(archive_path));
    write_file(target, entry.content);
    remove_file(archive_path);

    std::cout << "[ARCHIVE] Extracted " << target << " (" << entry.content.size() << " bytes)\n";
    return {target};
}
