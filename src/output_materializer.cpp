#include "output_materializer.hpp"
#include "archiver.hpp"
#include "base64_codec.hpp"
#include "file_io.hpp"
#include <iostream>

std::vector<uint8_t> decode_payload(const ReassembledFile& file) {
    if (file.is_binary)
        return base64_decode(file.payload);
    return std::vector<uint8_t>(file.payload.begin(), file.payload.end());
}

std::string output_name(const ReassembledFile& file) {
    std::string name = path_basename(file.file_name);
    if (name.empty()) name = DEFAULT_OUTPUT_NAME;
    if (file.is_archived) name += ARCHIVE_EXTENSION;
    return name;
}

MaterializedFile materialize_output(const ReassembledFile& file, const std::string& directory) {
    std::vector<uint8_t> bytes = decode_payload(file);

    ensure_dir(directory);
    MaterializedFile out;
    out.path = join_path(directory, output_name(file));
    write_file(out.path, bytes);
    std::cout << "[LOAD] Wrote " << out.path << " (" << bytes.size() << " bytes)" << std::endl;

    if (file.is_archived)
        out.extracted = unpack_archive_file(out.path);
    return out;
}
