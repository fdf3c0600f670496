#include "file_io.hpp"
#include "drive_errors.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

bool file_exists(const std::string& path) {
    struct stat st{};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_dir(const std::string& path) {
    struct stat st{};
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

void ensure_dir(const std::string& dir) {
    if (dir.empty() || dir == "." || is_dir(dir)) return;

    std::string cur;
    for (size_t i = 0; i < dir.size(); ++i) {
        if (dir[i] == '/' && !cur.empty() && !is_dir(cur)) {
            if (::mkdir(cur.c_str(), 0775) != 0 && errno != EEXIST)
                throw DriveError("Cannot create folder: " + cur + " (" + std::strerror(errno) + ")");
        }
        cur.push_back(dir[i]);
    }
    if (::mkdir(dir.c_str(), 0775) != 0 && errno != EEXIST)
        throw DriveError("Cannot create folder: " + dir + " (" + std::strerror(errno) + ")");
}

std::vector<uint8_t> read_file(const std::string& path) {
    if (!file_exists(path)) throw InputNotFound(path);
    std::ifstream f(path, std::ios::binary);
    if (!f) throw DriveError("Cannot open: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw DriveError("Cannot write: " + path);
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!f) throw DriveError("Write failed: " + path);
}

void remove_file(const std::string& path) {
    if (::unlink(path.c_str()) != 0)
        throw DriveError("Cannot remove: " + path + " (" + std::strerror(errno) + ")");
}

std::string path_basename(const std::string& path) {
    auto s = path.find_last_of('/');
    return (s == std::string::npos) ? path : path.substr(s + 1);
}

std::string path_extension(const std::string& path) {
    std::string base = path_basename(path);
    auto dot = base.find_last_of('.');
    // leading dot (".bashrc") is part of the name, not an extension
    if (dot == std::string::npos || dot == 0) return "";
    return base.substr(dot);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == ".") return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}
