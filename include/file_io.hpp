#pragma once
#include <cstdint>
#include <string>
#include <vector>

bool file_exists(const std::string& path);
bool is_dir(const std::string& path);

// mkdir -p; no-op for "" and "."
void ensure_dir(const std::string& dir);

std::vector<uint8_t> read_file(const std::string& path);
void write_file(const std::string& path, const std::vector<uint8_t>& data);
void remove_file(const std::string& path);

std::string path_basename(const std::string& path);
std::string path_extension(const std::string& path);  // ".txt", or "" when none
std::string join_path(const std::string& dir, const std::string& name);
