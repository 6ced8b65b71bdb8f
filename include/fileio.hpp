#pragma once
#include <vector>
#include <string>
#include <cstdint>

// Whole-file helpers for the command-line tool. All throw
// std::runtime_error when a file cannot be opened, read or written.

std::vector<uint8_t> readFile(const std::string& path);
void writeFile(const std::string& path, const std::vector<uint8_t>& data);

// True when every file has the same content as the first one.
bool isSameFile(const std::vector<std::string>& paths);
