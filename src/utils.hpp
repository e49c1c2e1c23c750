#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Local time, second precision, e.g. 2024-05-01T13:45:07
std::string iso8601_now();

// `path` relative to `root`, or nullopt when it is not inside `root`.
std::optional<std::filesystem::path> relative_under(const std::filesystem::path& path,
                                                    const std::filesystem::path& root);

std::string trim(const std::string& value);
std::string to_lower(std::string value);
std::string format_mib(unsigned long long bytes);

// Drops the calling thread to nice 19 and the idle I/O class (Linux).
bool enter_background_priority(std::string& error);
