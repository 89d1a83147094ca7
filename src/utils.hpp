#pragma once
#include <chrono>
#include <string>
#include <vector>

std::vector<std::string> split_list(const std::string& value, char separator = ',');
std::string normalize_extension(std::string extension, bool case_sensitive = false);
std::string format_elapsed(std::chrono::milliseconds elapsed);
