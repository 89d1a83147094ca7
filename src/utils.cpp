#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::vector<std::string> split_list(const std::string& value, char separator){
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while(std::getline(ss, item, separator)){
        auto first = std::find_if(item.begin(), item.end(), [](unsigned char c){ return !std::isspace(c); });
        auto last = std::find_if(item.rbegin(), item.rend(), [](unsigned char c){ return !std::isspace(c); }).base();
        if(first < last) out.emplace_back(first, last);
    }
    return out;
}

// " JPG" -> ".jpg", "tar.gz" -> ".tar.gz"
std::string normalize_extension(std::string extension, bool case_sensitive){
    extension.erase(std::remove_if(extension.begin(), extension.end(),
                                   [](unsigned char c){ return std::isspace(c); }),
                    extension.end());
    if(extension.empty()) return {};
    if(extension.front() != '.') extension.insert(extension.begin(), '.');
    if(!case_sensitive){
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    }
    return extension;
}

std::string format_elapsed(std::chrono::milliseconds elapsed){
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (elapsed.count() / 1000.0) << "s";
    return oss.str();
}
