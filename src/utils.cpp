#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(out.size())) != 1){
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return out;
}

std::string random_hex(std::size_t byte_count){
    return hex_from_bytes(random_bytes(byte_count));
}

std::string make_uuid_v4(){
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
    const std::string hex = hex_from_bytes(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string human_readable_size(double bytes){
    static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};
    if(!(bytes > 0)) return "0B";
    std::size_t unit = static_cast<std::size_t>(std::floor(std::log(bytes) / std::log(1024.0)));
    if(unit >= kUnits.size()) unit = kUnits.size() - 1;
    const double scaled = bytes / std::pow(1024.0, static_cast<double>(unit));
    return fmt::format("{:.2f} {}", scaled, kUnits[unit]);
}

std::string sanitize_file_name(const std::string& name){
    static constexpr const char* kForbidden = "\\/*?:\"<>|";
    std::string out;
    out.reserve(name.size());
    for(char c : name){
        if(std::char_traits<char>::find(kForbidden, 9, c) == nullptr) out.push_back(c);
    }
    return out;
}

std::string truncate_for_display(const std::string& text, std::size_t max_chars){
    if(text.size() <= max_chars) return text;
    return text.substr(0, max_chars);
}

std::string tail_for_display(const std::string& text, std::size_t max_chars){
    if(text.size() <= max_chars) return text;
    return text.substr(text.size() - max_chars);
}

std::string trim_copy(std::string value){
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string to_lower(std::string value){
    for(auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return value;
}
