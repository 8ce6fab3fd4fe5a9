#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_hex(std::size_t byte_count);
// RFC 4122 version 4 layout: 8-4-4-4-12 lowercase hex.
std::string make_uuid_v4();

// 1024 steps, two decimals: "0B", "512.00 B", "1.50 MB".
std::string human_readable_size(double bytes);
std::string sanitize_file_name(const std::string& name);
std::string truncate_for_display(const std::string& text, std::size_t max_chars = 1000);
std::string tail_for_display(const std::string& text, std::size_t max_chars = 1000);

std::string trim_copy(std::string value);
std::string to_lower(std::string value);
