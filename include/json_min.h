// include/json_min.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

std::string jsonEscape(const std::string& s);
std::string jsonString(const std::string& s);  // quoted + escaped
std::string hexLower(const uint8_t* d, size_t n);
std::string hexSpacedUpper(const uint8_t* d, size_t n);  // "25 50 44 46"
