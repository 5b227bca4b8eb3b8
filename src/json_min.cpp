// src/json_min.cpp
#include "json_min.h"
#include <cstdio>

std::string jsonEscape(const std::string& s) {
  std::string out; out.reserve(s.size() + 16);
  for (char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
          out += buf;
        } else out += c;
    }
  }
  return out;
}

std::string jsonString(const std::string& s) { return "\"" + jsonEscape(s) + "\""; }

std::string hexLower(const uint8_t* d, size_t n) {
  static const char* he = "0123456789abcdef";
  std::string s; s.resize(n*2);
  for (size_t i=0;i<n;++i){ s[2*i]=he[d[i]>>4]; s[2*i+1]=he[d[i]&0xF]; }
  return s;
}

std::string hexSpacedUpper(const uint8_t* d, size_t n) {
  static const char* he = "0123456789ABCDEF";
  std::string s;
  for (size_t i=0;i<n;++i){
    if (i) s.push_back(' ');
    s.push_back(he[d[i]>>4]); s.push_back(he[d[i]&0xF]);
  }
  return s;
}
