// Repository: loopcast
// Component: JSON Field Extraction
// Purpose: Minimal key lookup over JSON text for config and progress files.
// Copyright (c) 2026 Loopcast

#include "loopcast/util/JsonFields.hpp"

#include <cctype>
#include <cstdlib>

namespace loopcast::util {

namespace {

void SkipWhitespace(const std::string& json, size_t* pos) {
  while (*pos < json.size() && std::isspace(static_cast<unsigned char>(json[*pos]))) {
    ++*pos;
  }
}

// Position of the first character of the value stored under key, or npos.
size_t FindValueStart(const std::string& json, const std::string& key) {
  const std::string search = "\"" + key + "\"";
  size_t pos = 0;
  while ((pos = json.find(search, pos)) != std::string::npos) {
    size_t after = pos + search.size();
    SkipWhitespace(json, &after);
    if (after < json.size() && json[after] == ':') {
      ++after;
      SkipWhitespace(json, &after);
      return after;
    }
    pos += search.size();
  }
  return std::string::npos;
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Parses a quoted string starting at json[*pos] == '"'. Advances *pos past it.
std::optional<std::string> ParseQuoted(const std::string& json, size_t* pos) {
  if (*pos >= json.size() || json[*pos] != '"') return std::nullopt;
  std::string out;
  for (size_t i = *pos + 1; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '"') {
      *pos = i + 1;
      return out;
    }
    if (c != '\\' || i + 1 >= json.size()) {
      out += c;
      continue;
    }
    const char esc = json[++i];
    switch (esc) {
      case '"': out += '"'; break;
      case '\\': out += '\\'; break;
      case '/': out += '/'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'u':
        if (i + 4 < json.size()) {
          const uint32_t cp =
              static_cast<uint32_t>(std::strtoul(json.substr(i + 1, 4).c_str(), nullptr, 16));
          AppendUtf8(cp, &out);
          i += 4;
        }
        break;
      default: out += esc; break;
    }
  }
  return std::nullopt;
}

// Index one past the bracket matching json[start] ('{' or '['), or npos.
size_t MatchBracket(const std::string& json, size_t start) {
  const char open = json[start];
  const char close = open == '{' ? '}' : ']';
  size_t depth = 0;
  for (size_t i = start; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '"') {
      ++i;
      while (i < json.size() && json[i] != '"') {
        if (json[i] == '\\') ++i;
        ++i;
      }
      continue;
    }
    if (c == open) {
      ++depth;
    } else if (c == close) {
      if (--depth == 0) return i + 1;
    }
  }
  return std::string::npos;
}

// Literal token (number, true, false, null) at pos.
std::string ReadToken(const std::string& json, size_t pos) {
  size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         !std::isspace(static_cast<unsigned char>(json[end]))) {
    ++end;
  }
  return json.substr(pos, end - pos);
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

std::optional<std::string> JsonGetString(const std::string& json, const std::string& key) {
  size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos) return std::nullopt;
  return ParseQuoted(json, &pos);
}

std::optional<int64_t> JsonGetInt(const std::string& json, const std::string& key) {
  const size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos) return std::nullopt;
  const std::string token = ReadToken(json, pos);
  if (token.empty()) return std::nullopt;
  char* end = nullptr;
  const long long value = std::strtoll(token.c_str(), &end, 10);
  if (end == token.c_str() || *end != '\0') return std::nullopt;
  return static_cast<int64_t>(value);
}

std::optional<double> JsonGetDouble(const std::string& json, const std::string& key) {
  const size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos) return std::nullopt;
  const std::string token = ReadToken(json, pos);
  if (token.empty()) return std::nullopt;
  char* end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || *end != '\0') return std::nullopt;
  return value;
}

std::optional<bool> JsonGetBool(const std::string& json, const std::string& key) {
  const size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos) return std::nullopt;
  const std::string token = ReadToken(json, pos);
  if (token == "true") return true;
  if (token == "false") return false;
  return std::nullopt;
}

std::optional<std::string> JsonGetObject(const std::string& json, const std::string& key) {
  const size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos || json[pos] != '{') return std::nullopt;
  const size_t end = MatchBracket(json, pos);
  if (end == std::string::npos) return std::nullopt;
  return json.substr(pos, end - pos);
}

std::optional<std::vector<std::string>> JsonGetObjectArray(const std::string& json,
                                                           const std::string& key) {
  const size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos || json[pos] != '[') return std::nullopt;
  const size_t end = MatchBracket(json, pos);
  if (end == std::string::npos) return std::nullopt;

  std::vector<std::string> objects;
  size_t i = pos + 1;
  while (i < end - 1) {
    SkipWhitespace(json, &i);
    if (json[i] == '{') {
      const size_t obj_end = MatchBracket(json, i);
      if (obj_end == std::string::npos || obj_end > end) return std::nullopt;
      objects.push_back(json.substr(i, obj_end - i));
      i = obj_end;
    } else if (json[i] == ',') {
      ++i;
    } else if (json[i] == ']') {
      break;
    } else {
      return std::nullopt;
    }
  }
  return objects;
}

std::optional<std::vector<std::string>> JsonGetStringArray(const std::string& json,
                                                           const std::string& key) {
  size_t pos = FindValueStart(json, key);
  if (pos == std::string::npos || json[pos] != '[') return std::nullopt;

  std::vector<std::string> values;
  ++pos;
  while (pos < json.size()) {
    SkipWhitespace(json, &pos);
    if (pos >= json.size()) return std::nullopt;
    if (json[pos] == ']') return values;
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    auto value = ParseQuoted(json, &pos);
    if (!value) return std::nullopt;
    values.push_back(std::move(*value));
  }
  return std::nullopt;
}

}  // namespace loopcast::util
