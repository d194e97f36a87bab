/**
 * @file codec_config.cpp
 * @brief CodecConfig JSON loading and saving
 */

#include "RetroPak/core/codec_config.hpp"

#include <sstream>
#include <utility>

namespace RetroPak::core {

// Minimal flat-object JSON helpers
namespace json {

enum class Lookup { Missing, Found, Malformed };

inline Lookup findValueStart(const std::string& json, const std::string& key, size_t& valueStart) {
  auto keyPos = json.find("\"" + key + "\"");
  if (keyPos == std::string::npos)
    return Lookup::Missing;

  auto colonPos = json.find(':', keyPos + key.size() + 2);
  if (colonPos == std::string::npos)
    return Lookup::Malformed;

  valueStart = json.find_first_not_of(" \t\n\r", colonPos + 1);
  if (valueStart == std::string::npos)
    return Lookup::Malformed;

  return Lookup::Found;
}

inline Lookup extractUnsigned(const std::string& json, const std::string& key, u64& out) {
  size_t valueStart = 0;
  Lookup lookup = findValueStart(json, key, valueStart);
  if (lookup != Lookup::Found)
    return lookup;

  auto valueEnd = json.find_first_not_of("0123456789", valueStart);
  if (valueEnd == valueStart)
    return Lookup::Malformed;

  try {
    out = std::stoull(json.substr(valueStart, valueEnd - valueStart));
  } catch (const std::exception&) {
    return Lookup::Malformed;
  }
  return Lookup::Found;
}

inline Lookup extractString(const std::string& json, const std::string& key, std::string& out) {
  size_t valueStart = 0;
  Lookup lookup = findValueStart(json, key, valueStart);
  if (lookup != Lookup::Found)
    return lookup;

  if (json[valueStart] != '"')
    return Lookup::Malformed;

  auto valueEnd = json.find('"', valueStart + 1);
  if (valueEnd == std::string::npos)
    return Lookup::Malformed;

  out = json.substr(valueStart + 1, valueEnd - valueStart - 1);
  return Lookup::Found;
}

} // namespace json

namespace {

Result<void> applyByte(const std::string& text, const std::string& key, u8& field) {
  u64 value = 0;
  switch (json::extractUnsigned(text, key, value)) {
  case json::Lookup::Missing:
    return Result<void>::ok();
  case json::Lookup::Malformed:
    return Result<void>::error(ErrorCode::InvalidConfig, "'" + key + "' must be an unsigned integer");
  case json::Lookup::Found:
    break;
  }
  if (value > 0xFF) {
    return Result<void>::error(ErrorCode::InvalidConfig,
                               "'" + key + "' must fit in one byte, got " + std::to_string(value));
  }
  field = static_cast<u8>(value);
  return Result<void>::ok();
}

Result<void> applyLimit(const std::string& text, const std::string& key, u32& field) {
  u64 value = 0;
  switch (json::extractUnsigned(text, key, value)) {
  case json::Lookup::Missing:
    return Result<void>::ok();
  case json::Lookup::Malformed:
    return Result<void>::error(ErrorCode::InvalidConfig, "'" + key + "' must be an unsigned integer");
  case json::Lookup::Found:
    break;
  }
  if (value > 0xFFFFFFFFull) {
    return Result<void>::error(ErrorCode::InvalidConfig, "'" + key + "' exceeds 32 bits");
  }
  field = static_cast<u32>(value);
  return Result<void>::ok();
}

} // namespace

Result<CodecConfig> CodecConfig::fromJson(const std::string& text) {
  auto first = text.find_first_not_of(" \t\n\r");
  if (first == std::string::npos || text[first] != '{') {
    return Result<CodecConfig>::error(ErrorCode::InvalidConfig,
                                      "Codec configuration must be a JSON object");
  }

  CodecConfig config;

  const std::pair<const char*, u8*> fillBytes[] = {
      {"header_fill_byte", &config.headerFillByte},
      {"resource_fill_byte", &config.resourceFillByte},
      {"strg_fill_byte", &config.strgFillByte},
  };
  for (const auto& [key, field] : fillBytes) {
    auto applied = applyByte(text, key, *field);
    if (applied.isError()) {
      return Result<CodecConfig>::error(applied.errorInfo());
    }
  }

  const std::pair<const char*, u32*> limits[] = {
      {"max_named_resource_count", &config.maxNamedResourceCount},
      {"max_resource_count", &config.maxResourceCount},
      {"max_language_count", &config.maxLanguageCount},
      {"max_string_count", &config.maxStringCount},
      {"max_name_count", &config.maxNameCount},
  };
  for (const auto& [key, field] : limits) {
    auto applied = applyLimit(text, key, *field);
    if (applied.isError()) {
      return Result<CodecConfig>::error(applied.errorInfo());
    }
  }

  std::string levelText;
  switch (json::extractString(text, "log_level", levelText)) {
  case json::Lookup::Missing:
    break;
  case json::Lookup::Malformed:
    return Result<CodecConfig>::error(ErrorCode::InvalidConfig, "'log_level' must be a string");
  case json::Lookup::Found:
    if (!logLevelFromString(levelText, config.logLevel)) {
      return Result<CodecConfig>::error(ErrorCode::InvalidConfig,
                                        "Unknown log level: '" + levelText + "'");
    }
    break;
  }

  return Result<CodecConfig>::ok(config);
}

std::string CodecConfig::toJson() const {
  std::ostringstream out;
  out << "{\n";
  out << "  \"header_fill_byte\": " << static_cast<u32>(headerFillByte) << ",\n";
  out << "  \"resource_fill_byte\": " << static_cast<u32>(resourceFillByte) << ",\n";
  out << "  \"strg_fill_byte\": " << static_cast<u32>(strgFillByte) << ",\n";
  out << "  \"max_named_resource_count\": " << maxNamedResourceCount << ",\n";
  out << "  \"max_resource_count\": " << maxResourceCount << ",\n";
  out << "  \"max_language_count\": " << maxLanguageCount << ",\n";
  out << "  \"max_string_count\": " << maxStringCount << ",\n";
  out << "  \"max_name_count\": " << maxNameCount << ",\n";
  out << "  \"log_level\": \"" << logLevelToString(logLevel) << "\"\n";
  out << "}\n";
  return out.str();
}

void CodecConfig::applyLogLevel() const {
  Logger::instance().setLevel(logLevel);
}

} // namespace RetroPak::core
