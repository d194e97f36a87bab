#pragma once

/**
 * @file codec_config.hpp
 * @brief Codec settings - filler bytes, decode sanity limits, logging
 *
 * Settings are layered the same way as every other configuration in the
 * engine: built-in defaults, optionally overridden by a flat JSON document.
 * Unknown keys are ignored so documents can carry unrelated sections.
 *
 * Example document:
 * @code
 * {
 *   "header_fill_byte": 255,
 *   "resource_fill_byte": 255,
 *   "strg_fill_byte": 255,
 *   "max_resource_count": 65536,
 *   "log_level": "debug"
 * }
 * @endcode
 */

#include "RetroPak/core/alignment.hpp"
#include "RetroPak/core/logger.hpp"
#include "RetroPak/core/result.hpp"
#include "RetroPak/core/types.hpp"
#include <string>

namespace RetroPak::core {

struct CodecConfig {
  // Filler written between the PAK directory and the first resource
  u8 headerFillByte = DEFAULT_FILL_BYTE;
  // Filler written after each PAK resource
  u8 resourceFillByte = DEFAULT_FILL_BYTE;
  // Filler written at the end of a STRG payload
  u8 strgFillByte = DEFAULT_FILL_BYTE;

  // Counts above these limits are rejected as MalformedHeader
  u32 maxNamedResourceCount = 65536;
  u32 maxResourceCount = 65536;
  u32 maxLanguageCount = 64;
  u32 maxStringCount = 1u << 20;
  u32 maxNameCount = 1u << 20;

  LogLevel logLevel = LogLevel::Info;

  /**
   * @brief Parse a flat JSON object holding any subset of the settings
   * @return InvalidConfig when a known key carries an unusable value
   */
  [[nodiscard]] static Result<CodecConfig> fromJson(const std::string& json);

  [[nodiscard]] std::string toJson() const;

  /**
   * @brief Push logLevel to the process-wide logger
   */
  void applyLogLevel() const;

  bool operator==(const CodecConfig& other) const = default;
};

} // namespace RetroPak::core
