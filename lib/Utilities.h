#ifndef FORKVOTE_UTILITIES_H
#define FORKVOTE_UTILITIES_H

#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace fv {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if the whole string parsed, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if the whole string parsed, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON value, or error if missing, unreadable or malformed
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a string to a file, replacing any previous content.
 * Creates parent directories if needed.
 * @param filePath Path to the file to write
 * @param content Content to write
 * @return Roe<void> indicating success or error
 */
Roe<void> writeToFile(const std::string &filePath, const std::string &content);

/**
 * Encode binary data as a lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

} // namespace utl
} // namespace fv

#endif // FORKVOTE_UTILITIES_H
