#ifndef POOL_LEDGER_UTILITIES_H
#define POOL_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse a 64-bit signed integer from a string
 * @param str String to parse (whole string must be consumed)
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt64(const std::string &str, int64_t &value);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON document or error
 */
pl::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a string to a file, replacing any previous content.
 * Creates parent directories if needed.
 */
pl::Roe<void> writeToFile(const std::string &filePath,
                          const std::string &content);

/**
 * Compute the SHA-256 digest using libsodium
 * @param input Input bytes
 * @return Raw 32-byte digest
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256Digest(const std::string &input);

/**
 * Encode binary data as lowercase hex (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

} // namespace utl
} // namespace pl

#endif // POOL_LEDGER_UTILITIES_H
