#ifndef ICPT_LEDGER_UTILITIES_H
#define ICPT_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace icpt {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in nanoseconds since the epoch
 * @return Current time in nanoseconds
 */
uint64_t getCurrentTimeNanos();

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON object or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Parse a JSON request and check that it carries a string "type" field
 * @param request The JSON request string to parse
 * @return Parsed request object or error
 */
Roe<nlohmann::json> parseJsonRequest(const std::string &request);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Return a string safe for JSON (printable ASCII). Otherwise returns
 * "0x" + hexEncode(input) so the receiver can hexDecode.
 */
std::string toJsonSafeString(const std::string &s);

/**
 * Reverse of toJsonSafeString: if string starts with "0x", hex-decode the rest.
 * @return Decoded binary, original string, or empty string for bad hex
 */
std::string fromJsonSafeString(const std::string &s);

/**
 * Read the whole content of a file
 * @param filePath Path to the file
 * @return File content or error
 */
Roe<std::string> readFile(const std::string &filePath);

/**
 * Replace a file's content atomically.
 * Content goes to "<filePath>.tmp" first, is fsync'ed, and is then renamed
 * over filePath; the parent directory is synced after the rename. Parent
 * directories are created if needed.
 * @return Roe<void> indicating success or error
 */
Roe<void> writeFileAtomic(const std::string &filePath,
                          const std::string &content);

} // namespace utl
} // namespace icpt

#endif // ICPT_LEDGER_UTILITIES_H
