#include "Utilities.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace icpt {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

uint64_t getCurrentTimeNanos() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  auto content = readFile(path);
  if (!content) {
    return Error(2, content.error().message);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(*content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " +
                        std::string(e.what()));
  }

  return j;
}

Roe<nlohmann::json> parseJsonRequest(const std::string &request) {
  nlohmann::json reqJson;
  try {
    reqJson = nlohmann::json::parse(request);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Failed to parse request JSON: " + std::string(e.what()));
  }

  if (!reqJson.is_object() || !reqJson.contains("type")) {
    return Error(2, "missing type field");
  }
  if (!reqJson["type"].is_string()) {
    return Error(3, "type field must be a string");
  }

  return reqJson;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(
      std::string(reinterpret_cast<const char *>(hash), sizeof(hash)));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string toJsonSafeString(const std::string &s) {
  // A printable string that itself starts with "0x" would be decoded on the
  // way back, so it is hex encoded as well
  bool needsHex = s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
  for (unsigned char c : s) {
    if (c >= 127 || c < 32) {
      needsHex = true;
      break;
    }
  }
  return needsHex ? "0x" + hexEncode(s) : s;
}

std::string fromJsonSafeString(const std::string &s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    return hexDecode(s.substr(2));
  }
  return s;
}

Roe<std::string> readFile(const std::string &filePath) {
  std::ifstream f(filePath, std::ios::binary);
  if (!f) {
    return Error(1, "Cannot open file: " + filePath);
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!f) {
    return Error(2, "Failed to read file: " + filePath);
  }
  return oss.str();
}

Roe<void> writeFileAtomic(const std::string &filePath,
                          const std::string &content) {
  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  std::error_code ec;
  if (!parentDir.empty() && !std::filesystem::exists(parentDir, ec)) {
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::string tmpPath = filePath + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(2, "Failed to open file for writing: " + tmpPath);
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return Error(3, "Failed to write content to file: " + tmpPath);
    }
  }

  // Contents must be on disk before the rename makes them visible
  int fd = ::open(tmpPath.c_str(), O_RDONLY);
  if (fd < 0 || ::fsync(fd) != 0) {
    std::string reason = std::strerror(errno);
    if (fd >= 0) {
      ::close(fd);
    }
    std::filesystem::remove(tmpPath, ec);
    return Error(5, "Failed to sync " + tmpPath + ": " + reason);
  }
  ::close(fd);

  std::filesystem::rename(tmpPath, path, ec);
  if (ec) {
    std::string reason = ec.message();
    std::filesystem::remove(tmpPath, ec);
    return Error(4, "Failed to replace " + filePath + ": " + reason);
  }

  // Persist the directory entry as well
  std::string dirPath = parentDir.empty() ? "." : parentDir.string();
  int dirFd = ::open(dirPath.c_str(), O_RDONLY | O_DIRECTORY);
  if (dirFd < 0) {
    return Error(6, "Failed to open directory " + dirPath + ": " +
                        std::strerror(errno));
  }
  int rc = ::fsync(dirFd);
  std::string reason = rc != 0 ? std::strerror(errno) : "";
  ::close(dirFd);
  if (rc != 0) {
    return Error(6, "Failed to sync directory " + dirPath + ": " + reason);
  }
  return {};
}

} // namespace utl
} // namespace icpt
