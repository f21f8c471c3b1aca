#include "sv2/util.hpp"
#include "sv2/error.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <limits>

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sv2 {

void secure_bzero(void* p, std::size_t n) {
  if (p && n) OPENSSL_cleanse(p, n);
}

SecureBytes::SecureBytes(std::size_t n) : b(n) {}
SecureBytes::SecureBytes(Bytes&& data) : b(std::move(data)) {}
SecureBytes::~SecureBytes() { secure_bzero(b.data(), b.size()); }
SecureBytes::SecureBytes(SecureBytes&& o) noexcept : b(std::move(o.b)) {}
SecureBytes& SecureBytes::operator=(SecureBytes&& o) noexcept {
  if (this != &o) {
    secure_bzero(b.data(), b.size());
    b = std::move(o.b);
  }
  return *this;
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  ensure(n <= (std::size_t)(std::numeric_limits<int>::max)(), ErrorCode::InvalidArgument,
         "rand_bytes request too large");
  ensure(RAND_bytes(out, (int)n) == 1, ErrorCode::CryptoFailure, "RAND_bytes failed");
}

std::uint32_t system_clock_unix() {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  if (secs < 0) return 0;
  if ((std::uint64_t)secs > (std::numeric_limits<std::uint32_t>::max)()) {
    return (std::numeric_limits<std::uint32_t>::max)();
  }
  return (std::uint32_t)secs;
}

// ------------------------------ base58 ------------------------------

static const char kBase58Alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string encode_base58(const std::uint8_t* data, std::size_t n) {
  std::size_t zeros = 0;
  while (zeros < n && data[zeros] == 0) ++zeros;

  // log(256) / log(58) ~= 1.366
  std::vector<std::uint8_t> digits((n - zeros) * 138 / 100 + 1, 0);
  std::size_t used = 0;
  for (std::size_t i = zeros; i < n; ++i) {
    unsigned carry = data[i];
    std::size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
      carry += 256u * (*it);
      *it = (std::uint8_t)(carry % 58);
      carry /= 58;
    }
    used = j;
  }

  auto it = digits.begin() + (std::ptrdiff_t)(digits.size() - used);
  while (it != digits.end() && *it == 0) ++it;
  std::string out(zeros, '1');
  for (; it != digits.end(); ++it) out.push_back(kBase58Alphabet[*it]);
  return out;
}

std::string encode_base58(const Bytes& data) {
  return encode_base58(data.data(), data.size());
}

Bytes decode_base58(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) ++begin;
  while (end > begin && (text[end - 1] == '\n' || text[end - 1] == '\r' ||
                         text[end - 1] == ' ' || text[end - 1] == '\t')) {
    --end;
  }

  std::size_t zeros = 0;
  while (begin + zeros < end && text[begin + zeros] == '1') ++zeros;

  // log(58) / log(256) ~= 0.733
  std::vector<std::uint8_t> b256((end - begin - zeros) * 733 / 1000 + 1, 0);
  std::size_t used = 0;
  for (std::size_t i = begin + zeros; i < end; ++i) {
    const char* pos = std::find(kBase58Alphabet, kBase58Alphabet + 58, text[i]);
    ensure(pos != kBase58Alphabet + 58, ErrorCode::InvalidArgument, "invalid base58 character");
    unsigned carry = (unsigned)(pos - kBase58Alphabet);
    std::size_t j = 0;
    for (auto it = b256.rbegin(); (carry != 0 || j < used) && it != b256.rend(); ++it, ++j) {
      carry += 58u * (*it);
      *it = (std::uint8_t)(carry % 256);
      carry /= 256;
    }
    used = j;
  }

  auto it = b256.end() - (std::ptrdiff_t)used;
  while (it != b256.end() && *it == 0) ++it;
  Bytes out(zeros, 0);
  out.insert(out.end(), it, b256.end());
  return out;
}

// ------------------------------ files ------------------------------

bool read_file(const std::string& path, Bytes& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  f.seekg(0, std::ios::end);
  std::streamsize n = f.tellg();
  if (n < 0) return false;
  f.seekg(0, std::ios::beg);
  out.resize((std::size_t)n);
  if (n > 0) f.read((char*)out.data(), n);
  return (bool)f;
}

bool write_file(const std::string& path, const Bytes& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  if (!data.empty()) f.write((const char*)data.data(), (std::streamsize)data.size());
  return (bool)f;
}

bool write_secret_file(const std::string& path, const SecureBytes& data) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) return false;
  bool ok = ::fchmod(fd, S_IRUSR | S_IWUSR) == 0;
  std::size_t off = 0;
  while (ok && off < data.b.size()) {
    ssize_t n = ::write(fd, data.b.data() + off, data.b.size() - off);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      ok = false;
      break;
    }
    off += (std::size_t)n;
  }
  if (::close(fd) != 0) ok = false;
  return ok;
}

} // namespace sv2
