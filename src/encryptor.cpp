#include "sv2/encryptor.hpp"
#include "sv2/error.hpp"
#include "sv2/log.hpp"
#include <utility>

namespace sv2 {

ConnectionEncryptor::ConnectionEncryptor(Role role, CipherState send, CipherState recv,
                                         const Hash& h, const EncryptorConfig& cfg)
  : role_(role), send_(std::move(send)), recv_(std::move(recv)), h_(h), cfg_(cfg) {
  ensure(send_.has_key() && recv_.has_key(), ErrorCode::InvalidArgument,
         "encryptor needs both directional keys");
}

std::size_t ConnectionEncryptor::encrypted_frame_size(std::size_t payload_len) {
  std::size_t chunks = (payload_len + kMaxChunkPlaintextLen - 1) / kMaxChunkPlaintextLen;
  return kEncryptedHeaderLen + payload_len + chunks * kTagLen;
}

void ConnectionEncryptor::poison(ErrorCode code, const char* msg) {
  poisoned_ = true;
  pending_header_.reset();
  logger()->warn("connection encryptor poisoned: {}", msg);
  throw Error(code, msg);
}

// ------------------------------ send ------------------------------

Bytes ConnectionEncryptor::seal(const std::uint8_t* pt, std::size_t n) {
  Bytes ct = send_.encrypt_with_ad(nullptr, 0, pt, n);
  ++sent_messages_;
  if (cfg_.rekey_interval && sent_messages_ % cfg_.rekey_interval == 0) {
    send_.rekey();
    logger()->debug("rekeyed send cipher after {} messages", sent_messages_);
  }
  return ct;
}

Bytes ConnectionEncryptor::encrypt(const Frame& f) {
  ensure(!poisoned_, ErrorCode::DecryptionFailed, "encryptor is poisoned");
  ensure(f.payload_length() <= cfg_.max_payload_len, ErrorCode::PayloadTooLarge,
         "frame payload exceeds cap");

  const Bytes& payload = f.payload();
  std::uint64_t chunks = (payload.size() + kMaxChunkPlaintextLen - 1) / kMaxChunkPlaintextLen;
  // Refuse up front rather than emit a partial frame
  ensure(kReservedNonce - send_.nonce() >= chunks + 1, ErrorCode::NonceExhausted,
         "not enough send nonces left for this frame");

  Bytes out;
  out.reserve(encrypted_frame_size(payload.size()));

  auto hdr = encode_header(f.header());
  Bytes sealed = seal(hdr.data(), hdr.size());
  out.insert(out.end(), sealed.begin(), sealed.end());

  for (std::size_t off = 0; off < payload.size(); off += kMaxChunkPlaintextLen) {
    std::size_t n = payload.size() - off;
    if (n > kMaxChunkPlaintextLen) n = kMaxChunkPlaintextLen;
    sealed = seal(payload.data() + off, n);
    out.insert(out.end(), sealed.begin(), sealed.end());
  }
  return out;
}

// ------------------------------ receive ------------------------------

Bytes ConnectionEncryptor::open(const std::uint8_t* ct, std::size_t n) {
  Bytes pt;
  if (!recv_.decrypt_with_ad(nullptr, 0, ct, n, pt)) {
    poison(ErrorCode::DecryptionFailed, "authentication tag mismatch");
  }
  ++received_messages_;
  if (cfg_.rekey_interval && received_messages_ % cfg_.rekey_interval == 0) {
    recv_.rekey();
    logger()->debug("rekeyed receive cipher after {} messages", received_messages_);
  }
  return pt;
}

FrameHeader ConnectionEncryptor::open_header(const std::uint8_t* ct) {
  Bytes pt = open(ct, kEncryptedHeaderLen);
  auto h = peek_header(pt.data(), pt.size());
  if (!h) poison(ErrorCode::DecryptionFailed, "decrypted header is short");
  if (h->payload_length > cfg_.max_payload_len) {
    poison(ErrorCode::PayloadTooLarge, "declared payload length exceeds cap");
  }
  return *h;
}

// `ct` holds exactly the encrypted chunks of the frame described by `h`
Frame ConnectionEncryptor::open_payload(const FrameHeader& h, const std::uint8_t* ct,
                                        std::size_t len) {
  Bytes payload;
  payload.reserve(h.payload_length);
  std::size_t left = h.payload_length;
  std::size_t off = 0;
  while (left > 0) {
    std::size_t n = left < kMaxChunkPlaintextLen ? left : kMaxChunkPlaintextLen;
    if (len - off < n + kTagLen) poison(ErrorCode::DecryptionFailed, "encrypted frame truncated");
    Bytes chunk = open(ct + off, n + kTagLen);
    payload.insert(payload.end(), chunk.begin(), chunk.end());
    off += n + kTagLen;
    left -= n;
  }
  return Frame(h.extension_type, h.message_type, std::move(payload));
}

Frame ConnectionEncryptor::decrypt(const std::uint8_t* data, std::size_t len) {
  ensure(!poisoned_, ErrorCode::DecryptionFailed, "encryptor is poisoned");
  ensure(!pending_header_, ErrorCode::InvalidArgument, "a streaming read is in progress");
  if (len < kEncryptedHeaderLen) poison(ErrorCode::DecryptionFailed, "encrypted frame truncated");

  FrameHeader h = open_header(data);
  std::size_t total = encrypted_frame_size(h.payload_length);
  if (len != total) {
    poison(ErrorCode::DecryptionFailed,
           len < total ? "encrypted frame truncated" : "trailing bytes after encrypted frame");
  }
  return open_payload(h, data + kEncryptedHeaderLen, len - kEncryptedHeaderLen);
}

EncryptedReadResult ConnectionEncryptor::read(const std::uint8_t* data, std::size_t len) {
  ensure(!poisoned_, ErrorCode::DecryptionFailed, "encryptor is poisoned");
  if (!pending_header_) {
    if (len < kEncryptedHeaderLen) return Incomplete{kEncryptedHeaderLen - len};
    pending_header_ = open_header(data);
  }

  std::size_t total = encrypted_frame_size(pending_header_->payload_length);
  if (len < total) return Incomplete{total - len};

  FrameHeader h = *pending_header_;
  pending_header_.reset();
  Frame f = open_payload(h, data + kEncryptedHeaderLen, total - kEncryptedHeaderLen);
  return DecryptedFrame{std::move(f), total};
}

} // namespace sv2
