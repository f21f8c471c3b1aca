#include "sv2/certificate.hpp"
#include "sv2/crypto.hpp"
#include "sv2/log.hpp"
#include "sv2/util.hpp"

#include <iostream>
#include <string>

using namespace sv2;

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Usage: sv2-keygen <authority|static> <pubkey_out> <privkey_out>\n";
    std::cerr << "Keys are written as one base58 line each.\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  sv2-keygen authority authority-key.pub authority-key.priv\n";
    std::cerr << "  sv2-keygen static static-key.pub static-key.priv\n";
    return 1;
  }

  const std::string kind = argv[1];
  const std::string pk_out = argv[2];
  const std::string sk_out = argv[3];

  try {
    PublicKey pub{};
    SecureBytes priv;
    if (kind == "authority") {
      AuthorityKeyPair kp = AuthorityKeyPair::generate();
      pub = kp.pub.bytes;
      priv = std::move(kp.priv);
    } else if (kind == "static") {
      StaticKeyPair kp = StaticKeyPair::generate();
      pub = kp.pub;
      priv = std::move(kp.priv);
    } else {
      std::cerr << "key kind must be 'authority' or 'static'\n";
      return 1;
    }

    save_key(pk_out, pub.data(), pub.size());
    save_secret_key(sk_out, priv);

    std::cout << "OK\n";
    std::cout << "kind   : " << kind << "\n";
    std::cout << "pubkey : " << pk_out << " (" << encode_base58(pub.data(), pub.size()) << ")\n";
    std::cout << "seckey : " << sk_out << "\n";
    return 0;
  } catch (const std::exception& e) {
    logger()->error("keygen failed: {}", e.what());
    return 1;
  }
}
