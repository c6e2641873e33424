#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"

#include <iostream>
#include <string>

// Provisions a Numscull identity.
// Usage: keygen_example <identity> <config_dir>
//
// Writes <config_dir>/identities/<identity> (public key followed by secret key)
// and <config_dir>/users/<identity>.pub, the file a server is given to trust
// the identity.

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <identity> <config_dir>" << std::endl;
        return 2;
    }
    const std::string identity = argv[1];
    const std::string config_dir = argv[2];

    // 1. Initialize the crypto library
    if (Numscull::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // 2. Generate and store the key pair
    auto keypair = Numscull::Crypto::generate_keypair();
    try {
        Numscull::Crypto::write_keypair(identity, config_dir, keypair);
    } catch (const Numscull::Exception& e) {
        std::cerr << "[" << Numscull::to_string(e.kind()) << "] " << e.what() << std::endl;
        return 1;
    }

    // 3. Print the public key the way the server expects it in control/add/user/server
    const Numscull::byte_vector pk(keypair.publicKey.data.begin(), keypair.publicKey.data.end());
    std::cout << "Wrote " << Numscull::Crypto::identity_path(identity, config_dir) << std::endl;
    std::cout << "Public key: " << Numscull::Crypto::base64_encode(pk) << std::endl;
    return 0;
}
