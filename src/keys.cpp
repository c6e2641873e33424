#include "numscull/keys.hpp"

#include <sodium.h>

namespace Numscull {

SecretKey::~SecretKey() {
    sodium_memzero(data.data(), data.size());
}

} // namespace Numscull
