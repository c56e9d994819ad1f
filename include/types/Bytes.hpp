#pragma once

#include <cstdint>
#include <vector>

namespace cw::types {

// Opaque binary payload (ciphertext, initialization vector). Never interpreted here.
using Bytes = std::vector<uint8_t>;

}
