#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace mender::hash {

// CRC32C checksum. Cheap enough to compute for every line of every
// rescanned buffer; only ever used as an equality pre-check.
uint32_t
hash(const char* input, std::size_t len);

uint32_t
hash(std::string_view text);

}  // namespace mender::hash
