#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace MkToken::Base64 {
    // standard alphabet, no '=' padding
    std::string Encode(const std::vector<uint8_t> &bytes);
}
