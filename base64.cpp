#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "base64.h"

std::string MkToken::Base64::Encode(const std::vector<uint8_t> &bytes) {
    using namespace boost::archive::iterators;
    using Base64Encoder = base64_from_binary<transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;
    return std::string(Base64Encoder(bytes.begin()), Base64Encoder(bytes.end()));
}
