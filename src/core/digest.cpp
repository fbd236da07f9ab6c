#include "toolpipe/core/digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace toolpipe::core {

namespace {

std::string evp_hex(const EVP_MD* md, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &length, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        stream << std::setw(2) << static_cast<int>(digest[i]);
    }
    return stream.str();
}

}  // namespace

std::string md5_hex(std::string_view data) {
    return evp_hex(EVP_md5(), data);
}

}  // namespace toolpipe::core
