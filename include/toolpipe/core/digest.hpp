#pragma once

#include <string>
#include <string_view>

namespace toolpipe::core {

// Lowercase hex MD5 of raw bytes (OpenSSL EVP)
std::string md5_hex(std::string_view data);

}  // namespace toolpipe::core
