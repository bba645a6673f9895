#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace renterd::network {

std::string Base64Encode(const uint8_t* input, size_t length);

// Value of an "Authorization: Basic ..." header.
std::string BasicAuthorization(std::string_view user, std::string_view password);

}  // namespace renterd::network
