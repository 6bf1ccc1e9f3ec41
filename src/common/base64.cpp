#include "common/base64.hpp"
#include <sodium.h>

namespace livegate {

std::string base64_encode(std::string_view data) {
    size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(b64_len, '\0');
    sodium_bin2base64(result.data(), b64_len,
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // Remove null terminator
    if (!result.empty() && result.back() == '\0') {
        result.pop_back();
    }
    return result;
}

std::optional<std::string> base64_decode(std::string_view b64) {
    std::string out(b64.size() / 4 * 3 + 3, '\0');
    size_t bin_len = 0;
    const char* end = nullptr;
    int ret = sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                                b64.data(), b64.size(),
                                "\r\n ", &bin_len, &end, sodium_base64_VARIANT_ORIGINAL);
    if (ret != 0 || end != b64.data() + b64.size()) {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

} // namespace livegate
