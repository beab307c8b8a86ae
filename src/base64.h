#ifndef PHOTOSYNC_BASE64_H
#define PHOTOSYNC_BASE64_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace photosync {
namespace Base64 {

    inline std::string encode(const uint8_t* data, size_t len) {
        if (len == 0)
            return {};
        std::string output(4 * ((len + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                                      data, static_cast<int>(len));
        output.resize(written < 0 ? 0 : static_cast<size_t>(written));
        return output;
    }

    inline std::string encode(const std::vector<uint8_t>& input) {
        return encode(input.data(), input.size());
    }

    inline std::string encode(const std::string& input) {
        return encode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
    }

    // Returns nullopt on characters outside the alphabet or a bad length.
    inline std::optional<std::vector<uint8_t>> decode(const std::string& input) {
        if (input.empty())
            return std::vector<uint8_t>{};
        if (input.size() % 4 != 0)
            return std::nullopt;

        std::vector<uint8_t> output(3 * (input.size() / 4));
        int n = EVP_DecodeBlock(output.data(),
                                reinterpret_cast<const unsigned char*>(input.data()),
                                static_cast<int>(input.size()));
        if (n < 0)
            return std::nullopt;

        // EVP_DecodeBlock does not strip the bytes produced by '=' padding.
        size_t padding = 0;
        if (input[input.size() - 1] == '=') ++padding;
        if (input[input.size() - 2] == '=') ++padding;
        output.resize(static_cast<size_t>(n) - padding);
        return output;
    }
}
} // namespace photosync

#endif // PHOTOSYNC_BASE64_H
