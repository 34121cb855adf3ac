#include "common/digest.hpp"

#include <array>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

std::string short_digest(std::string_view data, std::size_t hex_chars) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;

    if (EVP_Digest(data.data(), data.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1) {
        // 해시 실패는 감사 키 누락일 뿐, 판정에는 영향 없음
        spdlog::warn("digest: EVP_Digest(sha256) failed");
        return std::string(hex_chars, '0');
    }

    std::string out;
    out.reserve(static_cast<std::size_t>(md_len) * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(kHex[md[i] >> 4]);
        out.push_back(kHex[md[i] & 0x0F]);
    }
    if (hex_chars < out.size()) {
        out.resize(hex_chars);
    }
    return out;
}
