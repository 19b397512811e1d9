#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

namespace craftkit::utils {

class HashUtils {
public:
    static std::vector<uint8_t> sha256(const std::string& data) {
        std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
        return hash;
    }

    static std::string base64Encode(const std::vector<uint8_t>& data) {
        BIO* bio = BIO_new(BIO_s_mem());
        BIO* b64 = BIO_new(BIO_f_base64());
        bio = BIO_push(b64, bio);

        BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
        BIO_write(bio, data.data(), static_cast<int>(data.size()));
        BIO_flush(bio);

        BUF_MEM* bufferPtr = nullptr;
        BIO_get_mem_ptr(bio, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);

        BIO_free_all(bio);

        return result;
    }

    /**
     * RFC 4648 section 5 alphabet, padding stripped
     */
    static std::string base64UrlEncode(const std::vector<uint8_t>& data) {
        std::string encoded = base64Encode(data);
        while (!encoded.empty() && encoded.back() == '=') {
            encoded.pop_back();
        }
        for (char& c : encoded) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return encoded;
    }

    static std::vector<uint8_t> randomBytes(size_t length) {
        std::vector<uint8_t> bytes(length);
        if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        return bytes;
    }
};

} // namespace craftkit::utils
