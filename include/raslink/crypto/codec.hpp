#pragma once

#include <raslink/common.hpp>

#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace raslink {
    namespace crypto {

        constexpr dp::usize KEY_SIZE = 32;
        constexpr dp::usize NONCE_SIZE = 12;
        constexpr dp::usize TAG_SIZE = 16;
        constexpr dp::usize SHA256_SIZE = 32;

        /// Key purposes understood by the daemon
        constexpr const char *PURPOSE_AUTH = "auth";

        inline dp::Res<Message> random_bytes(dp::usize count) {
            Message out(count);
            if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
                return dp::result::err(dp::Error::io_error("RAND_bytes failed"));
            }
            return dp::result::ok(std::move(out));
        }

        inline dp::Res<Message> hmac_sha256(const Message &key, const Message &data) {
            Message out(SHA256_SIZE);
            unsigned int out_len = 0;
            const unsigned char *result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(),
                                               data.size(), out.data(), &out_len);
            if (result == nullptr || out_len != SHA256_SIZE) {
                return dp::result::err(dp::Error::io_error("HMAC-SHA256 failed"));
            }
            return dp::result::ok(std::move(out));
        }

        struct PkeyCtxDeleter {
            void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
        };
        using PkeyCtx = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

        /// HKDF-SHA256 (RFC 5869) with an all-zero salt
        inline dp::Res<Message> hkdf_sha256(const Message &ikm, const Message &info, dp::usize length) {
            if (length == 0 || length > 255 * SHA256_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("invalid HKDF output length"));
            }

            PkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
            if (!ctx) {
                return dp::result::err(dp::Error::io_error("EVP_PKEY_CTX_new_id failed"));
            }

            Message salt(SHA256_SIZE, 0);
            if (EVP_PKEY_derive_init(ctx.get()) != 1 || EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
                EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) != 1 ||
                EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) != 1) {
                return dp::result::err(dp::Error::io_error("HKDF setup failed"));
            }
            if (!info.empty() &&
                EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())) != 1) {
                return dp::result::err(dp::Error::io_error("HKDF setup failed"));
            }

            Message okm(length);
            size_t out_len = length;
            if (EVP_PKEY_derive(ctx.get(), okm.data(), &out_len) != 1 || out_len != length) {
                secure_zero(okm);
                return dp::result::err(dp::Error::io_error("HKDF derive failed"));
            }
            return dp::result::ok(std::move(okm));
        }

        /// Derive a 32-byte purpose key from the 32-byte master secret
        inline dp::Res<Message> derive_key(const Message &master_secret, const dp::String &purpose) {
            if (master_secret.size() != KEY_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("master secret must be 32 bytes"));
            }
            return hkdf_sha256(master_secret, to_bytes(purpose), KEY_SIZE);
        }

        inline bool constant_time_equals(const Message &a, const Message &b) {
            if (a.size() != b.size()) {
                return false;
            }
            return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
        }

        struct CipherCtxDeleter {
            void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
        };
        using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

        /// AES-256-GCM message codec
        /// Frame: [nonce:12][ciphertext:N][tag:16], no associated data
        class BytesCodec {
          private:
            Message key_;

            explicit BytesCodec(Message key) : key_(std::move(key)) {}

          public:
            ~BytesCodec() { zero_key(); }

            BytesCodec(const BytesCodec &) = delete;
            BytesCodec &operator=(const BytesCodec &) = delete;

            /// Takes its own copy of the key
            static dp::Res<std::unique_ptr<BytesCodec>> create(const Message &key) {
                if (key.size() != KEY_SIZE) {
                    return dp::result::err(dp::Error::invalid_argument("key must be 32 bytes"));
                }
                return dp::result::ok(std::unique_ptr<BytesCodec>(new BytesCodec(Message(key.begin(), key.end()))));
            }

            dp::Res<Message> encode(const Message &plaintext) const {
                if (key_.size() != KEY_SIZE) {
                    return dp::result::err(dp::Error::invalid_argument("codec key was zeroed"));
                }

                auto nonce_res = random_bytes(NONCE_SIZE);
                if (nonce_res.is_err()) {
                    return nonce_res;
                }

                CipherCtx ctx(EVP_CIPHER_CTX_new());
                if (!ctx) {
                    return dp::result::err(dp::Error::io_error("EVP_CIPHER_CTX_new failed"));
                }

                Message out = std::move(nonce_res.value());
                out.resize(NONCE_SIZE + plaintext.size() + TAG_SIZE);

                int len = 0;
                if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
                    EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
                    EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), out.data()) != 1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM init failed"));
                }

                dp::u8 *cipher = out.data() + NONCE_SIZE;
                if (!plaintext.empty() &&
                    EVP_EncryptUpdate(ctx.get(), cipher, &len, plaintext.data(), static_cast<int>(plaintext.size())) !=
                        1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM encrypt failed"));
                }
                int final_len = 0;
                if (EVP_EncryptFinal_ex(ctx.get(), cipher + len, &final_len) != 1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM finalize failed"));
                }
                if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                                        out.data() + NONCE_SIZE + plaintext.size()) != 1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM tag failed"));
                }

                return dp::result::ok(std::move(out));
            }

            /// Authentication failure (tampering, wrong key) is invalid_argument
            dp::Res<Message> decode(const Message &frame) const {
                if (key_.size() != KEY_SIZE) {
                    return dp::result::err(dp::Error::invalid_argument("codec key was zeroed"));
                }
                if (frame.size() < NONCE_SIZE + TAG_SIZE) {
                    return dp::result::err(dp::Error::invalid_argument("ciphertext too short"));
                }

                CipherCtx ctx(EVP_CIPHER_CTX_new());
                if (!ctx) {
                    return dp::result::err(dp::Error::io_error("EVP_CIPHER_CTX_new failed"));
                }

                const dp::usize cipher_len = frame.size() - NONCE_SIZE - TAG_SIZE;
                const dp::u8 *nonce = frame.data();
                const dp::u8 *cipher = frame.data() + NONCE_SIZE;
                Message tag(frame.end() - TAG_SIZE, frame.end());

                if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
                    EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
                    EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM init failed"));
                }

                Message plain(cipher_len);
                int len = 0;
                if (cipher_len > 0 &&
                    EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher, static_cast<int>(cipher_len)) != 1) {
                    return dp::result::err(dp::Error::invalid_argument("AES-GCM decrypt failed"));
                }
                if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
                    return dp::result::err(dp::Error::io_error("AES-GCM set tag failed"));
                }
                int final_len = 0;
                if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + len, &final_len) != 1) {
                    return dp::result::err(dp::Error::invalid_argument("authentication tag mismatch"));
                }

                return dp::result::ok(std::move(plain));
            }

            /// Overwrite the key; the codec refuses to work afterwards
            void zero_key() {
                secure_zero(key_);
                key_.clear();
            }

            bool has_key() const { return key_.size() == KEY_SIZE; }
        };

    } // namespace crypto
} // namespace raslink
