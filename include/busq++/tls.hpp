// busq++ contributors

#pragma once

#include <busq++/connection.hpp>
#include <busq++/pair_record.hpp>
#include <busq++/secure_channel.hpp>

#include <memory>
#include <openssl/ssl.h>
#include <string>
#include <vector>

namespace Busq {

using SslCtxPtr = std::unique_ptr<SSL_CTX, FnDeleter<SSL_CTX, SSL_CTX_free>>;
using SslPtr    = std::unique_ptr<SSL, FnDeleter<SSL, SSL_free>>;

// OpenSSL client channel authenticated with the host certificate of a pair
// record. TLS records travel through a memory BIO pair so any Stream works.
class TlsChannel : public SecureChannel {
  public:
    static Result<std::unique_ptr<TlsChannel>, Error> create(const PairRecord& record);

    Result<void, Error>   enable(Stream& raw) override;
    Result<void, Error>   disable() override;
    bool                  enabled() const noexcept override { return ssl_ != nullptr; }

    Result<size_t, Error> send(const uint8_t* data, size_t len) override;
    Result<size_t, Error>
    receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) override;

    ~TlsChannel() override;
    TlsChannel(const TlsChannel&)            = delete;
    TlsChannel& operator=(const TlsChannel&) = delete;

  private:
    explicit TlsChannel(SslCtxPtr ctx) noexcept : ctx_(std::move(ctx)) {}

    // Moves pending ciphertext from the engine to the raw stream
    Result<void, Error> flush();
    // Feeds ciphertext from the raw stream into the engine; false on timeout
    Result<bool, Error> fill(std::optional<uint32_t> timeout_ms);

    SslCtxPtr ctx_;
    SslPtr    ssl_;
    BIO*      in_bio_  = nullptr; // owned by ssl_
    BIO*      out_bio_ = nullptr; // owned by ssl_
    Stream*   raw_     = nullptr;
};

// Builds a fresh pair record (root, host and device certificates) for a device
// public key as returned by lockdown's DevicePublicKey value.
Result<PairRecord, Error> generate_pair_record(const std::vector<uint8_t>& device_public_key,
                                               const std::string&          system_buid);

std::string generate_host_id();

} // namespace Busq
