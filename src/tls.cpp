// busq++ contributors

#include <busq++/log.hpp>
#include <busq++/tls.hpp>

#include <cstdio>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/decoder.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace Busq {

namespace {

using X509Ptr       = std::unique_ptr<X509, FnDeleter<X509, X509_free>>;
using PkeyPtr       = std::unique_ptr<EVP_PKEY, FnDeleter<EVP_PKEY, EVP_PKEY_free>>;
using PkeyCtxPtr    = std::unique_ptr<EVP_PKEY_CTX, FnDeleter<EVP_PKEY_CTX, EVP_PKEY_CTX_free>>;
using BioPtr        = std::unique_ptr<BIO, FnDeleter<BIO, BIO_free_all>>;
using DecoderCtxPtr = std::unique_ptr<OSSL_DECODER_CTX, FnDeleter<OSSL_DECODER_CTX, OSSL_DECODER_CTX_free>>;

constexpr uint32_t kHandshakeTimeoutMs = 10000;
constexpr size_t   kBioChunk           = 16384;
constexpr long     kCertValiditySecs   = 60L * 60 * 24 * 365 * 10;
constexpr int      kRsaBits            = 2048;

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

Error ssl_error(const std::string& what) {
    return Error(MobileDeviceError::SslError, what + ": " + openssl_error());
}

Error pairing_error(const std::string& what) {
    return Error(LockdownError::PairingFailed, what + ": " + openssl_error());
}

BioPtr mem_bio(const std::vector<uint8_t>& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

std::vector<uint8_t> bio_contents(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data) {
        return {};
    }
    return std::vector<uint8_t>(mem->data, mem->data + mem->length);
}

Result<PkeyPtr, Error> generate_rsa_key() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), kRsaBits) <= 0) {
        return Err(pairing_error("RSA keygen setup"));
    }
    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &key) <= 0 || !key) {
        return Err(pairing_error("RSA keygen"));
    }
    return Ok(PkeyPtr(key));
}

// Device keys arrive as PKCS#1 "RSA PUBLIC KEY" PEM
Result<PkeyPtr, Error> load_public_key(const std::vector<uint8_t>& pem) {
    EVP_PKEY*     key = nullptr;
    DecoderCtxPtr dctx(OSSL_DECODER_CTX_new_for_pkey(
        &key, "PEM", nullptr, "RSA", EVP_PKEY_PUBLIC_KEY, nullptr, nullptr));
    const unsigned char* p   = pem.data();
    size_t               len = pem.size();
    if (!dctx || OSSL_DECODER_from_data(dctx.get(), &p, &len) != 1 || !key) {
        return Err(pairing_error("decode DevicePublicKey"));
    }
    return Ok(PkeyPtr(key));
}

bool add_extension(X509* cert, X509* issuer, int nid, const char* value) {
    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value);
    if (!ext) {
        return false;
    }
    int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return rc == 1;
}

// issuer == nullptr makes a self-signed CA certificate
Result<X509Ptr, Error> make_certificate(EVP_PKEY* subject_key, EVP_PKEY* signing_key, X509* issuer) {
    X509Ptr cert(X509_new());
    if (!cert) {
        return Err(pairing_error("X509_new"));
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), kCertValiditySecs);
    X509_set_pubkey(cert.get(), subject_key);

    X509* signer = issuer ? issuer : cert.get();
    X509_set_issuer_name(cert.get(), X509_get_subject_name(signer));

    bool ok = true;
    if (!issuer) {
        ok = add_extension(cert.get(), signer, NID_basic_constraints, "critical,CA:TRUE");
    } else {
        ok = add_extension(cert.get(), signer, NID_basic_constraints, "critical,CA:FALSE") &&
             add_extension(cert.get(), signer, NID_key_usage,
                           "critical,digitalSignature,keyEncipherment");
    }
    ok = ok && add_extension(cert.get(), signer, NID_subject_key_identifier, "hash");
    if (!ok) {
        return Err(pairing_error("certificate extensions"));
    }
    if (X509_sign(cert.get(), signing_key, EVP_sha256()) <= 0) {
        return Err(pairing_error("X509_sign"));
    }
    return Ok(std::move(cert));
}

Result<std::vector<uint8_t>, Error> cert_pem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        return Err(pairing_error("PEM_write_bio_X509"));
    }
    return Ok(bio_contents(bio.get()));
}

Result<std::vector<uint8_t>, Error> key_pem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio ||
        PEM_write_bio_PrivateKey_traditional(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) !=
            1) {
        return Err(pairing_error("PEM_write_bio_PrivateKey"));
    }
    return Ok(bio_contents(bio.get()));
}

} // namespace

// -------- TlsChannel --------

Result<std::unique_ptr<TlsChannel>, Error> TlsChannel::create(const PairRecord& record) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return Err(ssl_error("SSL_CTX_new"));
    }
    // Devices still present 1024-bit SHA-1 era certificates
    SSL_CTX_set_security_level(ctx.get(), 0);
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_VERSION);
    SSL_CTX_set_cipher_list(ctx.get(), "ALL:!aNULL:!eNULL:@SECLEVEL=0");
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    auto    cert_bytes = record.host_certificate();
    BioPtr  cert_bio   = mem_bio(cert_bytes);
    X509Ptr cert(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if (!cert || SSL_CTX_use_certificate(ctx.get(), cert.get()) != 1) {
        return Err(ssl_error("load HostCertificate"));
    }

    auto    key_bytes = record.host_private_key();
    BioPtr  key_bio   = mem_bio(key_bytes);
    PkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
    if (!key || SSL_CTX_use_PrivateKey(ctx.get(), key.get()) != 1) {
        return Err(ssl_error("load HostPrivateKey"));
    }

    return Ok(std::unique_ptr<TlsChannel>(new TlsChannel(std::move(ctx))));
}

TlsChannel::~TlsChannel() {
    ssl_.reset();
}

Result<void, Error> TlsChannel::enable(Stream& raw) {
    if (ssl_) {
        return Ok();
    }
    SslPtr ssl(SSL_new(ctx_.get()));
    BIO*   in  = BIO_new(BIO_s_mem());
    BIO*   out = BIO_new(BIO_s_mem());
    if (!ssl || !in || !out) {
        BIO_free(in);
        BIO_free(out);
        return Err(ssl_error("SSL_new"));
    }
    SSL_set_bio(ssl.get(), in, out);
    SSL_set_connect_state(ssl.get());

    ssl_     = std::move(ssl);
    in_bio_  = in;
    out_bio_ = out;
    raw_     = &raw;

    for (;;) {
        int  rc     = SSL_do_handshake(ssl_.get());
        auto pushed = flush();
        if (pushed.is_err()) {
            ssl_.reset();
            return Err(std::move(pushed).unwrap_err());
        }
        if (rc == 1) {
            break;
        }
        int err = SSL_get_error(ssl_.get(), rc);
        if (err != SSL_ERROR_WANT_READ) {
            Error e = ssl_error("TLS handshake");
            ssl_.reset();
            return Err(e);
        }
        auto got = fill(kHandshakeTimeoutMs);
        if (got.is_err() || !got.unwrap()) {
            ssl_.reset();
            if (got.is_err()) {
                return Err(Error(MobileDeviceError::SslError,
                                 "TLS handshake: " + got.unwrap_err().to_string()));
            }
            return Err(Error(MobileDeviceError::SslError, "TLS handshake timed out"));
        }
    }
    logger()->debug("tls: {} established ({})", SSL_get_version(ssl_.get()),
                    SSL_get_cipher_name(ssl_.get()));
    return Ok();
}

Result<void, Error> TlsChannel::disable() {
    if (!ssl_) {
        return Ok();
    }
    SSL_shutdown(ssl_.get());
    auto pushed = flush();
    ssl_.reset();
    in_bio_  = nullptr;
    out_bio_ = nullptr;
    raw_     = nullptr;
    if (pushed.is_err()) {
        logger()->debug("tls: close_notify not delivered: {}", pushed.unwrap_err().to_string());
    }
    return Ok();
}

Result<size_t, Error> TlsChannel::send(const uint8_t* data, size_t len) {
    if (!ssl_) {
        return Err(Error(MobileDeviceError::SslError, "secure channel not enabled"));
    }
    if (len == 0) {
        return Ok(size_t{0});
    }
    int n = SSL_write(ssl_.get(), data, static_cast<int>(len));
    if (n <= 0) {
        return Err(ssl_error("SSL_write"));
    }
    auto pushed = flush();
    if (pushed.is_err()) {
        return Err(std::move(pushed).unwrap_err());
    }
    return Ok(static_cast<size_t>(n));
}

Result<size_t, Error>
TlsChannel::receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) {
    if (!ssl_) {
        return Err(Error(MobileDeviceError::SslError, "secure channel not enabled"));
    }
    for (;;) {
        int n = SSL_read(ssl_.get(), buf, static_cast<int>(len));
        if (n > 0) {
            return Ok(static_cast<size_t>(n));
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return Err(Error(MobileDeviceError::Disconnected, "peer closed the TLS session"));
        }
        if (err != SSL_ERROR_WANT_READ) {
            return Err(ssl_error("SSL_read"));
        }
        auto pushed = flush();
        if (pushed.is_err()) {
            return Err(std::move(pushed).unwrap_err());
        }
        auto got = fill(timeout_ms);
        if (got.is_err()) {
            return Err(std::move(got).unwrap_err());
        }
        if (!got.unwrap()) {
            return Ok(size_t{0});
        }
    }
}

Result<void, Error> TlsChannel::flush() {
    uint8_t tmp[kBioChunk];
    while (BIO_ctrl_pending(out_bio_) > 0) {
        int n = BIO_read(out_bio_, tmp, sizeof(tmp));
        if (n <= 0) {
            break;
        }
        size_t off = 0;
        while (off < static_cast<size_t>(n)) {
            auto sent = raw_->send(tmp + off, static_cast<size_t>(n) - off);
            if (sent.is_err()) {
                return Err(std::move(sent).unwrap_err());
            }
            if (sent.unwrap() == 0) {
                return Err(Error(MobileDeviceError::NotEnoughData, "raw stream accepted no bytes"));
            }
            off += sent.unwrap();
        }
    }
    return Ok();
}

Result<bool, Error> TlsChannel::fill(std::optional<uint32_t> timeout_ms) {
    uint8_t tmp[kBioChunk];
    auto    n = raw_->receive(tmp, sizeof(tmp), timeout_ms);
    if (n.is_err()) {
        return Err(std::move(n).unwrap_err());
    }
    if (n.unwrap() == 0) {
        return Ok(false);
    }
    BIO_write(in_bio_, tmp, static_cast<int>(n.unwrap()));
    return Ok(true);
}

// -------- Pairing material --------

std::string generate_host_id() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        for (auto& c : b) {
            c = static_cast<unsigned char>(std::rand());
        }
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);
    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11], b[12],
                  b[13], b[14], b[15]);
    return out;
}

Result<PairRecord, Error> generate_pair_record(const std::vector<uint8_t>& device_public_key,
                                               const std::string&          system_buid) {
    auto device_key = load_public_key(device_public_key);
    if (device_key.is_err()) {
        return Err(std::move(device_key).unwrap_err());
    }
    auto root_key = generate_rsa_key();
    if (root_key.is_err()) {
        return Err(std::move(root_key).unwrap_err());
    }
    auto host_key = generate_rsa_key();
    if (host_key.is_err()) {
        return Err(std::move(host_key).unwrap_err());
    }

    auto root_cert = make_certificate(root_key.unwrap().get(), root_key.unwrap().get(), nullptr);
    if (root_cert.is_err()) {
        return Err(std::move(root_cert).unwrap_err());
    }
    X509* root = root_cert.unwrap().get();
    auto  host_cert = make_certificate(host_key.unwrap().get(), root_key.unwrap().get(), root);
    if (host_cert.is_err()) {
        return Err(std::move(host_cert).unwrap_err());
    }
    auto dev_cert = make_certificate(device_key.unwrap().get(), root_key.unwrap().get(), root);
    if (dev_cert.is_err()) {
        return Err(std::move(dev_cert).unwrap_err());
    }

    struct Field {
        const char*                         key;
        Result<std::vector<uint8_t>, Error> pem;
    };
    Field fields[] = {
        {"DeviceCertificate", cert_pem(dev_cert.unwrap().get())},
        {"HostCertificate", cert_pem(host_cert.unwrap().get())},
        {"HostPrivateKey", key_pem(host_key.unwrap().get())},
        {"RootCertificate", cert_pem(root)},
        {"RootPrivateKey", key_pem(root_key.unwrap().get())},
    };

    Value record = Value::new_dict();
    for (auto& f : fields) {
        if (f.pem.is_err()) {
            return Err(f.pem.unwrap_err());
        }
        record.set(f.key, Value::from_data(f.pem.unwrap())).unwrap();
    }
    record.set("HostID", Value::from_string(generate_host_id())).unwrap();
    record.set("SystemBUID", Value::from_string(system_buid)).unwrap();
    logger()->info("pairing: generated new host identity");
    return PairRecord::from_value(std::move(record));
}

} // namespace Busq
