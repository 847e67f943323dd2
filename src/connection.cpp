// busq++ contributors

#include <busq++/connection.hpp>
#include <busq++/log.hpp>

namespace Busq {

Result<size_t, Error> Connection::send(const uint8_t* data, size_t len) {
    if (!stream_) {
        return Err(Error::Disconnected());
    }
    if (!data && len > 0) {
        return Err(Error::InvalidArgument("null send buffer"));
    }
    if (security_ && security_->enabled()) {
        return security_->send(data, len);
    }
    return stream_->send(data, len);
}

Result<void, Error> Connection::send_all(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        auto n = send(data + sent, len - sent);
        if (n.is_err()) {
            return Err(std::move(n).unwrap_err());
        }
        if (n.unwrap() == 0) {
            return Err(Error(MobileDeviceError::NotEnoughData, "stream accepted no bytes"));
        }
        sent += n.unwrap();
    }
    logger()->trace("connection: sent {} bytes", len);
    return Ok();
}

Result<void, Error> Connection::send_all(const std::vector<uint8_t>& data) {
    return send_all(data.data(), data.size());
}

Result<std::vector<uint8_t>, Error> Connection::receive(size_t                  max,
                                                        std::optional<uint32_t> timeout_ms) {
    if (!stream_) {
        return Err(Error::Disconnected());
    }
    std::vector<uint8_t>  buf(max);
    Result<size_t, Error> n = (security_ && security_->enabled())
                                  ? security_->receive(buf.data(), max, timeout_ms)
                                  : stream_->receive(buf.data(), max, timeout_ms);
    if (n.is_err()) {
        return Err(std::move(n).unwrap_err());
    }
    buf.resize(n.unwrap());
    return Ok(std::move(buf));
}

Result<std::vector<uint8_t>, Error> Connection::receive_exact(size_t                  n,
                                                              std::optional<uint32_t> timeout_ms) {
    std::vector<uint8_t> out;
    out.reserve(n);
    while (out.size() < n) {
        auto chunk = receive(n - out.size(), timeout_ms);
        if (chunk.is_err()) {
            return Err(std::move(chunk).unwrap_err());
        }
        auto& bytes = chunk.unwrap();
        if (bytes.empty()) {
            if (out.empty()) {
                return Err(Error(MobileDeviceError::Timeout, "no data before timeout"));
            }
            return Err(Error(MobileDeviceError::NotEnoughData,
                             "got " + std::to_string(out.size()) + " of " + std::to_string(n) +
                                 " bytes before timeout"));
        }
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return Ok(std::move(out));
}

void Connection::set_security(std::unique_ptr<SecureChannel> security) {
    if (security_ && security_->enabled()) {
        logger()->warn("connection: replacing an active secure channel");
        auto r = security_->disable();
        if (r.is_err()) {
            logger()->debug("connection: disable before replace failed: {}",
                            r.unwrap_err().to_string());
        }
    }
    security_ = std::move(security);
}

Result<void, Error> Connection::enable_security() {
    if (!stream_) {
        return Err(Error::Disconnected());
    }
    if (!security_) {
        return Err(Error(MobileDeviceError::SslError, "no secure channel configured"));
    }
    if (security_->enabled()) {
        return Ok();
    }
    return security_->enable(*stream_);
}

Result<void, Error> Connection::disable_security() {
    if (!stream_) {
        return Err(Error::Disconnected());
    }
    if (!security_ || !security_->enabled()) {
        return Ok();
    }
    return security_->disable();
}

bool Connection::security_enabled() const noexcept {
    return security_ && security_->enabled();
}

Result<int, Error> Connection::fd() const {
    if (!stream_) {
        return Err(Error::Disconnected());
    }
    return Ok(stream_->fd());
}

void Connection::disconnect() noexcept {
    security_.reset();
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

} // namespace Busq
