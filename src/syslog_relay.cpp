// busq++ contributors

#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>
#include <busq++/syslog_relay.hpp>

#include <cctype>
#include <sstream>
#include <thread>

namespace Busq {

struct SyslogRelayClient::State {
    explicit State(Connection&& c) : conn(std::move(c)) {}

    Connection                           conn;
    std::atomic<bool>                    stop{false};
    std::atomic<bool>                    capturing{false};
    std::mutex                           worker_mutex;
    std::thread                          worker;
    CallbackRegistry<SyslogCharCallback> callbacks;
};

// -------- Anonymous Namespace for Helpers --------
namespace {

constexpr size_t   kChunkSize      = 4096;
constexpr uint32_t kPollIntervalMs = 500;

constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

Error remap(const Error& e) {
    if (e.is(MobileDeviceError::NotEnoughData)) {
        return Error(SyslogRelayError::NotEnoughData, e.to_string());
    }
    return remap_error(e, SyslogRelayError::MuxError, SyslogRelayError::SslError,
                       SyslogRelayError::Timeout, SyslogRelayError::MuxError,
                       SyslogRelayError::InvalidArgument);
}

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream       in(line);
    std::string              word;
    while (in >> word) {
        out.push_back(word);
    }
    return out;
}

bool all_digits(const std::string& s, size_t from, size_t len) {
    if (from + len > s.size()) {
        return false;
    }
    for (size_t i = from; i < from + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

bool is_timestamp(const std::string& month, const std::string& day, const std::string& time) {
    bool known_month = false;
    for (const char* m : kMonths) {
        if (month == m) {
            known_month = true;
            break;
        }
    }
    if (!known_month || day.empty() || day.size() > 2 || !all_digits(day, 0, day.size())) {
        return false;
    }
    // HH:mm:ss
    return time.size() == 8 && all_digits(time, 0, 2) && time[2] == ':' && all_digits(time, 3, 2) &&
           time[5] == ':' && all_digits(time, 6, 2);
}

void stop_worker(SyslogRelayClient::State& state) {
    state.stop = true;
    std::lock_guard<std::mutex> lock(state.worker_mutex);
    if (!state.worker.joinable()) {
        return;
    }
    if (state.worker.get_id() == std::this_thread::get_id()) {
        state.worker.detach();
    } else {
        state.worker.join();
    }
}

void capture_loop(std::shared_ptr<SyslogRelayClient::State> state, uint64_t token) {
    auto entry = state->callbacks.find(token);
    while (entry && !entry->cancelled && !state->stop) {
        auto chunk = state->conn.receive(kChunkSize, kPollIntervalMs);
        if (chunk.is_err()) {
            if (!chunk.unwrap_err().is(MobileDeviceError::Timeout)) {
                logger()->warn("syslog_relay: capture stopped: {}", chunk.unwrap_err().to_string());
                break;
            }
            continue;
        }
        logger()->trace("syslog_relay: {} bytes", chunk.unwrap().size());
        for (uint8_t b : chunk.unwrap()) {
            if (entry->cancelled || state->stop) {
                break;
            }
            if (b != 0) {
                entry->fn(static_cast<char>(b));
            }
        }
    }

    state->callbacks.take(token);
    entry.reset();
    state->capturing = false;
}

} // namespace

// -------- Line assembly --------

std::optional<SyslogMessage> SyslogLineAssembler::feed(char c) {
    if (c == '\0') {
        return std::nullopt;
    }
    if (c != '\n') {
        buffer_.push_back(c);
        return std::nullopt;
    }
    std::string line;
    line.swap(buffer_);
    return parse_line(line);
}

std::vector<SyslogMessage> SyslogLineAssembler::feed(const std::string& chunk) {
    std::vector<SyslogMessage> out;
    for (char c : chunk) {
        if (auto message = feed(c)) {
            out.push_back(std::move(*message));
        }
    }
    return out;
}

SyslogMessage SyslogLineAssembler::parse_line(const std::string& line) {
    SyslogMessage out;
    out.raw = line;
    while (!out.raw.empty() && (out.raw.back() == '\r' || out.raw.back() == '\n')) {
        out.raw.pop_back();
    }
    out.message = out.raw;

    auto words = split_words(out.raw);
    if (words.size() <= 5 || !is_timestamp(words[0], words[1], words[2])) {
        return out;
    }

    out.timestamp   = words[0] + " " + words[1] + " " + words[2];
    out.device_name = words[3];

    // process[pid], process(subsystem)[pid] or bare process
    const std::string& proc    = words[4];
    size_t             bracket = proc.find('[');
    out.process                = proc.substr(0, bracket);
    if (bracket != std::string::npos) {
        size_t close = proc.find(']', bracket);
        if (close != std::string::npos && close > bracket + 1 &&
            all_digits(proc, bracket + 1, close - bracket - 1)) {
            out.pid = static_cast<uint32_t>(std::stoul(proc.substr(bracket + 1, close - bracket - 1)));
        }
    }

    size_t first = 5;
    const std::string& tag = words[5];
    if (tag.size() > 3 && tag.front() == '<' && tag.compare(tag.size() - 2, 2, ">:") == 0) {
        out.level = tag.substr(1, tag.size() - 3);
        first     = 6;
    }

    out.message.clear();
    for (size_t i = first; i < words.size(); ++i) {
        if (i > first) {
            out.message += ' ';
        }
        out.message += words[i];
    }
    return out;
}

// -------- Factory Methods --------

Result<SyslogRelayClient, Error> SyslogRelayClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(adopt(std::move(conn).unwrap()));
}

Result<SyslogRelayClient, Error> SyslogRelayClient::start(Device& device, const std::string& label) {
    return start_service_client<SyslogRelayClient>(device, label);
}

SyslogRelayClient SyslogRelayClient::adopt(Connection&& conn) {
    return SyslogRelayClient(std::make_shared<State>(std::move(conn)));
}

SyslogRelayClient& SyslogRelayClient::operator=(SyslogRelayClient&& other) noexcept {
    if (this != &other) {
        free();
        state_ = std::move(other.state_);
    }
    return *this;
}

void SyslogRelayClient::free() noexcept {
    if (!state_) {
        return;
    }
    std::shared_ptr<State> state = std::move(state_);
    stop_worker(*state);
    if (!state->capturing) {
        state->conn.disconnect();
    }
}

// -------- Ops --------

bool SyslogRelayClient::capturing() const noexcept {
    return state_ && state_->capturing;
}

Result<Disposable, Error> SyslogRelayClient::start_capture(SyslogCharCallback callback) {
    if (!state_) {
        return Err(Error(SyslogRelayError::DeallocatedClient, "syslog relay client was released"));
    }
    if (!callback) {
        return Err(Error(SyslogRelayError::InvalidArgument, "capture callback is required"));
    }
    if (state_->capturing.exchange(true)) {
        return Err(Error(SyslogRelayError::InvalidArgument, "capture already running"));
    }

    uint64_t token = state_->callbacks.add(std::move(callback));
    {
        std::lock_guard<std::mutex> lock(state_->worker_mutex);
        if (state_->worker.joinable()) {
            state_->worker.join();
        }
        state_->stop   = false;
        state_->worker = std::thread(capture_loop, state_, token);
    }
    logger()->debug("syslog_relay: capture started");

    std::weak_ptr<State> weak = state_;
    return Ok(Disposable([weak, token]() {
        if (auto state = weak.lock()) {
            state->callbacks.cancel(token);
            state->callbacks.take(token);
        }
    }));
}

Result<Disposable, Error> SyslogRelayClient::start_capture_messages(SyslogMessageCallback callback) {
    if (!callback) {
        return Err(Error(SyslogRelayError::InvalidArgument, "capture callback is required"));
    }
    auto assembler = std::make_shared<SyslogLineAssembler>();
    return start_capture([assembler, callback](char c) {
        if (auto message = assembler->feed(c)) {
            callback(*message);
        }
    });
}

Result<void, Error> SyslogRelayClient::stop_capture() {
    if (!state_) {
        return Err(Error(SyslogRelayError::DeallocatedClient, "syslog relay client was released"));
    }
    stop_worker(*state_);
    logger()->debug("syslog_relay: capture stopped");
    return Ok();
}

Result<std::string, Error> SyslogRelayClient::receive(std::optional<uint32_t> timeout_ms) {
    if (!state_) {
        return Err(Error(SyslogRelayError::DeallocatedClient, "syslog relay client was released"));
    }
    if (state_->capturing) {
        return Err(Error(SyslogRelayError::InvalidArgument, "receive while capture is running"));
    }
    auto chunk = state_->conn.receive(kChunkSize, timeout_ms);
    if (chunk.is_err()) {
        return Err(remap(chunk.unwrap_err()));
    }
    std::string out;
    out.reserve(chunk.unwrap().size());
    for (uint8_t b : chunk.unwrap()) {
        if (b != 0) {
            out.push_back(static_cast<char>(b));
        }
    }
    return Ok(std::move(out));
}

} // namespace Busq
