// busq++ contributors

#include <busq++/afc.hpp>
#include <busq++/house_arrest.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace Busq {

namespace fs = std::filesystem;

namespace {

constexpr uint64_t kMagic          = 0x4141504c36414643ULL; // "CFA6LPAA"
constexpr size_t   kHeaderSize     = 40;
constexpr uint64_t kMaxPacketSize  = 64ULL * 1024 * 1024;
constexpr size_t   kReadAllChunk   = 10000;
constexpr size_t   kWriteChunk     = 100 * 1024;

enum Op : uint64_t {
    OpStatus                = 1,
    OpData                  = 2,
    OpReadDir               = 3,
    OpTruncate              = 7,
    OpRemovePath            = 8,
    OpMakeDir               = 9,
    OpGetFileInfo           = 10,
    OpGetDevInfo            = 11,
    OpFileOpen              = 13,
    OpFileOpenRes           = 14,
    OpFileRead              = 15,
    OpFileWrite             = 16,
    OpFileSeek              = 17,
    OpFileTell              = 18,
    OpFileTellRes           = 19,
    OpFileClose             = 20,
    OpFileSetSize           = 21,
    OpRenamePath            = 24,
    OpFileLock              = 27,
    OpMakeLink              = 28,
    OpSetFileModTime        = 30,
    OpRemovePathAndContents = 34,
};

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void put_path(std::vector<uint8_t>& out, const std::string& path) {
    out.insert(out.end(), path.begin(), path.end());
    out.push_back(0);
}

std::vector<uint8_t> path_args(const std::string& path) {
    std::vector<uint8_t> out;
    put_path(out, path);
    return out;
}

std::vector<uint8_t> handle_args(uint64_t handle) {
    std::vector<uint8_t> out;
    put_u64(out, handle);
    return out;
}

// NUL separated strings; a trailing empty entry is dropped
std::vector<std::string> split_nul(const std::vector<uint8_t>& data) {
    std::vector<std::string> out;
    size_t                   start = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] == 0) {
            out.emplace_back(reinterpret_cast<const char*>(data.data()) + start, i - start);
            start = i + 1;
        }
    }
    if (start < data.size()) {
        out.emplace_back(reinterpret_cast<const char*>(data.data()) + start, data.size() - start);
    }
    return out;
}

AfcInfo to_info(const std::vector<uint8_t>& data) {
    auto    flat = split_nul(data);
    AfcInfo out;
    for (size_t i = 0; i + 1 < flat.size(); i += 2) {
        out[flat[i]] = flat[i + 1];
    }
    return out;
}

Error remap(const Error& e) {
    return remap_error(e, AfcError::MuxError, AfcError::MuxError, AfcError::OpTimeout,
                       AfcError::UnknownError, AfcError::InvalidArg);
}

Error deallocated() {
    return Error(AfcError::DeallocatedClient, "afc client was released");
}

bool writable(AfcFileMode mode) {
    return mode != AfcFileMode::ReadOnly;
}

std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

} // namespace

// -------- Factory Methods --------

Result<AfcClient, Error> AfcClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(AfcClient(std::move(conn).unwrap()));
}

Result<AfcClient, Error> AfcClient::start(Device& device, const std::string& label) {
    return start_service_client<AfcClient>(device, label);
}

Result<AfcClient, Error> AfcClient::from_house_arrest(HouseArrestClient& client) {
    auto conn = client.into_afc_connection();
    if (conn.is_err()) {
        return Err(Error(AfcError::InvalidArg, conn.unwrap_err().to_string()));
    }
    return Ok(AfcClient(std::move(conn).unwrap()));
}

void AfcClient::free() noexcept {
    if (conn_) {
        conn_->disconnect();
        conn_.reset();
    }
    handles_.clear();
}

// -------- Framing --------

Result<AfcClient::Reply, Error> AfcClient::dispatch(uint64_t                    operation,
                                                    const std::vector<uint8_t>& args,
                                                    const uint8_t*              data,
                                                    size_t                      data_len) {
    if (!conn_) {
        return Err(deallocated());
    }
    uint64_t this_len   = kHeaderSize + args.size();
    uint64_t entire_len = this_len + data_len;
    uint64_t packet_num = packet_num_++;

    std::vector<uint8_t> packet;
    packet.reserve(entire_len);
    put_u64(packet, kMagic);
    put_u64(packet, entire_len);
    put_u64(packet, this_len);
    put_u64(packet, packet_num);
    put_u64(packet, operation);
    packet.insert(packet.end(), args.begin(), args.end());
    if (data_len > 0) {
        packet.insert(packet.end(), data, data + data_len);
    }
    logger()->trace("afc: op {} packet {} ({} bytes)", operation, packet_num, packet.size());

    auto sent = conn_->send_all(packet);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }

    auto header = conn_->receive_exact(kHeaderSize);
    if (header.is_err()) {
        return Err(remap(header.unwrap_err()));
    }
    // A reply that cannot be framed leaves the stream unreadable
    auto framing = [this](Error e) {
        logger()->warn("afc: {}, dropping connection", e.message);
        conn_->disconnect();
        return e;
    };
    const uint8_t* h = header.unwrap().data();
    if (get_u64(h) != kMagic) {
        return Err(framing(Error(AfcError::OpHeaderInvalid, "bad AFC magic")));
    }
    uint64_t r_entire = get_u64(h + 8);
    uint64_t r_this   = get_u64(h + 16);
    uint64_t r_num    = get_u64(h + 24);
    Reply    reply;
    reply.operation = get_u64(h + 32);
    if (r_this < kHeaderSize || r_entire < r_this) {
        return Err(framing(Error(AfcError::OpHeaderInvalid, "inconsistent AFC lengths")));
    }
    if (r_entire > kMaxPacketSize) {
        return Err(framing(Error(AfcError::TooMuchData, std::to_string(r_entire) + " byte AFC reply")));
    }
    if (r_num != packet_num) {
        return Err(framing(Error(AfcError::OpHeaderInvalid, "AFC reply for packet " + std::to_string(r_num) +
                                                                ", expected " + std::to_string(packet_num))));
    }
    if (r_entire > kHeaderSize) {
        auto body = conn_->receive_exact(r_entire - kHeaderSize);
        if (body.is_err()) {
            return Err(remap(body.unwrap_err()));
        }
        reply.payload = std::move(body).unwrap();
    }

    if (reply.operation == OpStatus) {
        if (reply.payload.size() < 8) {
            return Err(Error(AfcError::OpHeaderInvalid, "short AFC status"));
        }
        uint64_t status = get_u64(reply.payload.data());
        if (status != 0) {
            // Unknown device codes are kept as they are
            return Err(Error(ErrorDomain::Afc, static_cast<int32_t>(status),
                             "op " + std::to_string(operation)));
        }
        reply.payload.clear();
    }
    return Ok(std::move(reply));
}

Result<void, Error> AfcClient::simple(uint64_t operation, const std::vector<uint8_t>& args) {
    BUSQ_TRY_VOID(dispatch(operation, args));
    return Ok();
}

Result<AfcClient::Reply, Error>
AfcClient::expect(uint64_t operation, const std::vector<uint8_t>& args, uint64_t reply_op) {
    BUSQ_TRY(reply, dispatch(operation, args));
    // An empty result may come back as a plain success status
    bool empty_ok = reply.operation == OpStatus && reply_op == OpData;
    if (reply.operation != reply_op && !empty_ok) {
        return Err(Error(AfcError::UnknownPacketType,
                         "op " + std::to_string(operation) + " answered with " +
                             std::to_string(reply.operation)));
    }
    return Ok(std::move(reply));
}

Result<AfcFileMode, Error> AfcClient::tracked(uint64_t handle) const {
    if (!conn_) {
        return Err(deallocated());
    }
    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return Err(Error(AfcError::InvalidArg, "unknown or closed handle " + std::to_string(handle)));
    }
    return Ok(it->second);
}

// -------- Device / paths --------

Result<AfcInfo, Error> AfcClient::get_device_info() {
    BUSQ_TRY(reply, expect(OpGetDevInfo, {}, OpData));
    return Ok(to_info(reply.payload));
}

Result<std::string, Error> AfcClient::get_device_info_key(const std::string& key) {
    BUSQ_TRY(info, get_device_info());
    auto it = info.find(key);
    if (it == info.end()) {
        return Err(Error(AfcError::ObjectNotFound, "no device info key " + key));
    }
    return Ok(it->second);
}

Result<std::vector<std::string>, Error> AfcClient::read_directory(const std::string& path) {
    BUSQ_TRY(reply, expect(OpReadDir, path_args(path), OpData));
    return Ok(split_nul(reply.payload));
}

Result<AfcInfo, Error> AfcClient::get_file_info(const std::string& path) {
    BUSQ_TRY(reply, expect(OpGetFileInfo, path_args(path), OpData));
    return Ok(to_info(reply.payload));
}

Result<bool, Error> AfcClient::exists(const std::string& path) {
    auto info = get_file_info(path);
    if (info.is_ok()) {
        return Ok(true);
    }
    if (info.unwrap_err().is(AfcError::ObjectNotFound)) {
        return Ok(false);
    }
    return Err(std::move(info).unwrap_err());
}

Result<void, Error> AfcClient::remove(const std::string& path) {
    return simple(OpRemovePath, path_args(path));
}

Result<void, Error> AfcClient::remove_recursive(const std::string& path) {
    return simple(OpRemovePathAndContents, path_args(path));
}

Result<void, Error> AfcClient::rename(const std::string& from, const std::string& to) {
    std::vector<uint8_t> args;
    put_path(args, from);
    put_path(args, to);
    return simple(OpRenamePath, args);
}

Result<void, Error> AfcClient::make_directory(const std::string& path) {
    return simple(OpMakeDir, path_args(path));
}

Result<void, Error> AfcClient::make_link(AfcLinkType        type,
                                         const std::string& target,
                                         const std::string& link_name) {
    std::vector<uint8_t> args;
    put_u64(args, static_cast<uint64_t>(type));
    put_path(args, target);
    put_path(args, link_name);
    return simple(OpMakeLink, args);
}

Result<void, Error> AfcClient::set_file_time(const std::string&                    path,
                                             std::chrono::system_clock::time_point mtime) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    std::vector<uint8_t> args;
    put_u64(args, static_cast<uint64_t>(ns));
    put_path(args, path);
    return simple(OpSetFileModTime, args);
}

Result<void, Error> AfcClient::truncate_path(const std::string& path, uint64_t size) {
    std::vector<uint8_t> args;
    put_u64(args, size);
    put_path(args, path);
    return simple(OpTruncate, args);
}

// -------- Files --------

Result<uint64_t, Error> AfcClient::open(const std::string& path, AfcFileMode mode) {
    std::vector<uint8_t> args;
    put_u64(args, static_cast<uint64_t>(mode));
    put_path(args, path);
    BUSQ_TRY(reply, expect(OpFileOpen, args, OpFileOpenRes));
    if (reply.payload.size() < 8) {
        return Err(Error(AfcError::NotEnoughData, "short FILE_OPEN reply"));
    }
    uint64_t handle  = get_u64(reply.payload.data());
    handles_[handle] = mode;
    logger()->debug("afc: opened {} as handle {}", path, handle);
    return Ok(handle);
}

Result<std::vector<uint8_t>, Error> AfcClient::read(uint64_t handle, size_t len) {
    BUSQ_TRY(mode, tracked(handle));
    if (mode == AfcFileMode::WriteOnly || mode == AfcFileMode::Append) {
        return Err(Error(AfcError::PermDenied, "handle is write-only"));
    }
    std::vector<uint8_t> out;
    while (out.size() < len) {
        size_t               want = std::min(len - out.size(), kMaxReadSize);
        std::vector<uint8_t> args;
        put_u64(args, handle);
        put_u64(args, want);
        BUSQ_TRY(reply, expect(OpFileRead, args, OpData));
        if (reply.payload.empty()) {
            break;
        }
        out.insert(out.end(), reply.payload.begin(), reply.payload.end());
        if (reply.payload.size() < want) {
            break;
        }
    }
    return Ok(std::move(out));
}

Result<std::vector<uint8_t>, Error> AfcClient::read_all(uint64_t handle) {
    std::vector<uint8_t> out;
    for (;;) {
        BUSQ_TRY(chunk, read(handle, kReadAllChunk));
        if (chunk.empty()) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return Ok(std::move(out));
}

Result<size_t, Error> AfcClient::write(uint64_t handle, const uint8_t* data, size_t len) {
    BUSQ_TRY(mode, tracked(handle));
    if (!writable(mode)) {
        return Err(Error(AfcError::PermDenied, "handle is read-only"));
    }
    if (len > 0 && !data) {
        return Err(Error(AfcError::InvalidArg, "null write buffer"));
    }
    BUSQ_TRY_VOID(dispatch(OpFileWrite, handle_args(handle), data, len));
    return Ok(len);
}

Result<void, Error> AfcClient::write_chunked(uint64_t                    handle,
                                             const std::vector<uint8_t>& data,
                                             const AfcProgress&          progress) {
    size_t offset = 0;
    do {
        size_t n = std::min(kWriteChunk, data.size() - offset);
        BUSQ_TRY_VOID(write(handle, data.data() + offset, n));
        offset += n;
        if (progress) {
            progress(data.empty() ? 1.0 : static_cast<double>(offset) / data.size());
        }
    } while (offset < data.size());
    return Ok();
}

Result<void, Error> AfcClient::seek(uint64_t handle, int64_t offset, AfcSeek whence) {
    BUSQ_TRY_VOID(tracked(handle));
    std::vector<uint8_t> args;
    put_u64(args, handle);
    put_u64(args, static_cast<uint64_t>(whence));
    put_u64(args, static_cast<uint64_t>(offset));
    return simple(OpFileSeek, args);
}

Result<uint64_t, Error> AfcClient::tell(uint64_t handle) {
    BUSQ_TRY_VOID(tracked(handle));
    BUSQ_TRY(reply, expect(OpFileTell, handle_args(handle), OpFileTellRes));
    if (reply.payload.size() < 8) {
        return Err(Error(AfcError::NotEnoughData, "short FILE_TELL reply"));
    }
    return Ok(get_u64(reply.payload.data()));
}

Result<void, Error> AfcClient::truncate(uint64_t handle, uint64_t size) {
    BUSQ_TRY(mode, tracked(handle));
    if (!writable(mode)) {
        return Err(Error(AfcError::PermDenied, "handle is read-only"));
    }
    std::vector<uint8_t> args;
    put_u64(args, handle);
    put_u64(args, size);
    return simple(OpFileSetSize, args);
}

Result<void, Error> AfcClient::lock(uint64_t handle, AfcLockOp op) {
    BUSQ_TRY_VOID(tracked(handle));
    std::vector<uint8_t> args;
    put_u64(args, handle);
    put_u64(args, static_cast<uint64_t>(op));
    return simple(OpFileLock, args);
}

Result<void, Error> AfcClient::close(uint64_t handle) {
    BUSQ_TRY_VOID(tracked(handle));
    // Forget the handle even if the device rejects the close
    handles_.erase(handle);
    return simple(OpFileClose, handle_args(handle));
}

// -------- Transfers --------

Result<void, Error> AfcClient::upload(const std::string& local_path,
                                      const std::string& remote_path,
                                      const AfcProgress& progress) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Err(Error(AfcError::ObjectNotFound, "cannot read " + local_path));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    BUSQ_TRY(handle, open(remote_path, AfcFileMode::WriteTruncate));
    auto written = write_chunked(handle, bytes, progress);
    auto closed  = close(handle);
    if (written.is_err()) {
        return written;
    }
    return closed;
}

Result<void, Error> AfcClient::download(const std::string& remote_path, const std::string& local_path) {
    BUSQ_TRY(handle, open(remote_path, AfcFileMode::ReadOnly));
    auto data   = read_all(handle);
    auto closed = close(handle);
    if (data.is_err()) {
        return Err(std::move(data).unwrap_err());
    }
    BUSQ_TRY_VOID(closed);
    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(Error(AfcError::IoError, "cannot write " + local_path));
    }
    const auto& bytes = data.unwrap();
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return Err(Error(AfcError::IoError, "short write to " + local_path));
    }
    return Ok();
}

Result<void, Error> AfcClient::copy_folder(const std::string&     local_dir,
                                           const std::string&     remote_dir,
                                           const AfcCopyProgress& progress) {
    std::error_code ec;
    if (!fs::is_directory(local_dir, ec)) {
        return Err(Error(AfcError::ObjectNotFound, local_dir + " is not a directory"));
    }

    std::vector<fs::path> dirs;
    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(local_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            dirs.push_back(it->path());
        } else if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Err(Error(AfcError::IoError, local_dir + ": " + ec.message()));
    }

    auto remote_for = [&](const fs::path& p) {
        return join_remote(remote_dir, fs::relative(p, local_dir).generic_string());
    };

    BUSQ_TRY(root_exists, exists(remote_dir));
    if (!root_exists) {
        BUSQ_TRY_VOID(make_directory(remote_dir));
    }
    // recursive_directory_iterator yields parents before children
    for (const auto& d : dirs) {
        BUSQ_TRY_VOID(make_directory(remote_for(d)));
    }
    size_t done = 0;
    for (const auto& f : files) {
        std::string remote = remote_for(f);
        BUSQ_TRY_VOID(upload(f.string(), remote));
        ++done;
        if (progress) {
            progress(remote, static_cast<double>(done) / files.size());
        }
    }
    logger()->info("afc: copied {} files into {}", files.size(), remote_dir);
    return Ok();
}

} // namespace Busq
