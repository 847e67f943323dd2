// busq++ contributors

#ifndef BUSQ_AFC_HPP
#define BUSQ_AFC_HPP

#include <busq++/connection.hpp>
#include <busq++/device.hpp>
#include <busq++/service.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Busq {

class HouseArrestClient;

enum class AfcFileMode : uint64_t {
    ReadOnly      = 1, // r
    ReadWrite     = 2, // r+
    WriteOnly     = 3, // w
    WriteTruncate = 4, // w+
    Append        = 5, // a
    ReadAppend    = 6, // a+
};

enum class AfcLinkType : uint64_t { Hard = 1, Symbolic = 2 };

enum class AfcLockOp : uint64_t { Shared = 1 | 4, Exclusive = 2 | 4, Unlock = 8 | 4 };

enum class AfcSeek : uint64_t { Set = 0, Current = 1, End = 2 };

using AfcInfo = std::map<std::string, std::string>;

// Fraction of the transfer done, 0..1
using AfcProgress = std::function<void(double)>;
// Remote path just copied and the fraction of files done
using AfcCopyProgress = std::function<void(const std::string&, double)>;

// Apple File Conduit client. Every call is one request/response exchange on
// the service connection.
class AfcClient {
  public:
    static constexpr const char* kServiceName = "com.apple.afc";
    static constexpr size_t      kMaxReadSize = 64 * 1024;

    static Result<AfcClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<AfcClient, Error> start(Device& device, const std::string& label = "busq");
    // Takes over a house arrest connection after VendContainer/VendDocuments
    static Result<AfcClient, Error> from_house_arrest(HouseArrestClient& client);
    static AfcClient                adopt(Connection&& conn) noexcept { return AfcClient(std::move(conn)); }

    // -------- Device / paths --------
    Result<AfcInfo, Error>                  get_device_info();
    Result<std::string, Error>              get_device_info_key(const std::string& key);
    // Includes "." and ".."
    Result<std::vector<std::string>, Error> read_directory(const std::string& path);
    Result<AfcInfo, Error>                  get_file_info(const std::string& path);
    Result<bool, Error>                     exists(const std::string& path);
    Result<void, Error>                     remove(const std::string& path);
    Result<void, Error>                     remove_recursive(const std::string& path);
    Result<void, Error>                     rename(const std::string& from, const std::string& to);
    Result<void, Error>                     make_directory(const std::string& path);
    Result<void, Error>                     make_link(AfcLinkType        type,
                                                      const std::string& target,
                                                      const std::string& link_name);
    Result<void, Error>                     set_file_time(const std::string&                    path,
                                                          std::chrono::system_clock::time_point mtime);
    Result<void, Error>                     truncate_path(const std::string& path, uint64_t size);

    // -------- Files --------
    Result<uint64_t, Error>                 open(const std::string& path, AfcFileMode mode);
    Result<std::vector<uint8_t>, Error>     read(uint64_t handle, size_t len);
    // Reads until the device returns nothing
    Result<std::vector<uint8_t>, Error>     read_all(uint64_t handle);
    Result<size_t, Error>                   write(uint64_t handle, const uint8_t* data, size_t len);
    Result<size_t, Error>                   write(uint64_t handle, const std::vector<uint8_t>& data) {
        return write(handle, data.data(), data.size());
    }
    Result<void, Error>                     write_chunked(uint64_t                    handle,
                                                          const std::vector<uint8_t>& data,
                                                          const AfcProgress&          progress = {});
    Result<void, Error>                     seek(uint64_t handle, int64_t offset, AfcSeek whence);
    Result<uint64_t, Error>                 tell(uint64_t handle);
    Result<void, Error>                     truncate(uint64_t handle, uint64_t size);
    Result<void, Error>                     lock(uint64_t handle, AfcLockOp op);
    Result<void, Error>                     close(uint64_t handle);

    // -------- Transfers --------
    Result<void, Error>                     upload(const std::string& local_path,
                                                   const std::string& remote_path,
                                                   const AfcProgress& progress = {});
    Result<void, Error>                     download(const std::string& remote_path,
                                                     const std::string& local_path);
    // Mirrors a local directory tree under remote_dir
    Result<void, Error>                     copy_folder(const std::string&     local_dir,
                                                        const std::string&     remote_dir,
                                                        const AfcCopyProgress& progress = {});

    bool                                    released() const noexcept { return !conn_.has_value(); }
    void                                    free() noexcept;

    // RAII / moves
    ~AfcClient() noexcept                    = default;
    AfcClient(AfcClient&&) noexcept          = default;
    AfcClient& operator=(AfcClient&&) noexcept = default;
    AfcClient(const AfcClient&)              = delete;
    AfcClient& operator=(const AfcClient&)   = delete;

  private:
    explicit AfcClient(Connection&& conn) noexcept : conn_(std::move(conn)) {}

    struct Reply {
        uint64_t             operation = 0;
        std::vector<uint8_t> payload;
    };

    Result<Reply, Error> dispatch(uint64_t                    operation,
                                  const std::vector<uint8_t>& args,
                                  const uint8_t*              data = nullptr,
                                  size_t                      data_len = 0);
    Result<void, Error>  simple(uint64_t operation, const std::vector<uint8_t>& args);
    Result<Reply, Error> expect(uint64_t operation, const std::vector<uint8_t>& args, uint64_t reply_op);
    Result<AfcFileMode, Error> tracked(uint64_t handle) const;

    std::optional<Connection>         conn_;
    uint64_t                          packet_num_ = 0;
    std::map<uint64_t, AfcFileMode>   handles_;
};

} // namespace Busq
#endif
