#include "mock/afc_emulator.hpp"
#include "mock/mock_device.hpp"

#include <busq++/afc.hpp>
#include <busq++/house_arrest.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace Busq;
using namespace BusqTest;

namespace fs = std::filesystem;

namespace {

class AfcTest : public ::testing::Test {
  protected:
    void SetUp() override {
        emulator_ = std::make_shared<AfcEmulator>();
        emulator_->put_file("/DCIM/100APPLE/IMG_0001.JPG", "jpeg-bytes");
        emulator_->put_dir("/Downloads");
        pipe_ = std::make_shared<Pipe>(emulator_);
        client_.emplace(AfcClient::adopt(Connection::adopt(std::make_unique<MockStream>(pipe_))));
    }

    AfcClient& afc() { return *client_; }

    std::shared_ptr<AfcEmulator> emulator_;
    std::shared_ptr<Pipe>        pipe_;
    std::optional<AfcClient>     client_;
};

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

void put_le64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

// Answers every request with one status packet whose header is off
class GarbledAfc : public Endpoint {
  public:
    explicit GarbledAfc(uint64_t magic, uint64_t packet_num) : magic_(magic), packet_num_(packet_num) {}

    std::vector<uint8_t> on_data(const uint8_t*, size_t) override {
        std::vector<uint8_t> out;
        put_le64(out, magic_);
        put_le64(out, 48);
        put_le64(out, 40);
        put_le64(out, packet_num_);
        put_le64(out, 1);
        put_le64(out, 0);
        return out;
    }

  private:
    uint64_t magic_;
    uint64_t packet_num_;
};

constexpr uint64_t kAfcMagic = 0x4141504c36414643ULL;

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string text_of(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

} // namespace

TEST_F(AfcTest, DeviceInfoIsParsedIntoPairs) {
    auto info = afc().get_device_info();
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.unwrap().at("Model"), "iPhone14,2");
    EXPECT_EQ(info.unwrap().at("FSBlockSize"), "4096");

    EXPECT_EQ(afc().get_device_info_key("FSFreeBytes").unwrap(), "64000000000");
    EXPECT_TRUE(afc().get_device_info_key("Nope").unwrap_err().is(AfcError::ObjectNotFound));
}

TEST_F(AfcTest, ReadDirectoryListsDotEntries) {
    auto root = afc().read_directory("/");
    ASSERT_TRUE(root.is_ok());
    EXPECT_TRUE(contains(root.unwrap(), "."));
    EXPECT_TRUE(contains(root.unwrap(), ".."));
    EXPECT_TRUE(contains(root.unwrap(), "DCIM"));
    EXPECT_TRUE(contains(root.unwrap(), "Downloads"));

    auto missing = afc().read_directory("/Nowhere");
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.unwrap_err().is(AfcError::ObjectNotFound));
}

TEST_F(AfcTest, FileInfoReportsTypeAndSize) {
    auto info = afc().get_file_info("/DCIM/100APPLE/IMG_0001.JPG");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.unwrap().at("st_ifmt"), "S_IFREG");
    EXPECT_EQ(info.unwrap().at("st_size"), "10");

    EXPECT_EQ(afc().get_file_info("/DCIM").unwrap().at("st_ifmt"), "S_IFDIR");
    EXPECT_TRUE(afc().exists("/DCIM").unwrap());
    EXPECT_FALSE(afc().exists("/Missing").unwrap());
}

TEST_F(AfcTest, WriteThenReadBack) {
    auto h = afc().open("/Downloads/notes.txt", AfcFileMode::WriteTruncate).expect("open");
    ASSERT_TRUE(afc().write(h, bytes_of("hello world")).is_ok());
    EXPECT_EQ(afc().tell(h).unwrap(), 11u);

    ASSERT_TRUE(afc().seek(h, 0, AfcSeek::Set).is_ok());
    EXPECT_EQ(text_of(afc().read(h, 5).unwrap()), "hello");

    ASSERT_TRUE(afc().seek(h, -5, AfcSeek::End).is_ok());
    EXPECT_EQ(text_of(afc().read_all(h).unwrap()), "world");

    ASSERT_TRUE(afc().truncate(h, 5).is_ok());
    ASSERT_TRUE(afc().close(h).is_ok());
    EXPECT_EQ(emulator_->contents("/Downloads/notes.txt"), std::optional<std::string>("hello"));
    EXPECT_EQ(emulator_->open_handles(), 0u);
}

TEST_F(AfcTest, AppendModeWritesAtTheEnd) {
    emulator_->put_file("/log.txt", "one\n");
    auto h = afc().open("/log.txt", AfcFileMode::Append).expect("open");
    ASSERT_TRUE(afc().write(h, bytes_of("two\n")).is_ok());

    // Append is write-only
    auto r = afc().read(h, 4);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(AfcError::PermDenied));

    ASSERT_TRUE(afc().close(h).is_ok());
    EXPECT_EQ(emulator_->contents("/log.txt"), std::optional<std::string>("one\ntwo\n"));
}

TEST_F(AfcTest, ReadOnlyHandleRefusesWritesLocally) {
    auto h       = afc().open("/DCIM/100APPLE/IMG_0001.JPG", AfcFileMode::ReadOnly).expect("open");
    auto before  = emulator_->operations().size();
    auto written = afc().write(h, bytes_of("x"));
    ASSERT_TRUE(written.is_err());
    EXPECT_TRUE(written.unwrap_err().is(AfcError::PermDenied));
    EXPECT_TRUE(afc().truncate(h, 0).unwrap_err().is(AfcError::PermDenied));
    EXPECT_EQ(emulator_->operations().size(), before);

    EXPECT_EQ(text_of(afc().read_all(h).unwrap()), "jpeg-bytes");
    ASSERT_TRUE(afc().lock(h, AfcLockOp::Shared).is_ok());
    ASSERT_TRUE(afc().close(h).is_ok());
}

TEST_F(AfcTest, ClosedHandlesAreUnknown) {
    auto h = afc().open("/DCIM/100APPLE/IMG_0001.JPG", AfcFileMode::ReadOnly).expect("open");
    ASSERT_TRUE(afc().close(h).is_ok());
    EXPECT_TRUE(afc().read(h, 1).unwrap_err().is(AfcError::InvalidArg));
    EXPECT_TRUE(afc().close(h).unwrap_err().is(AfcError::InvalidArg));
}

TEST_F(AfcTest, OpeningMissingFileForReadFails) {
    auto r = afc().open("/Downloads/absent.bin", AfcFileMode::ReadOnly);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(AfcError::ObjectNotFound));

    auto dir = afc().open("/Downloads", AfcFileMode::ReadOnly);
    ASSERT_TRUE(dir.is_err());
    EXPECT_TRUE(dir.unwrap_err().is(AfcError::ObjectIsDir));
}

TEST_F(AfcTest, DirectoryLifecycle) {
    ASSERT_TRUE(afc().make_directory("/Projects").is_ok());
    ASSERT_TRUE(afc().make_directory("/Projects/src").is_ok());
    EXPECT_TRUE(emulator_->is_dir("/Projects/src"));

    auto busy = afc().remove("/Projects");
    ASSERT_TRUE(busy.is_err());
    EXPECT_TRUE(busy.unwrap_err().is(AfcError::DirNotEmpty));

    ASSERT_TRUE(afc().remove_recursive("/Projects").is_ok());
    EXPECT_FALSE(emulator_->exists("/Projects/src"));
    auto gone = afc().read_directory("/Projects");
    ASSERT_TRUE(gone.is_err());
    EXPECT_TRUE(gone.unwrap_err().is(AfcError::ObjectNotFound));
}

TEST_F(AfcTest, RenameMovesTheEntry) {
    ASSERT_TRUE(afc().rename("/DCIM/100APPLE/IMG_0001.JPG", "/Downloads/photo.jpg").is_ok());
    EXPECT_FALSE(emulator_->exists("/DCIM/100APPLE/IMG_0001.JPG"));
    EXPECT_EQ(emulator_->contents("/Downloads/photo.jpg"), std::optional<std::string>("jpeg-bytes"));

    auto missing = afc().rename("/nope", "/also-nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_TRUE(missing.unwrap_err().is(AfcError::ObjectNotFound));
}

TEST_F(AfcTest, LinksAndPathLevelTruncate) {
    ASSERT_TRUE(afc().make_link(AfcLinkType::Symbolic, "/DCIM/100APPLE/IMG_0001.JPG", "/latest.jpg").is_ok());
    EXPECT_EQ(afc().get_file_info("/latest.jpg").unwrap().at("st_ifmt"), "S_IFLNK");

    ASSERT_TRUE(afc().truncate_path("/DCIM/100APPLE/IMG_0001.JPG", 4).is_ok());
    EXPECT_EQ(emulator_->contents("/DCIM/100APPLE/IMG_0001.JPG"), std::optional<std::string>("jpeg"));

    ASSERT_TRUE(afc().set_file_time("/DCIM", std::chrono::system_clock::now()).is_ok());
}

TEST_F(AfcTest, ChunkedWriteReportsProgress) {
    std::vector<uint8_t> payload(200 * 1024, 0x5A);
    std::vector<double>  seen;

    auto h = afc().open("/big.bin", AfcFileMode::WriteOnly).expect("open");
    ASSERT_TRUE(afc().write_chunked(h, payload, [&seen](double f) { seen.push_back(f); }).is_ok());
    ASSERT_TRUE(afc().close(h).is_ok());

    ASSERT_FALSE(seen.empty());
    EXPECT_DOUBLE_EQ(seen.back(), 1.0);
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(emulator_->contents("/big.bin")->size(), payload.size());
}

TEST_F(AfcTest, UploadDownloadAndCopyFolder) {
    fs::path local = fs::temp_directory_path() / "busq-afc-test";
    fs::remove_all(local);
    fs::create_directories(local / "tree" / "nested");
    std::ofstream(local / "tree" / "a.txt") << "alpha";
    std::ofstream(local / "tree" / "nested" / "b.txt") << "beta";

    ASSERT_TRUE(afc().upload((local / "tree" / "a.txt").string(), "/a.txt").is_ok());
    EXPECT_EQ(emulator_->contents("/a.txt"), std::optional<std::string>("alpha"));

    ASSERT_TRUE(afc().download("/DCIM/100APPLE/IMG_0001.JPG", (local / "img.jpg").string()).is_ok());
    std::ifstream in(local / "img.jpg", std::ios::binary);
    std::string   copied((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(copied, "jpeg-bytes");

    std::vector<std::string> uploaded;
    ASSERT_TRUE(afc()
                    .copy_folder((local / "tree").string(), "/Mirror",
                                 [&uploaded](const std::string& path, double) { uploaded.push_back(path); })
                    .is_ok());
    EXPECT_EQ(uploaded.size(), 2u);
    EXPECT_TRUE(emulator_->is_dir("/Mirror/nested"));
    EXPECT_EQ(emulator_->contents("/Mirror/nested/b.txt"), std::optional<std::string>("beta"));

    EXPECT_TRUE(afc().upload((local / "missing.txt").string(), "/x").unwrap_err().is(AfcError::ObjectNotFound));
    fs::remove_all(local);
}

TEST_F(AfcTest, ReleasedClientIsDeallocated) {
    afc().free();
    EXPECT_TRUE(afc().released());
    EXPECT_TRUE(pipe_->closed());
    EXPECT_TRUE(afc().read_directory("/").unwrap_err().is(AfcError::DeallocatedClient));
}

TEST_F(AfcTest, PeerHangupIsAMuxError) {
    pipe_->close();
    auto r = afc().get_device_info();
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(AfcError::MuxError));
}

TEST(AfcFramingTest, MismatchedPacketNumberDropsTheConnection) {
    auto pipe = std::make_shared<Pipe>(std::make_shared<GarbledAfc>(kAfcMagic, 99));
    auto afc  = AfcClient::adopt(Connection::adopt(std::make_unique<MockStream>(pipe)));

    auto first = afc.get_device_info();
    ASSERT_TRUE(first.is_err());
    EXPECT_TRUE(first.unwrap_err().is(AfcError::OpHeaderInvalid));
    EXPECT_TRUE(pipe->closed());

    // The unread reply body is never parsed as the next header
    auto second = afc.read_directory("/");
    ASSERT_TRUE(second.is_err());
    EXPECT_TRUE(second.unwrap_err().is(AfcError::MuxError));
}

TEST(AfcFramingTest, BadMagicDropsTheConnection) {
    auto pipe = std::make_shared<Pipe>(std::make_shared<GarbledAfc>(0x1122334455667788ULL, 0));
    auto afc  = AfcClient::adopt(Connection::adopt(std::make_unique<MockStream>(pipe)));

    EXPECT_TRUE(afc.get_device_info().unwrap_err().is(AfcError::OpHeaderInvalid));
    EXPECT_TRUE(afc.exists("/").unwrap_err().is(AfcError::MuxError));
}

TEST(AfcServiceTest, StartGoesThroughLockdown) {
    auto env      = MockEnvironment::create();
    auto emulator = std::make_shared<AfcEmulator>();
    emulator->put_file("/hello.txt", "hi");
    env.add_service(AfcClient::kServiceName, emulator);
    auto device = env.device();

    auto client = AfcClient::start(device, "busq-tests");
    ASSERT_TRUE(client.is_ok());
    EXPECT_TRUE(client.unwrap().exists("/hello.txt").unwrap());
    EXPECT_EQ(env.lockdown->requests.back(), "Goodbye");
}

TEST(HouseArrestTest, VendedContainerSpeaksAfc) {
    auto env       = MockEnvironment::create();
    auto container = std::make_shared<AfcEmulator>();
    container->put_file("/Documents/save.dat", "level-3");
    auto house = std::make_shared<MockHouseArrest>(container);
    house->apps.insert("com.example.notes");
    env.add_service(HouseArrestClient::kServiceName, house);
    auto device = env.device();

    auto client = HouseArrestClient::start(device).expect("house arrest");
    ASSERT_TRUE(client.vend_container("com.example.notes").is_ok());

    auto afc = AfcClient::from_house_arrest(client);
    ASSERT_TRUE(afc.is_ok());
    EXPECT_TRUE(client.afc_mode());

    auto h = afc.unwrap().open("/Documents/save.dat", AfcFileMode::ReadOnly).expect("open");
    EXPECT_EQ(text_of(afc.unwrap().read_all(h).unwrap()), "level-3");

    // The plist side of the client is spent
    auto again = client.vend_documents("com.example.notes");
    ASSERT_TRUE(again.is_err());
    EXPECT_TRUE(again.unwrap_err().is(HouseArrestError::InvalidMode));
    EXPECT_TRUE(AfcClient::from_house_arrest(client).unwrap_err().is(AfcError::InvalidArg));
}

TEST(HouseArrestTest, UnknownApplicationIsReported) {
    auto env    = MockEnvironment::create();
    auto house  = std::make_shared<MockHouseArrest>(std::make_shared<AfcEmulator>());
    env.add_service(HouseArrestClient::kServiceName, house);
    auto device = env.device();

    auto client = HouseArrestClient::start(device).expect("house arrest");
    auto r      = client.vend_documents("com.example.unknown");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(HouseArrestError::Unknown));
    EXPECT_NE(r.unwrap_err().message.find("ApplicationLookupFailed"), std::string::npos);
    EXPECT_FALSE(client.afc_mode());

    auto empty = client.send_command("VendContainer", "");
    EXPECT_TRUE(empty.unwrap_err().is(HouseArrestError::InvalidArgument));
}
