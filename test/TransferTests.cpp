#include <libwtftp/wtftp.hpp>

#include "TestUtils.hpp"

namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
  protected:
    void SetUp() override {
        base = make_temp_root();
        root = fs::canonical(base / "root");
    }

    void TearDown() override {
        fs::remove_all(base);
    }

    void open(const std::string& name, size_t size, uint64_t blksize, uint16_t windowsize, transfer_t *t) {
        content = write_file(root / name, size);
        options_t o;
        o.blksize = blksize;
        o.windowsize = windowsize;
        o.tsize = size;
        ASSERT_EQ(WTFTP_OK, wtftp_open_transfer(root / name, o, false, t));
    }

    // acknowledges every full window until the terminating chunk is drained
    std::vector<uint8_t> drive(transfer_t& t) {
        std::vector<uint8_t> out;
        for (;;) {
            bool room = false;
            EXPECT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
            if (t.window.empty()) break;
            for (const chunk_t& c : t.window)
                out.insert(out.end(), c.begin(), c.end());
            uint16_t last = static_cast<uint16_t>(t.block + t.window.size() - 1);
            EXPECT_TRUE(wtftp_drain_window(t, last));
            EXPECT_TRUE(t.window.empty());
            if (t.finished) break;
        }
        return out;
    }

    fs::path base;
    fs::path root;
    std::vector<uint8_t> content;
};

// ----------------------------------------------------------------------
// Path checks
// ----------------------------------------------------------------------

TEST_F(TransferTest, ExistingFile) {
    write_file(root / "report.txt", 10);
    fs::path resolved;

    EXPECT_EQ(WTFTP_PATH_EXISTS, wtftp_check_path(root, "report.txt", &resolved));
    EXPECT_EQ(root / "report.txt", resolved);
}

TEST_F(TransferTest, MissingFile) {
    fs::path resolved;
    EXPECT_EQ(WTFTP_PATH_NOFILE, wtftp_check_path(root, "missing.bin", &resolved));
}

TEST_F(TransferTest, DirectoryIsNotServed) {
    fs::create_directory(root / "sub");
    fs::path resolved;
    EXPECT_EQ(WTFTP_PATH_NOFILE, wtftp_check_path(root, "sub", &resolved));
}

TEST_F(TransferTest, ParentSegmentRejectedEvenIfFileExists) {
    write_file(base / "secret.txt", 10);
    write_file(root / "a.txt", 10);
    fs::path resolved;

    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, "../secret.txt", &resolved));
    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, "../missing.txt", &resolved));
    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, "sub/../a.txt", &resolved));
}

TEST_F(TransferTest, DotsInsideNameAreAllowed) {
    write_file(root / "a..b.txt", 10);
    fs::path resolved;
    EXPECT_EQ(WTFTP_PATH_EXISTS, wtftp_check_path(root, "a..b.txt", &resolved));
}

TEST_F(TransferTest, AbsolutePaths) {
    write_file(root / "inside.txt", 10);
    write_file(base / "outside.txt", 10);
    fs::path resolved;

    EXPECT_EQ(WTFTP_PATH_EXISTS, wtftp_check_path(root, (root / "inside.txt").string(), &resolved));
    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, (base / "outside.txt").string(), &resolved));
    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, "/etc/passwd", &resolved));
}

TEST_F(TransferTest, SymlinkOutOfRoot) {
    write_file(base / "outside.txt", 10);
    fs::create_symlink(base / "outside.txt", root / "link.txt");
    fs::path resolved;

    EXPECT_EQ(WTFTP_PATH_ACCESS, wtftp_check_path(root, "link.txt", &resolved));
}

// ----------------------------------------------------------------------
// Window fill
// ----------------------------------------------------------------------

TEST_F(TransferTest, OpenSetsFirstBlock) {
    write_file(root / "f", 10);
    options_t o;
    transfer_t plain, negotiated;

    ASSERT_EQ(WTFTP_OK, wtftp_open_transfer(root / "f", o, false, &plain));
    ASSERT_EQ(WTFTP_OK, wtftp_open_transfer(root / "f", o, true, &negotiated));
    EXPECT_EQ(1, plain.block);
    EXPECT_EQ(0, negotiated.block);
    EXPECT_FALSE(plain.negotiating);
    EXPECT_TRUE(negotiated.negotiating);
    EXPECT_FALSE(plain.finished);
}

TEST_F(TransferTest, OpenMissingFile) {
    options_t o;
    transfer_t t;
    EXPECT_EQ(WTFTP_SYSERR_OPEN, wtftp_open_transfer(root / "nope", o, false, &t));
}

TEST_F(TransferTest, FillSingleBlockWindow) {
    transfer_t t;
    open("report.txt", 1000, 512, 1, &t);

    bool room = true;
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    ASSERT_EQ(1U, t.window.size());
    EXPECT_EQ(512U, t.window[0].size());
    EXPECT_FALSE(t.finished);
    EXPECT_FALSE(room);

    ASSERT_TRUE(wtftp_drain_window(t, 1));
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    ASSERT_EQ(1U, t.window.size());
    EXPECT_EQ(488U, t.window[0].size());
    EXPECT_TRUE(t.finished);
}

TEST_F(TransferTest, FillStopsAtShortRead) {
    transfer_t t;
    open("report.txt", 1300, 512, 8, &t);

    bool room = false;
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    ASSERT_EQ(3U, t.window.size());
    EXPECT_EQ(512U, t.window[0].size());
    EXPECT_EQ(512U, t.window[1].size());
    EXPECT_EQ(276U, t.window[2].size());
    EXPECT_TRUE(t.finished);
    EXPECT_TRUE(room);

    // nothing more is read once the last chunk is queued
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    EXPECT_EQ(3U, t.window.size());
}

TEST_F(TransferTest, ExactMultipleQueuesEmptyChunk) {
    transfer_t t;
    open("even.bin", 1024, 512, 4, &t);

    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, NULL));
    ASSERT_EQ(3U, t.window.size());
    EXPECT_TRUE(t.window[2].empty());
    EXPECT_TRUE(t.finished);
}

TEST_F(TransferTest, EmptyFile) {
    transfer_t t;
    open("empty.bin", 0, 512, 1, &t);

    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, NULL));
    ASSERT_EQ(1U, t.window.size());
    EXPECT_TRUE(t.window[0].empty());
    EXPECT_TRUE(t.finished);
}

TEST_F(TransferTest, FillStopsAtByteLimit) {
    transfer_t t;
    open("big.bin", 10000, 1000, 8, &t);
    t.maxbytes = 3500;

    bool room = true;
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    EXPECT_EQ(3U, t.window.size());
    EXPECT_FALSE(room);
    EXPECT_FALSE(t.finished);

    // the client acknowledges whatever it got
    ASSERT_TRUE(wtftp_drain_window(t, 3));
    EXPECT_EQ(4, t.block);
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, &room));
    EXPECT_EQ(3U, t.window.size());
}

TEST_F(TransferTest, ByteLimitKeepsOneChunk) {
    transfer_t t;
    open("big.bin", 3000, 1000, 4, &t);
    t.maxbytes = 10;

    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, NULL));
    EXPECT_EQ(1U, t.window.size());
    EXPECT_EQ(content, drive(t));
}

TEST_F(TransferTest, FillRefusesUnsendableBlockSize) {
    transfer_t t;
    open("big.bin", 10, WTFTP_MAX_DATA_SIZE + 1, 1, &t);

    EXPECT_EQ(WTFTP_EERR_SIZE, wtftp_fill_window(t, NULL));
    EXPECT_TRUE(t.window.empty());
}

// ----------------------------------------------------------------------
// Window drain
// ----------------------------------------------------------------------

TEST_F(TransferTest, DrainAcrossWraparound) {
    transfer_t t;
    t.options.windowsize = 4;
    t.block = 65534;
    t.window.assign(3, chunk_t(1));

    // 65534, 65535, 0
    ASSERT_TRUE(wtftp_drain_window(t, 0));
    EXPECT_EQ(1, t.block);
    EXPECT_TRUE(t.window.empty());
}

TEST_F(TransferTest, DrainPartialWindow) {
    transfer_t t;
    t.options.windowsize = 4;
    t.block = 10;
    t.window.assign(4, chunk_t(1));

    ASSERT_TRUE(wtftp_drain_window(t, 11));
    EXPECT_EQ(12, t.block);
    EXPECT_EQ(2U, t.window.size());
}

TEST_F(TransferTest, DrainIgnoresStaleAck) {
    transfer_t t;
    t.options.windowsize = 2;
    t.block = 10;
    t.window.assign(2, chunk_t(1));

    EXPECT_FALSE(wtftp_drain_window(t, 9));
    EXPECT_FALSE(wtftp_drain_window(t, 13));
    EXPECT_EQ(10, t.block);
    EXPECT_EQ(2U, t.window.size());
}

TEST_F(TransferTest, DrainAtWindowBoundary) {
    transfer_t t;
    t.options.windowsize = 2;
    t.block = 65535;
    t.window.assign(2, chunk_t(1));

    // diff == windowsize is still accepted, extra pops are no-ops
    ASSERT_TRUE(wtftp_drain_window(t, 1));
    EXPECT_EQ(2, t.block);
    EXPECT_TRUE(t.window.empty());
}

TEST_F(TransferTest, ZeroAckAfterOptionAck) {
    transfer_t t;
    t.block = 0;
    t.negotiating = true;

    ASSERT_TRUE(wtftp_drain_window(t, 0));
    EXPECT_EQ(1, t.block);
    EXPECT_FALSE(t.negotiating);
    EXPECT_TRUE(t.window.empty());
}

TEST_F(TransferTest, NothingReadBeforeOptionAck) {
    write_file(root / "f.bin", 1000);
    options_t o;
    o.windowsize = 4;
    transfer_t t;
    ASSERT_EQ(WTFTP_OK, wtftp_open_transfer(root / "f.bin", o, true, &t));

    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, NULL));
    EXPECT_TRUE(t.window.empty());

    // any other ack leaves the transfer waiting
    EXPECT_FALSE(wtftp_drain_window(t, 9));
    EXPECT_FALSE(wtftp_drain_window(t, 1));
    EXPECT_EQ(0, t.block);
    EXPECT_TRUE(t.negotiating);

    ASSERT_TRUE(wtftp_drain_window(t, 0));
    ASSERT_EQ(WTFTP_OK, wtftp_fill_window(t, NULL));
    ASSERT_EQ(2U, t.window.size());
    EXPECT_EQ(512U, t.window[0].size());
    EXPECT_EQ(1, t.block);
}

// ----------------------------------------------------------------------
// Whole transfers
// ----------------------------------------------------------------------

TEST_F(TransferTest, ChunksConcatenateToFile) {
    transfer_t t;
    open("data.bin", 5003, 100, 7, &t);

    EXPECT_EQ(content, drive(t));
    EXPECT_TRUE(t.finished);
}

TEST_F(TransferTest, BlockNumbersWrap) {
    transfer_t t;
    open("wrap.bin", 70000, 1, 1000, &t);

    EXPECT_EQ(content, drive(t));
    EXPECT_EQ(static_cast<uint16_t>(70001 + 1), t.block);
}
