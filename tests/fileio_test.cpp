#include <gtest/gtest.h>

#include "epb.hpp"
#include "fileio.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

class FileIoTest : public ::testing::Test {
protected:
    std::string path(const std::string& name) {
        std::string p = ::testing::TempDir() + "epb_fileio_" + name;
        created_.push_back(p);
        return p;
    }

    void TearDown() override {
        for (const std::string& p : created_) {
            std::remove(p.c_str());
        }
    }

private:
    std::vector<std::string> created_;
};

TEST_F(FileIoTest, WriteThenRead) {
    Bytes data = {0x00, 0x00, 0x01, 0x65, 0x88, 0x00};
    std::string p = path("raw.bin");
    writeFile(p, data);
    EXPECT_EQ(data, readFile(p));

    std::string empty = path("empty.bin");
    writeFile(empty, Bytes());
    EXPECT_TRUE(readFile(empty).empty());
}

TEST_F(FileIoTest, EncodeDecodeThroughFiles) {
    Bytes rbsp(1000, 0x00);
    rbsp.push_back(0x01);

    std::string raw = path("rbsp.bin");
    std::string enc = path("enc.bin");
    std::string dec = path("dec.bin");
    writeFile(raw, rbsp);
    writeFile(enc, epbEncode(readFile(raw)));
    writeFile(dec, epbDecode(readFile(enc)));

    EXPECT_TRUE(isSameFile({raw, dec}));
    EXPECT_FALSE(isSameFile({raw, enc}));
    EXPECT_TRUE(isSameFile({raw, dec, raw}));
}

TEST_F(FileIoTest, IsSameFile) {
    std::string a = path("a.bin");
    std::string b = path("b.bin");
    std::string c = path("c.bin");
    writeFile(a, Bytes(70000, 0x42));
    writeFile(b, Bytes(70000, 0x42));
    Bytes longer(70001, 0x42);
    writeFile(c, longer);

    EXPECT_TRUE(isSameFile({a}));
    EXPECT_TRUE(isSameFile({}));
    EXPECT_TRUE(isSameFile({a, a}));
    EXPECT_TRUE(isSameFile({a, b}));
    EXPECT_FALSE(isSameFile({a, c}));
    EXPECT_FALSE(isSameFile({c, a}));
}

TEST_F(FileIoTest, MissingFileThrows) {
    std::string missing = path("does_not_exist.bin");
    std::string a = path("a.bin");
    writeFile(a, Bytes(4, 0x01));

    EXPECT_THROW(readFile(missing), std::runtime_error);
    EXPECT_THROW(isSameFile({a, missing}), std::runtime_error);
    EXPECT_THROW(writeFile(missing + "/nested/x.bin", Bytes()), std::runtime_error);
}

TEST_F(FileIoTest, ReadingDirectoryReportsReadFileError) {
    std::string dir = ::testing::TempDir();
    try {
        readFile(dir);
        FAIL() << "readFile on a directory did not throw";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(0u, std::string(e.what()).find("readFile: "));
    }

    std::string a = path("a.bin");
    writeFile(a, Bytes(4, 0x01));
    EXPECT_THROW(isSameFile({a, dir}), std::runtime_error);
}
