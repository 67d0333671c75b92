#include <gtest/gtest.h>
#include "../../src/inventory/id_source.h"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace Fleetshard;

class IdSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "fleetshard_ids_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void WriteFile(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::string path_;
};

TEST_F(IdSourceTest, ParsesMixedSeparatorsAndComments) {
    std::istringstream in("1\n2,3  4\n# full line comment\n5 # trailing\n\n\t6,\r\n");
    EXPECT_EQ(ParseIdStream(in, "test"), (std::vector<std::string>{"1", "2", "3", "4", "5", "6"}));
}

TEST_F(IdSourceTest, DropsRepeatsKeepingFirstOccurrence) {
    std::istringstream in("30,10\n20\n10\n30\n");
    EXPECT_EQ(ParseIdStream(in, "test"), (std::vector<std::string>{"30", "10", "20"}));
}

TEST_F(IdSourceTest, KeepsIdsWiderThan64Bits) {
    std::istringstream in("123456789012345678901234567890\n");
    auto ids = ParseIdStream(in, "test");
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], "123456789012345678901234567890");
}

TEST_F(IdSourceTest, RejectsNonNumericToken) {
    std::istringstream in("1\n2 abc\n");
    try {
        ParseIdStream(in, "ids.txt");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("ids.txt:2"), std::string::npos);
        EXPECT_NE(msg.find("\"abc\""), std::string::npos);
    }
}

TEST_F(IdSourceTest, EmptyInputYieldsNoIds) {
    std::istringstream in("# nothing here\n\n");
    EXPECT_TRUE(ParseIdStream(in, "test").empty());
}

TEST_F(IdSourceTest, FileSourceReadsFile) {
    WriteFile("101\n102\n103,104\n");
    FileIdSource source(path_);
    EXPECT_EQ(source.Describe(), "file:" + path_);
    EXPECT_EQ(source.FetchIds(), (std::vector<std::string>{"101", "102", "103", "104"}));
}

TEST_F(IdSourceTest, FileSourceMissingFileThrows) {
    FileIdSource source(path_ + ".missing");
    EXPECT_THROW(source.FetchIds(), std::runtime_error);
}

TEST_F(IdSourceTest, CreateIdSourceByType) {
    auto file = CreateIdSource("file", path_);
    EXPECT_EQ(file->Describe(), "file:" + path_);

    auto stdin_source = CreateIdSource("stdin", "");
    EXPECT_EQ(stdin_source->Describe(), "stdin");

    EXPECT_THROW(CreateIdSource("http", "example"), std::invalid_argument);
}
