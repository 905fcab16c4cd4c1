#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "test_utils.hpp"

using namespace ghostnet::network;

class CodecTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::warning);
  }

  const std::string valid_checksum = std::string(64, 'a');
};


// ---- HEADERS ----

TEST_F(CodecTest, TextHeaderEncodesExpectedFields) {
  MessageHeader header = Codec::make_text_header("hello there");
  auto j = nlohmann::json::parse(Codec::encode_header(header));

  EXPECT_EQ(j["type"], "TEXT");
  EXPECT_EQ(j["content"], "hello there");
  EXPECT_FALSE(j["timestamp"].get<std::string>().empty());
  EXPECT_FALSE(j.contains("filename"));
}

TEST_F(CodecTest, FileHeaderDecodes) {
  MessageHeader header = Codec::make_file_header("report.pdf", 1234, valid_checksum);
  MessageHeader decoded = Codec::decode_header(Codec::encode_header(header));

  EXPECT_EQ(decoded.type, MessageType::FILE);
  EXPECT_EQ(decoded.filename, "report.pdf");
  EXPECT_EQ(decoded.filesize, 1234u);
  EXPECT_EQ(decoded.checksum, valid_checksum);
  EXPECT_EQ(decoded.timestamp, header.timestamp);
}

TEST_F(CodecTest, UnicodeTextSurvivesEncoding) {
  const std::string text = "Grüße 👻 \"quoted\" \\ back\nslash";
  MessageHeader decoded = Codec::decode_header(Codec::encode_header(Codec::make_text_header(text)));
  EXPECT_EQ(decoded.content, text);
}

TEST_F(CodecTest, RejectsMalformedHeaders) {
  EXPECT_THROW(Codec::decode_header("not json"), ProtocolError);
  EXPECT_THROW(Codec::decode_header("[1,2,3]"), ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"content":"x"})"), ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"TEXT"})"), ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"PING"})"), ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"FILE","filesize":1,"checksum":")" + valid_checksum + "\"}"),
               ProtocolError);
}

TEST_F(CodecTest, RejectsInvalidFileFields) {
  EXPECT_THROW(Codec::decode_header(R"({"type":"FILE","filename":"a","filesize":-5,"checksum":")" + valid_checksum + "\"}"),
               ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"FILE","filename":"a","filesize":"10","checksum":")" + valid_checksum + "\"}"),
               ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"FILE","filename":"a","filesize":10,"checksum":"abc"})"),
               ProtocolError);
  EXPECT_THROW(Codec::decode_header(R"({"type":"FILE","filename":"a","filesize":10,"checksum":")" + std::string(64, 'z') + "\"}"),
               ProtocolError);
}

TEST_F(CodecTest, RejectsFileSizeOverCap) {
  MessageHeader at_cap = Codec::make_file_header("big.bin", Codec::MAX_FILE_SIZE, valid_checksum);
  EXPECT_NO_THROW(Codec::decode_header(Codec::encode_header(at_cap)));

  MessageHeader over_cap = Codec::make_file_header("big.bin", Codec::MAX_FILE_SIZE + 1, valid_checksum);
  EXPECT_THROW(Codec::decode_header(Codec::encode_header(over_cap)), ProtocolError);
}

TEST_F(CodecTest, DelimiterIsOutsideBase64UrlAlphabet) {
  const std::string delimiter = Codec::HEADER_DELIMITER;
  EXPECT_EQ(delimiter, "<HEADER_END>");
  EXPECT_NE(delimiter.find('<'), std::string::npos);
}


// ---- BEACONS ----

TEST_F(CodecTest, BeaconMatchesWireFormat) {
  auto j = nlohmann::json::parse(Codec::encode_beacon(Beacon{"Alice", "192.168.1.10"}));
  EXPECT_EQ(j["type"], "BEACON");
  EXPECT_EQ(j["username"], "Alice");
  EXPECT_EQ(j["ip"], "192.168.1.10");

  auto beacon = Codec::decode_beacon(R"({"type":"BEACON","username":"Bob","ip":"10.0.0.2"})");
  ASSERT_TRUE(beacon.has_value());
  EXPECT_EQ(beacon->username, "Bob");
  EXPECT_EQ(beacon->ip, "10.0.0.2");
}

TEST_F(CodecTest, MalformedBeaconsAreDropped) {
  EXPECT_FALSE(Codec::decode_beacon("").has_value());
  EXPECT_FALSE(Codec::decode_beacon("garbage").has_value());
  EXPECT_FALSE(Codec::decode_beacon(R"({"type":"TEXT","username":"a","ip":"1.2.3.4"})").has_value());
  EXPECT_FALSE(Codec::decode_beacon(R"({"type":"BEACON","ip":"1.2.3.4"})").has_value());
  EXPECT_FALSE(Codec::decode_beacon(R"({"type":"BEACON","username":"","ip":"1.2.3.4"})").has_value());
  EXPECT_FALSE(Codec::decode_beacon(R"({"type":"BEACON","username":5,"ip":"1.2.3.4"})").has_value());

  const std::string oversized = R"({"type":"BEACON","username":")" + std::string(Codec::MAX_BEACON_SIZE, 'x')
                                + R"(","ip":"1.2.3.4"})";
  EXPECT_FALSE(Codec::decode_beacon(oversized).has_value());
}


// ---- FILENAMES ----

TEST_F(CodecTest, SanitizeStripsTraversal) {
  const std::string name = Codec::sanitize_filename("../../etc/passwd");
  EXPECT_EQ(name, "passwd");
  EXPECT_EQ(name.find('/'), std::string::npos);

  EXPECT_EQ(Codec::sanitize_filename("C:\\Users\\me\\secret.txt"), "secret.txt");
  EXPECT_EQ(Codec::sanitize_filename("..\\..\\boot.ini"), "boot.ini");
}

TEST_F(CodecTest, SanitizeKeepsSafeNamesUnchanged) {
  for (const std::string name : {"photo.jpg", "My Report (final)-v2.pdf", "a_b.tar.gz"}) {
    EXPECT_EQ(Codec::sanitize_filename(name), name);
    EXPECT_EQ(Codec::sanitize_filename(Codec::sanitize_filename(name)), Codec::sanitize_filename(name));
  }
}

TEST_F(CodecTest, SanitizeFiltersCharacters) {
  EXPECT_EQ(Codec::sanitize_filename("in*va|lid?:<name>.txt"), "invalidname.txt");
  EXPECT_EQ(Codec::sanitize_filename(".hidden"), "hidden");
  EXPECT_EQ(Codec::sanitize_filename(".."), Codec::PLACEHOLDER_FILENAME);
  EXPECT_EQ(Codec::sanitize_filename(""), Codec::PLACEHOLDER_FILENAME);
  EXPECT_EQ(Codec::sanitize_filename("???"), Codec::PLACEHOLDER_FILENAME);
  EXPECT_EQ(Codec::sanitize_filename("dir/"), Codec::PLACEHOLDER_FILENAME);
}

TEST_F(CodecTest, SanitizeTruncatesLongNamesKeepingExtension) {
  const std::string name = Codec::sanitize_filename(std::string(400, 'a') + ".txt");
  EXPECT_EQ(name.size(), Codec::MAX_FILENAME_LENGTH);
  EXPECT_EQ(name.substr(name.size() - 4), ".txt");
  EXPECT_EQ(Codec::sanitize_filename(name), name);
}

TEST_F(CodecTest, UniqueDestinationAppendsCounter) {
  TempDir dir("codec");

  EXPECT_EQ(Codec::unique_destination(dir.path(), "notes.txt"), dir / "notes.txt");

  write_file(dir / "notes.txt", "1");
  EXPECT_EQ(Codec::unique_destination(dir.path(), "notes.txt"), dir / "notes_1.txt");

  write_file(dir / "notes_1.txt", "2");
  EXPECT_EQ(Codec::unique_destination(dir.path(), "notes.txt"), dir / "notes_2.txt");

  write_file(dir / "README", "3");
  EXPECT_EQ(Codec::unique_destination(dir.path(), "README"), dir / "README_1");
}
