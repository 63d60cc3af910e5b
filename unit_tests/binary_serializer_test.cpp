/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/binary_serializer.hpp"

#include <gtest/gtest.h>

using namespace dgen;

namespace {

// Splits a framed buffer into its validated header and a body buffer ready for decode().
Message decode_framed(const TBuffer &framed) {
  TBuffer header_bytes;
  header_bytes.append(framed.get(), PacketHeader::size());
  PacketHeader header = BinarySerializer::decode_header(header_bytes);
  EXPECT_EQ(header.length, framed.size() - PacketHeader::size());

  TBuffer body;
  body.append(framed.get() + PacketHeader::size(), framed.size() - PacketHeader::size());
  body.set_endianess(header.endianess);
  return BinarySerializer::decode(body);
}

TBuffer body_of(const Message &message) {
  TBuffer body;
  BinarySerializer::serialize(message, body);
  return body;
}

Endianness opposite(Endianness e) {
  return e == Endianness::LITTLE ? Endianness::BIG : Endianness::LITTLE;
}

template <typename T> void append_swapped(TBuffer &buffer, T value) {
  bswap(value);
  buffer.append(value);
}

} // namespace

TEST(BinarySerializerTest, HeaderIsTenBytes) {
  Message msg(CommandType::HELLO, "client0");
  TBuffer framed = BinarySerializer::encode(msg);
  EXPECT_EQ(PacketHeader::size(), 10u);
  EXPECT_EQ(framed.get()[0], PROTOCOL_VERSION);
  EXPECT_EQ(framed.get()[1], static_cast<uint8_t>(get_system_endianness()));
}

TEST(BinarySerializerTest, HelloAndByeCarryNoPayload) {
  for (CommandType cmd : {CommandType::HELLO, CommandType::BYE}) {
    Message decoded = decode_framed(BinarySerializer::encode(Message(cmd, "client3")));
    EXPECT_EQ(decoded.command(), cmd);
    EXPECT_EQ(decoded.sender(), "client3");
    EXPECT_TRUE(decoded.has_type<std::monostate>());
  }
}

TEST(BinarySerializerTest, ConfigCarriesText) {
  std::string config = R"({"spec_name":"tpch.json","cfgs":[]})";
  Message decoded =
      decode_framed(BinarySerializer::encode(Message(CommandType::CONFIG, COORDINATOR_ID, config)));
  EXPECT_EQ(decoded.command(), CommandType::CONFIG);
  EXPECT_EQ(decoded.sender(), COORDINATOR_ID);
  EXPECT_EQ(decoded.get<std::string>(), config);
}

TEST(BinarySerializerTest, RequestBatchCarriesCount) {
  Message decoded = decode_framed(
      BinarySerializer::encode(Message(CommandType::REQUEST_BATCH, "client0", uint32_t{7})));
  EXPECT_EQ(decoded.get<uint32_t>(), 7u);
}

TEST(BinarySerializerTest, BatchCarriesIds) {
  std::vector<ChunkId> ids{0, 1, 2, 1234567890123};
  Message decoded =
      decode_framed(BinarySerializer::encode(Message(CommandType::BATCH, COORDINATOR_ID, ids)));
  EXPECT_EQ(decoded.get<std::vector<ChunkId>>(), ids);

  Message empty = decode_framed(BinarySerializer::encode(
      Message(CommandType::BATCH, COORDINATOR_ID, std::vector<ChunkId>{})));
  EXPECT_TRUE(empty.get<std::vector<ChunkId>>().empty());
}

TEST(BinarySerializerTest, ReportAndGiveUpCarryOutcomes) {
  ChunkReport ok{4, ChunkOutcome::SUCCEEDED, ""};
  ChunkReport bad{5, ChunkOutcome::FAILED, "generator exited with 1", {1500000, 250, 0}};

  Message report = decode_framed(
      BinarySerializer::encode(Message(CommandType::REPORT, "client1", ChunkReport(bad))));
  EXPECT_EQ(report.get<ChunkReport>(), bad);

  Message give_up = decode_framed(BinarySerializer::encode(
      Message(CommandType::GIVE_UP, "client1", std::vector<ChunkReport>{ok, bad})));
  EXPECT_EQ(give_up.get<std::vector<ChunkReport>>(), (std::vector<ChunkReport>{ok, bad}));
}

TEST(BinarySerializerTest, RejectsProtocolVersionMismatch) {
  TBuffer framed = BinarySerializer::encode(Message(CommandType::HELLO, "client0"));
  TBuffer header_bytes;
  header_bytes.append(framed.get(), PacketHeader::size());
  header_bytes.get()[0] = PROTOCOL_VERSION + 1;
  EXPECT_THROW(BinarySerializer::decode_header(header_bytes), ProtocolError);
}

TEST(BinarySerializerTest, RejectsBadEndiannessMarker) {
  TBuffer header_bytes;
  header_bytes.append(PROTOCOL_VERSION);
  header_bytes.append(uint8_t{7});
  header_bytes.append(uint64_t{4});
  EXPECT_THROW(BinarySerializer::decode_header(header_bytes), ProtocolError);
}

TEST(BinarySerializerTest, RejectsOversizedBody) {
  TBuffer header_bytes;
  BinarySerializer::serialize(PacketHeader(MAX_MESSAGE_SIZE + 1), header_bytes);
  EXPECT_THROW(BinarySerializer::decode_header(header_bytes), ProtocolError);

  TBuffer at_limit;
  BinarySerializer::serialize(PacketHeader(MAX_MESSAGE_SIZE), at_limit);
  EXPECT_EQ(BinarySerializer::decode_header(at_limit).length, MAX_MESSAGE_SIZE);
}

TEST(BinarySerializerTest, RejectsTruncatedHeader) {
  TBuffer header_bytes;
  header_bytes.append(PROTOCOL_VERSION);
  EXPECT_THROW(BinarySerializer::decode_header(header_bytes), ProtocolError);
}

TEST(BinarySerializerTest, RejectsTruncatedBody) {
  TBuffer full = body_of(Message(CommandType::BATCH, COORDINATOR_ID, std::vector<ChunkId>{1, 2}));
  TBuffer truncated;
  truncated.append(full.get(), full.size() - 3);
  EXPECT_THROW(BinarySerializer::decode(truncated), ProtocolError);
}

TEST(BinarySerializerTest, RejectsTrailingBytes) {
  TBuffer body = body_of(Message(CommandType::BYE, "client0"));
  body.append(uint8_t{0});
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, RejectsUnknownCommand) {
  TBuffer body;
  body.append(static_cast<uint16_t>(CommandType::_COUNT));
  body.append(std::string("client0"));
  body.append(uint64_t{0});
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, RejectsPayloadThatDoesNotMatchCommand) {
  // REQUEST_BATCH must carry a count, not text.
  TBuffer body = body_of(Message(CommandType::REQUEST_BATCH, "client0", std::string("five")));
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, RejectsImpossibleElementCount) {
  TBuffer body;
  body.append(static_cast<uint16_t>(CommandType::BATCH));
  body.append(std::string(COORDINATOR_ID));
  body.append(variant_index<PayloadType, std::vector<ChunkId>>());
  body.append(uint64_t{1} << 40);
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, RejectsUnknownOutcome) {
  TBuffer body;
  body.append(static_cast<uint16_t>(CommandType::REPORT));
  body.append(std::string("client0"));
  body.append(variant_index<PayloadType, ChunkReport>());
  body.append(int64_t{3});
  body.append(uint8_t{9});
  body.append(std::string(""));
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, RejectsReportWithoutTiming) {
  TBuffer body;
  body.append(static_cast<uint16_t>(CommandType::REPORT));
  body.append(std::string("client0"));
  body.append(variant_index<PayloadType, ChunkReport>());
  body.append(int64_t{3});
  body.append(static_cast<uint8_t>(ChunkOutcome::SUCCEEDED));
  body.append(std::string(""));
  EXPECT_THROW(BinarySerializer::decode(body), ProtocolError);
}

TEST(BinarySerializerTest, DecodesBodyWrittenInOtherByteOrder) {
  TBuffer body;
  append_swapped(body, static_cast<uint16_t>(CommandType::REQUEST_BATCH));
  std::string sender = "client9";
  append_swapped(body, static_cast<uint64_t>(sender.size()));
  body.append(reinterpret_cast<const uint8_t *>(sender.data()), sender.size());
  append_swapped(body, variant_index<PayloadType, uint32_t>());
  append_swapped(body, uint32_t{42});
  body.set_endianess(opposite(get_system_endianness()));

  Message decoded = BinarySerializer::decode(body);
  EXPECT_EQ(decoded.command(), CommandType::REQUEST_BATCH);
  EXPECT_EQ(decoded.sender(), sender);
  EXPECT_EQ(decoded.get<uint32_t>(), 42u);
}

TEST(BinarySerializerTest, HeaderFromOtherByteOrderHasLengthSwapped) {
  TBuffer header_bytes;
  header_bytes.append(PROTOCOL_VERSION);
  header_bytes.append(static_cast<uint8_t>(opposite(get_system_endianness())));
  append_swapped(header_bytes, uint64_t{123});
  PacketHeader header = BinarySerializer::decode_header(header_bytes);
  EXPECT_EQ(header.length, 123u);
  EXPECT_EQ(header.endianess, opposite(get_system_endianness()));
}
