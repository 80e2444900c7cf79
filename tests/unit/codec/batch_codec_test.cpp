#include <cassert>
#include <iostream>
#include <limits>
#include <string>
#include <variant>

#include "internal/codec/batch_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using vigil::codec::DecodeBatch;
using vigil::codec::EncodeBatch;
using vigil::codec::GzipCompress;
using vigil::model::Direction;
using vigil::model::PacketBatch;
using vigil::model::PacketRecord;

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size()));
}

template <typename Fn>
bool ThrowsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const vigil::util::InvalidArgument&) {
    return true;
  }
  return false;
}

PacketBatch MakeBatch() {
  PacketBatch batch;
  batch.source_id     = "server-a";
  batch.session_id    = "boot-7";
  batch.created_at_ms = 1'700'000'000'123;

  PacketRecord move;
  move.timestamp_ms = 1'700'000'000'100;
  move.direction    = Direction::kServerbound;
  move.event_type   = "PLAYER_POSITION";
  move.entity_id    = "8f14e45f-ceea-467a-9af0-0000000000aa";
  move.entity_name  = "Steve";
  move.fields.emplace("x", 12.5);
  move.fields.emplace("on_ground", true);
  move.fields.emplace("world", std::string("overworld"));
  move.fields.emplace("vehicle", std::monostate{});
  batch.records.push_back(move);

  PacketRecord hit;
  hit.timestamp_ms = 1'700'000'000'110;
  hit.direction    = Direction::kClientbound;
  hit.event_type   = "INTERACT_ENTITY";
  hit.entity_id    = "8f14e45f-ceea-467a-9af0-0000000000aa";
  batch.records.push_back(hit);
  return batch;
}

void TestEncodeDecodePreservesHeaderAndEvents() {
  const auto batch   = MakeBatch();
  const auto decoded = DecodeBatch(AsString(EncodeBatch(batch)));

  assert(decoded.header.source_id() == "server-a");
  assert(decoded.header.session_id() == "boot-7");
  assert(decoded.header.created_at_ms() == batch.created_at_ms);
  assert(decoded.header.event_count() == 2);
  assert(decoded.events.size() == 2);

  auto first = vigil::codec::FromEvent(decoded.events[0]);
  assert(first.timestamp_ms == batch.records[0].timestamp_ms);
  assert(first.entity_name == std::optional<std::string>("Steve"));
  assert(std::get<double>(first.fields.at("x")) == 12.5);
  assert(std::get<bool>(first.fields.at("on_ground")));
  assert(std::get<std::string>(first.fields.at("world")) == "overworld");
  assert(std::holds_alternative<std::monostate>(first.fields.at("vehicle")));

  auto second = vigil::codec::FromEvent(decoded.events[1]);
  assert(second.direction == Direction::kClientbound);
  assert(!second.entity_name.has_value());
}

void TestEmptyBatchHasHeaderOnly() {
  PacketBatch batch;
  batch.source_id  = "s";
  batch.session_id = "x";
  const auto decoded = DecodeBatch(AsString(EncodeBatch(batch)));
  assert(decoded.events.empty());
  assert(decoded.header.event_count() == 0);
}

void TestEventLineIsProtoJsonWithFieldNames() {
  auto event = vigil::codec::ParseEventLine(
      R"({"ts":"5","dir":"serverbound","pkt":"PLAYER_FLYING","uuid":"u-1","name":"Alex","fields":{"y":64}})");
  assert(event.ts() == 5);
  assert(event.name() == "Alex");

  const auto line = vigil::codec::FormatEventLine(event);
  assert(line.find("\"pkt\":\"PLAYER_FLYING\"") != std::string::npos);
  assert(line.find("\"uuid\":\"u-1\"") != std::string::npos);

  assert(ThrowsInvalid([] { vigil::codec::ParseEventLine(R"({"pkt":"X","bogus":1})"); }));
  assert(ThrowsInvalid([] { vigil::codec::ParseEventLine("not json"); }));
}

void TestFromEventValidation() {
  vigil::pipeline::v1::PacketEvent event;
  assert(ThrowsInvalid([&] { vigil::codec::FromEvent(event); }));

  event.set_pkt("PLAYER_POSITION");
  event.set_dir("sideways");
  assert(ThrowsInvalid([&] { vigil::codec::FromEvent(event); }));

  event.set_dir("");
  auto record = vigil::codec::FromEvent(event);
  assert(record.direction == Direction::kServerbound);
  assert(!record.HasIdentity());
}

void TestMalformedPayloadsAreRejected() {
  assert(ThrowsInvalid([] { DecodeBatch(""); }));
  assert(ThrowsInvalid([] { DecodeBatch("plain text, not gzip"); }));

  // truncated final line
  assert(ThrowsInvalid([] {
    DecodeBatch(AsString(GzipCompress(R"({"source_id":"s","session_id":"x","event_count":"0"})")));
  }));

  // header without identity
  assert(ThrowsInvalid([] { DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"event_count\":\"0\"}\n"))); }));

  // declared count disagrees with the body
  assert(ThrowsInvalid([] {
    DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":\"2\"}\n"
                                      "{\"ts\":\"1\",\"pkt\":\"PLAYER_POSITION\",\"uuid\":\"u\"}\n")));
  }));

  // event without an entity
  assert(ThrowsInvalid([] {
    DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":\"1\"}\n"
                                      "{\"ts\":\"1\",\"pkt\":\"PLAYER_POSITION\"}\n")));
  }));

  // blank line inside the body
  assert(ThrowsInvalid([] {
    DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":\"0\"}\n\n")));
  }));

  // a gzip stream cut short
  auto good = AsString(EncodeBatch(MakeBatch()));
  auto cut  = good.substr(0, good.size() / 2);
  assert(ThrowsInvalid([&] { DecodeBatch(cut); }));
}

void TestDecompressedSizeIsCapped() {
  // compresses to a few KiB
  std::string text = "{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":\"0\"}\n";
  text.append(1 << 20, ' ');
  text.push_back('\n');
  const auto payload = AsString(GzipCompress(text));
  assert(payload.size() < 64 * 1024);

  bool capped = false;
  try {
    DecodeBatch(payload, 256 * 1024);
  } catch (const vigil::util::InvalidArgument& e) {
    capped = std::string(e.what()).find("exceeds") != std::string::npos;
  }
  assert(capped);

  assert(vigil::codec::GzipDecompress(payload, text.size()) == text);
  assert(ThrowsInvalid([&] { vigil::codec::GzipDecompress(payload, text.size() - 1); }));
}

void TestNonFiniteNumbersAreRejected() {
  PacketRecord record;
  record.timestamp_ms = 1;
  record.event_type   = "PLAYER_POSITION";
  record.entity_id    = "u-1";
  record.fields.emplace("x", std::numeric_limits<double>::quiet_NaN());
  assert(ThrowsInvalid([&] { vigil::codec::ToEvent(record); }));

  record.fields["x"] = std::numeric_limits<double>::infinity();
  assert(ThrowsInvalid([&] { vigil::codec::ToEvent(record); }));

  record.fields["x"] = 1.0;
  assert(vigil::codec::ToEvent(record).fields().fields().at("x").number_value() == 1.0);
}

void TestNumericTimestampIsAccepted() {
  const auto decoded =
      DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":1}\n"
                                        "{\"ts\":1700000000100,\"pkt\":\"PLAYER_POSITION\",\"uuid\":\"u\"}\n")));
  assert(decoded.events.size() == 1);
  assert(decoded.events[0].ts() == 1'700'000'000'100);
}

void TestDerivedViewIsNotARawBatch() {
  assert(ThrowsInvalid([] {
    DecodeBatch(AsString(GzipCompress("{\"source_id\":\"s\",\"session_id\":\"x\",\"event_count\":\"0\","
                                      "\"transform\":\"movement_events_v1_ndjson_gz\"}\n")));
  }));
}

} // namespace

int main() {
  TestEncodeDecodePreservesHeaderAndEvents();
  TestEmptyBatchHasHeaderOnly();
  TestEventLineIsProtoJsonWithFieldNames();
  TestFromEventValidation();
  TestMalformedPayloadsAreRejected();
  TestDecompressedSizeIsCapped();
  TestNonFiniteNumbersAreRejected();
  TestNumericTimestampIsAccepted();
  TestDerivedViewIsNotARawBatch();
  std::cout << "vigil_batch_codec_test: pass\n";
  return 0;
}
