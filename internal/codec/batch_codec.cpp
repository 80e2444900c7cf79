#include "internal/codec/batch_codec.hpp"

#include <arrow/io/compressed.h>
#include <arrow/io/memory.h>
#include <arrow/util/compression.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace vigil::codec {

using storage::common::Unwrap;
using vigil::pipeline::v1::BatchHeader;
using vigil::pipeline::v1::PacketEvent;

namespace {

constexpr int64_t kDecompressChunkBytes = 64 * 1024;

void ToProtoValue(const model::FieldValue& field, const std::string& key, google::protobuf::Value* out) {
  switch (field.index()) {
    case 1:
      out->set_bool_value(std::get<bool>(field));
      break;
    case 2:
      if (!std::isfinite(std::get<double>(field))) {
        throw util::InvalidArgument("field '" + key + "' is not a finite number");
      }
      out->set_number_value(std::get<double>(field));
      break;
    case 3:
      out->set_string_value(std::get<std::string>(field));
      break;
    default:
      out->set_null_value(google::protobuf::NULL_VALUE);
      break;
  }
}

model::FieldValue FromProtoValue(const google::protobuf::Value& value, const std::string& key) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      return std::monostate{};
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue:
      return value.number_value();
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    default:
      throw util::InvalidArgument("field '" + key + "' is not a scalar");
  }
}

} // namespace

std::string FormatJsonLine(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize batch line: " + std::string(status.message()));
  }
  return json;
}

void ParseJsonLine(std::string_view line, google::protobuf::Message* message, std::string_view what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(line), message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("malformed " + std::string(what) + ": " + std::string(status.message()));
  }
}

std::shared_ptr<arrow::Buffer> GzipCompress(std::string_view data) {
  auto codec = Unwrap(arrow::util::Codec::Create(arrow::Compression::GZIP));
  auto sink  = Unwrap(arrow::io::BufferOutputStream::Create());
  auto out   = Unwrap(arrow::io::CompressedOutputStream::Make(codec.get(), sink));

  Unwrap(out->Write(data.data(), static_cast<int64_t>(data.size())));
  Unwrap(out->Close());
  return Unwrap(sink->Finish());
}

std::string GzipDecompress(std::string_view data, uint64_t max_bytes) {
  auto codec = Unwrap(arrow::util::Codec::Create(arrow::Compression::GZIP));
  auto raw   = std::make_shared<arrow::io::BufferReader>(
      std::make_shared<arrow::Buffer>(reinterpret_cast<const uint8_t*>(data.data()), static_cast<int64_t>(data.size())));

  auto in = arrow::io::CompressedInputStream::Make(codec.get(), raw);
  if (!in.ok()) {
    throw util::InvalidArgument("payload is not a gzip stream: " + in.status().ToString());
  }

  std::string out;
  for (;;) {
    auto chunk = (*in)->Read(kDecompressChunkBytes);
    if (!chunk.ok()) {
      throw util::InvalidArgument("payload is not a valid gzip stream: " + chunk.status().ToString());
    }
    if ((*chunk)->size() == 0) {
      break;
    }
    if (out.size() + static_cast<uint64_t>((*chunk)->size()) > max_bytes) {
      throw util::InvalidArgument("decompressed batch exceeds " + std::to_string(max_bytes) + " bytes");
    }
    out.append(reinterpret_cast<const char*>((*chunk)->data()), static_cast<std::size_t>((*chunk)->size()));
  }
  return out;
}

PacketEvent ToEvent(const model::PacketRecord& record) {
  PacketEvent event;
  event.set_ts(record.timestamp_ms);
  event.set_dir(std::string(model::ToString(record.direction)));
  event.set_pkt(record.event_type);
  if (record.entity_id) event.set_uuid(*record.entity_id);
  if (record.entity_name) event.set_name(*record.entity_name);

  auto* fields = event.mutable_fields()->mutable_fields();
  for (const auto& [key, value] : record.fields) {
    ToProtoValue(value, key, &(*fields)[key]);
  }
  return event;
}

model::PacketRecord FromEvent(const PacketEvent& event) {
  if (event.pkt().empty()) {
    throw util::InvalidArgument("event has no pkt");
  }

  model::PacketRecord record;
  record.timestamp_ms = event.ts();
  record.event_type   = event.pkt();

  if (event.dir().empty()) {
    record.direction = model::Direction::kServerbound;
  } else if (auto dir = model::ParseDirection(event.dir())) {
    record.direction = *dir;
  } else {
    throw util::InvalidArgument("event has unknown dir '" + event.dir() + "'");
  }

  if (!event.uuid().empty()) record.entity_id = event.uuid();
  if (event.has_name()) record.entity_name = event.name();

  for (const auto& [key, value] : event.fields().fields()) {
    record.fields.emplace(key, FromProtoValue(value, key));
  }
  return record;
}

PacketEvent ParseEventLine(std::string_view line) {
  PacketEvent event;
  ParseJsonLine(line, &event, "event line");
  return event;
}

std::string FormatEventLine(const PacketEvent& event) {
  return FormatJsonLine(event);
}

std::shared_ptr<arrow::Buffer> EncodeBatch(const model::PacketBatch& batch) {
  BatchHeader header;
  header.set_source_id(batch.source_id);
  header.set_session_id(batch.session_id);
  header.set_created_at_ms(batch.created_at_ms);
  header.set_event_count(batch.RecordCount());

  std::string text = FormatJsonLine(header);
  text.push_back('\n');
  for (const auto& record : batch.records) {
    text += FormatJsonLine(ToEvent(record));
    text.push_back('\n');
  }
  return GzipCompress(text);
}

DecodedBatch DecodeBatch(std::string_view payload, uint64_t max_decoded_bytes) {
  if (payload.empty()) {
    throw util::InvalidArgument("empty batch payload");
  }

  const std::string text = GzipDecompress(payload, max_decoded_bytes);
  if (text.empty() || text.back() != '\n') {
    throw util::InvalidArgument("batch is truncated");
  }

  DecodedBatch decoded;
  std::size_t  line_no = 0;
  std::size_t  pos     = 0;
  while (pos < text.size()) {
    const auto end  = text.find('\n', pos);
    const auto line = std::string_view(text).substr(pos, end - pos);
    pos             = end + 1;

    if (line.empty()) {
      throw util::InvalidArgument("blank line " + std::to_string(line_no + 1) + " in batch");
    }

    if (line_no == 0) {
      ParseJsonLine(line, &decoded.header, "batch header");
      if (decoded.header.source_id().empty() || decoded.header.session_id().empty()) {
        throw util::InvalidArgument("batch header is missing source_id or session_id");
      }
      if (!decoded.header.transform().empty()) {
        throw util::InvalidArgument("batch is a derived '" + decoded.header.transform() + "' view, not raw events");
      }
    } else {
      auto event = ParseEventLine(line);
      if (event.pkt().empty() || event.uuid().empty()) {
        throw util::InvalidArgument("event on line " + std::to_string(line_no + 1) + " is missing pkt or uuid");
      }
      if (!event.dir().empty() && !model::ParseDirection(event.dir())) {
        throw util::InvalidArgument("event on line " + std::to_string(line_no + 1) + " has unknown dir");
      }
      decoded.events.push_back(std::move(event));
    }
    ++line_no;
  }

  if (line_no == 0) {
    throw util::InvalidArgument("batch has no header");
  }
  if (decoded.header.event_count() != static_cast<int64_t>(decoded.events.size())) {
    throw util::InvalidArgument("batch header declares " + std::to_string(decoded.header.event_count()) + " events but contains " +
                                std::to_string(decoded.events.size()));
  }
  return decoded;
}

} // namespace vigil::codec
