#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/packet_batch.hpp"
#include "vigil/pipeline/v1/batch.pb.h"

namespace vigil::codec {

/*
  Spool / wire format for one batch.

      gzip(
        {"source_id":..,"session_id":..,"created_at_ms":..,"event_count":..}\n
        {"ts":..,"dir":..,"pkt":..,"uuid":..,"name":..,"fields":{..}}\n
        ...
      )

  Lines are proto3 JSON of BatchHeader / PacketEvent with original field
  names, so int64 values such as ts are written as JSON strings. Readers
  accept ts either quoted or as a bare number. Non-finite numbers have no
  JSON form and are rejected on encode.

  Decoding is bounded twice: callers bound the compressed size, and the
  decompressed text may not exceed max_decoded_bytes.
*/

inline constexpr uint64_t kDefaultMaxDecodedBytes = 128ULL * 1024 * 1024;

struct DecodedBatch {
  vigil::pipeline::v1::BatchHeader              header;
  std::vector<vigil::pipeline::v1::PacketEvent> events;
};

std::shared_ptr<arrow::Buffer> EncodeBatch(const model::PacketBatch& batch);

// Throws util::InvalidArgument on any structural problem.
DecodedBatch DecodeBatch(std::string_view payload, uint64_t max_decoded_bytes = kDefaultMaxDecodedBytes);

// Throws util::InvalidArgument when a number field is NaN or infinite.
vigil::pipeline::v1::PacketEvent ToEvent(const model::PacketRecord& record);

// Throws util::InvalidArgument when required fields are missing.
model::PacketRecord FromEvent(const vigil::pipeline::v1::PacketEvent& event);

// One JSON object, as written to the spool or fed on the agent's stdin.
vigil::pipeline::v1::PacketEvent ParseEventLine(std::string_view line);
std::string                      FormatEventLine(const vigil::pipeline::v1::PacketEvent& event);

// Any message as one JSON line, with original field names.
std::string FormatJsonLine(const google::protobuf::Message& message);
void        ParseJsonLine(std::string_view line, google::protobuf::Message* message, std::string_view what);

std::shared_ptr<arrow::Buffer> GzipCompress(std::string_view data);
// Throws util::InvalidArgument on a bad stream or once the output passes max_bytes.
std::string GzipDecompress(std::string_view data, uint64_t max_bytes = kDefaultMaxDecodedBytes);

} // namespace vigil::codec
