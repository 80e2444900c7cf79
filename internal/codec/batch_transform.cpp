#include "internal/codec/batch_transform.hpp"

#include <google/protobuf/struct.pb.h>

#include <cmath>
#include <map>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace vigil::codec {

using vigil::pipeline::v1::BatchHeader;
using vigil::pipeline::v1::CombatEvent;
using vigil::pipeline::v1::MovementEvent;
using vigil::pipeline::v1::PacketEvent;

namespace {

using Fields = google::protobuf::Map<std::string, google::protobuf::Value>;

std::optional<double> Number(const Fields& fields, const std::string& key) {
  auto it = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  return it->second.number_value();
}

std::optional<bool> Bool(const Fields& fields, const std::string& key) {
  auto it = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kBoolValue) {
    return std::nullopt;
  }
  return it->second.bool_value();
}

std::string_view String(const Fields& fields, const std::string& key) {
  auto it = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

// Shortest angle between two yaws, in degrees.
double YawDifference(double a, double b) {
  double diff = std::fabs(a - b);
  return diff > 180.0 ? 360.0 - diff : diff;
}

std::string Frame(BatchTransform transform, const BatchHeader& raw_header, const std::vector<std::string>& lines) {
  BatchHeader header = raw_header;
  header.set_transform(std::string(ToString(transform)));
  header.set_event_count(static_cast<int64_t>(lines.size()));

  std::string text = FormatJsonLine(header);
  text.push_back('\n');
  for (const auto& line : lines) {
    text += line;
    text.push_back('\n');
  }
  return text;
}

std::vector<std::string> MovementLines(const std::vector<PacketEvent>& events) {
  struct LastPosition {
    int64_t ts;
    double  x, y, z;
  };
  std::map<std::string, LastPosition, std::less<>> last;
  std::vector<std::string>                          lines;

  for (const auto& event : events) {
    const auto& fields = event.fields().fields();
    const auto  x      = Number(fields, "x");
    const auto  y      = Number(fields, "y");
    const auto  z      = Number(fields, "z");
    if (!x || !y || !z || !std::isfinite(*x) || !std::isfinite(*y) || !std::isfinite(*z)) {
      continue;
    }

    MovementEvent out;
    out.set_ts(event.ts());
    out.set_uuid(event.uuid());
    out.set_x(*x);
    out.set_y(*y);
    out.set_z(*z);
    if (auto on_ground = Bool(fields, "on_ground")) {
      out.set_on_ground(*on_ground);
    }

    auto it = last.find(event.uuid());
    if (it != last.end() && event.ts() > it->second.ts) {
      const double dt_ms = static_cast<double>(event.ts() - it->second.ts);
      const double dx    = *x - it->second.x;
      const double dy    = *y - it->second.y;
      const double dz    = *z - it->second.z;
      out.set_dt_ms(dt_ms);
      out.set_dx(dx);
      out.set_dy(dy);
      out.set_dz(dz);
      out.set_speed_bps(std::sqrt(dx * dx + dy * dy + dz * dz) / (dt_ms / 1000.0));
    }

    last.insert_or_assign(event.uuid(), LastPosition{event.ts(), *x, *y, *z});
    lines.push_back(FormatJsonLine(out));
  }
  return lines;
}

std::vector<std::string> CombatLines(const std::vector<PacketEvent>& events) {
  struct Pose {
    double x, y, z, yaw, pitch;
  };
  struct LastAttack {
    int64_t               ts;
    int64_t               target;
    std::optional<double> yaw;
  };
  std::map<std::string, Pose, std::less<>>       poses;
  std::map<std::string, LastAttack, std::less<>> attacks;
  std::vector<std::string>                       lines;

  for (const auto& event : events) {
    const auto& pkt    = event.pkt();
    const auto& fields = event.fields().fields();

    if (util::ContainsIgnoreCase(pkt, "POSITION") || util::ContainsIgnoreCase(pkt, "ROTATION")) {
      const auto x = Number(fields, "x"), y = Number(fields, "y"), z = Number(fields, "z");
      const auto yaw = Number(fields, "yaw"), pitch = Number(fields, "pitch");
      auto it = poses.find(event.uuid());
      if (it != poses.end()) {
        auto& p = it->second;
        p       = Pose{x.value_or(p.x), y.value_or(p.y), z.value_or(p.z), yaw.value_or(p.yaw), pitch.value_or(p.pitch)};
      } else if (x && y && z) {
        poses.emplace(event.uuid(), Pose{*x, *y, *z, yaw.value_or(0.0), pitch.value_or(0.0)});
      }
      continue;
    }

    if (!util::ContainsIgnoreCase(pkt, "INTERACT") && !util::ContainsIgnoreCase(pkt, "USE_ENTITY")) {
      continue;
    }
    if (String(fields, "action") != "ATTACK") {
      continue;
    }

    CombatEvent out;
    out.set_ts(event.ts());
    out.set_uuid(event.uuid());
    out.set_entity_id(static_cast<int64_t>(Number(fields, "entity_id").value_or(-1.0)));
    out.set_sneaking(Bool(fields, "sneaking").value_or(false));

    const auto pose = poses.find(event.uuid());
    if (pose != poses.end()) {
      out.set_player_x(pose->second.x);
      out.set_player_y(pose->second.y);
      out.set_player_z(pose->second.z);
      out.set_player_yaw(pose->second.yaw);
      out.set_player_pitch(pose->second.pitch);
    }

    auto previous = attacks.find(event.uuid());
    if (previous != attacks.end()) {
      const auto& prev  = previous->second;
      const double dt_ms = event.ts() > prev.ts ? static_cast<double>(event.ts() - prev.ts) : 0.0;
      out.set_dt_ms(dt_ms);
      if (dt_ms > 0.0) {
        out.set_attacks_per_second(1000.0 / dt_ms);
      }
      out.set_target_switched(out.entity_id() != prev.target);
      if (prev.yaw && pose != poses.end()) {
        out.set_yaw_diff(YawDifference(pose->second.yaw, *prev.yaw));
      }
    }

    LastAttack attack{event.ts(), out.entity_id(), std::nullopt};
    if (pose != poses.end()) {
      attack.yaw = pose->second.yaw;
    }
    attacks.insert_or_assign(event.uuid(), attack);
    lines.push_back(FormatJsonLine(out));
  }
  return lines;
}

template <typename Event>
DerivedBatch<Event> DecodeDerived(std::string_view payload, uint64_t max_decoded_bytes, BatchTransform expected) {
  if (payload.empty()) {
    throw util::InvalidArgument("empty batch payload");
  }
  const std::string text = GzipDecompress(payload, max_decoded_bytes);
  if (text.empty() || text.back() != '\n') {
    throw util::InvalidArgument("batch is truncated");
  }

  DerivedBatch<Event> decoded;
  std::size_t         line_no = 0;
  std::size_t         pos     = 0;
  while (pos < text.size()) {
    const auto end  = text.find('\n', pos);
    const auto line = std::string_view(text).substr(pos, end - pos);
    pos             = end + 1;

    if (line_no == 0) {
      ParseJsonLine(line, &decoded.header, "batch header");
      if (ParseBatchTransform(decoded.header.transform()) != expected) {
        throw util::InvalidArgument("batch is not a " + std::string(ToString(expected)) + " view");
      }
    } else {
      Event event;
      ParseJsonLine(line, &event, "derived event");
      decoded.events.push_back(std::move(event));
    }
    ++line_no;
  }

  if (decoded.header.event_count() != static_cast<int64_t>(decoded.events.size())) {
    throw util::InvalidArgument("derived batch declares " + std::to_string(decoded.header.event_count()) +
                                " events but contains " + std::to_string(decoded.events.size()));
  }
  return decoded;
}

} // namespace

std::string_view ToString(BatchTransform transform) {
  switch (transform) {
    case BatchTransform::kMovementEventsV1:
      return "movement_events_v1_ndjson_gz";
    case BatchTransform::kCombatEventsV1:
      return "combat_events_v1_ndjson_gz";
    case BatchTransform::kRaw:
    default:
      return "raw_ndjson_gz";
  }
}

std::optional<BatchTransform> ParseBatchTransform(std::string_view name) {
  const auto trimmed = util::Trim(name);
  if (trimmed.empty()) {
    return BatchTransform::kRaw;
  }
  for (auto t : {BatchTransform::kRaw, BatchTransform::kMovementEventsV1, BatchTransform::kCombatEventsV1}) {
    if (util::EqualsIgnoreCase(trimmed, ToString(t))) {
      return t;
    }
  }
  return std::nullopt;
}

std::shared_ptr<arrow::Buffer> ApplyTransform(BatchTransform transform, const DecodedBatch& raw) {
  switch (transform) {
    case BatchTransform::kMovementEventsV1:
      return GzipCompress(Frame(transform, raw.header, MovementLines(raw.events)));
    case BatchTransform::kCombatEventsV1:
      return GzipCompress(Frame(transform, raw.header, CombatLines(raw.events)));
    case BatchTransform::kRaw:
    default: {
      std::vector<std::string> lines;
      lines.reserve(raw.events.size());
      for (const auto& event : raw.events) {
        lines.push_back(FormatEventLine(event));
      }
      BatchHeader header = raw.header;
      header.clear_transform();
      std::string text = FormatJsonLine(header);
      text.push_back('\n');
      for (const auto& line : lines) {
        text += line;
        text.push_back('\n');
      }
      return GzipCompress(text);
    }
  }
}

DerivedBatch<MovementEvent> DecodeMovementEvents(std::string_view payload, uint64_t max_decoded_bytes) {
  return DecodeDerived<MovementEvent>(payload, max_decoded_bytes, BatchTransform::kMovementEventsV1);
}

DerivedBatch<CombatEvent> DecodeCombatEvents(std::string_view payload, uint64_t max_decoded_bytes) {
  return DecodeDerived<CombatEvent>(payload, max_decoded_bytes, BatchTransform::kCombatEventsV1);
}

} // namespace vigil::codec
