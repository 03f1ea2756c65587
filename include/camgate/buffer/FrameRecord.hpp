// Repository: Retrovue-camgate
// Component: FrameRecord
// Purpose: One encoded media unit as handed over by the network layer.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_BUFFER_FRAME_RECORD_HPP_
#define CAMGATE_BUFFER_FRAME_RECORD_HPP_

#include <cstdint>
#include <vector>

namespace camgate::buffer {

enum class MediaKind {
  kVideo,
  kAudio,
};

// Codec identifiers as carried by the camera stream.
enum class CodecId {
  kH264,
  kH265,
  kOpus,
  kPcmA,  // G.711 A-law
  kPcmU,  // G.711 mu-law
};

const char* CodecIdName(CodecId codec);
const char* MediaKindName(MediaKind kind);
bool IsVideoCodec(CodecId codec);

// FrameRecord is created by the producer at ingestion, owned by FrameBuffer
// while queued, and moved to the decode worker on Take().
struct FrameRecord {
  MediaKind media_kind = MediaKind::kVideo;
  CodecId codec_id = CodecId::kH264;
  std::vector<uint8_t> payload;
  int64_t timestamp = 0;  // Capture time, ms (monotonic at the source)
  int channel = 0;        // Camera multiplex channel
  bool is_keyframe = false;  // Video only: decodable without references
};

}  // namespace camgate::buffer

#endif  // CAMGATE_BUFFER_FRAME_RECORD_HPP_
