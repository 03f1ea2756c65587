// Repository: Retrovue-camgate
// Component: FrameRecord
// Copyright (c) 2025 RetroVue

#include "camgate/buffer/FrameRecord.hpp"

namespace camgate::buffer {

const char* CodecIdName(CodecId codec) {
  switch (codec) {
    case CodecId::kH264: return "H264";
    case CodecId::kH265: return "H265";
    case CodecId::kOpus: return "OPUS";
    case CodecId::kPcmA: return "PCMA";
    case CodecId::kPcmU: return "PCMU";
  }
  return "UNKNOWN";
}

const char* MediaKindName(MediaKind kind) {
  return kind == MediaKind::kVideo ? "VIDEO" : "AUDIO";
}

bool IsVideoCodec(CodecId codec) {
  return codec == CodecId::kH264 || codec == CodecId::kH265;
}

}  // namespace camgate::buffer
