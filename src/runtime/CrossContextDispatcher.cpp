// Repository: Retrovue-camgate
// Component: CrossContextDispatcher
// Purpose: Worker-to-EventLoop payload handoff.
// Copyright (c) 2025 RetroVue

#include "camgate/runtime/CrossContextDispatcher.hpp"

#include <sstream>
#include <string>
#include <utility>

#include "camgate/util/Errors.hpp"
#include "camgate/util/Logger.hpp"

namespace camgate::runtime {

using camgate::util::Logger;

CrossContextDispatcher::CrossContextDispatcher(std::shared_ptr<EventLoop> loop)
    : loop_(std::move(loop)) {
  if (!loop_) {
    throw ConfigurationError("[CrossContextDispatcher] event loop is required");
  }
}

void CrossContextDispatcher::Submit(buffer::MediaKind kind,
                                    const PayloadCallback& callback,
                                    std::vector<uint8_t> payload,
                                    int64_t timestamp_ms, int channel) {
  auto shared_payload = std::make_shared<std::vector<uint8_t>>(std::move(payload));
  const size_t bytes = shared_payload->size();
  bool posted = loop_->Post([callback, shared_payload, timestamp_ms, channel] {
    callback(*shared_payload, timestamp_ms, channel);
  });
  if (!posted) {
    std::ostringstream oss;
    oss << "event loop closed, dropped " << buffer::MediaKindName(kind)
        << " payload bytes=" << bytes << " ts=" << timestamp_ms
        << " channel=" << channel;
    throw DispatchError(oss.str());
  }
  submitted_.fetch_add(1, std::memory_order_relaxed);
}

bool CrossContextDispatcher::Dispatch(buffer::MediaKind kind,
                                      const PayloadCallback& callback,
                                      std::vector<uint8_t> payload,
                                      int64_t timestamp_ms, int channel) {
  try {
    Submit(kind, callback, std::move(payload), timestamp_ms, channel);
  } catch (const DispatchError& e) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    Logger::Error(std::string("[CrossContextDispatcher] DispatchError: ") + e.what());
    return false;
  }
  return true;
}

}  // namespace camgate::runtime
