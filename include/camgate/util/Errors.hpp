// Repository: Retrovue-camgate
// Component: Error Taxonomy
// Purpose: Exception types raised by the codec adapters and the worker.
//          Everything below the decode loop is caught and logged at the
//          point of occurrence; only ConfigurationError escapes to callers.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_UTIL_ERRORS_HPP_
#define CAMGATE_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace camgate {

// Construction-time misconfiguration (e.g. audio enabled without an audio
// callback). Fatal to construction.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

// Codec adapter rejected or failed on a packet. Recoverable: the record is
// dropped and the loop continues.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Decoder/resampler/encoder could not be constructed for a codec. The handle
// stays unbound so the next record of that kind retries.
class DecoderInitError : public DecodeError {
 public:
  explicit DecoderInitError(const std::string& what) : DecodeError(what) {}
};

// Image or audio conversion failed for one frame; that frame's output is
// skipped.
class ConversionError : public std::runtime_error {
 public:
  explicit ConversionError(const std::string& what)
      : std::runtime_error(what) {}
};

// Consumer execution context is closed; the payload is dropped, never retried.
class DispatchError : public std::runtime_error {
 public:
  explicit DispatchError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace camgate

#endif  // CAMGATE_UTIL_ERRORS_HPP_
