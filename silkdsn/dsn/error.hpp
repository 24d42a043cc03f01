// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace silkdsn::dsn {

//! Kinds of failures of the DSN sync
enum class SyncErrorCode {
    kNetwork,            // unreachable peers or timeouts
    kInvalidPieceProof,  // piece not bound to its segment commitment
    kReconstruction,     // segment cannot be decoded
    kChainMismatch,      // decoded blocks disagree with the local chain
    kUnknownSegment,     // segment header not available
};

std::string_view to_string(SyncErrorCode code);

template <typename TErrorCode>
class Error : public std::runtime_error {
  public:
    Error(TErrorCode code, const std::string& message)
        : std::runtime_error(message),
          code_(code) {}
    TErrorCode code() const { return code_; }

  private:
    TErrorCode code_;
};

class SyncError : public Error<SyncErrorCode> {
  public:
    SyncError(SyncErrorCode code, const std::string& message);
};

class NetworkError : public SyncError {
  public:
    explicit NetworkError(const std::string& message) : SyncError(SyncErrorCode::kNetwork, message) {}
};

}  // namespace silkdsn::dsn
