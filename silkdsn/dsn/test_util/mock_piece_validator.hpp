// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <silkdsn/dsn/piece_validator.hpp>

namespace silkdsn::dsn::test_util {

//! \brief gMock mock class for PieceValidator
class MockPieceValidator : public PieceValidator {
  public:
    MOCK_METHOD((Task<tl::expected<void, PieceValidationError>>), validate, (PieceIndex, const Piece&), (override));
};

}  // namespace silkdsn::dsn::test_util
