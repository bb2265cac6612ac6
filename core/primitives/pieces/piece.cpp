/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/container_hash/hash.hpp>

#include "primitives/pieces/piece.hpp"

#include <algorithm>
#include <utility>

#include "codec/scale/scale_decode_stream.hpp"
#include "codec/scale/scale_encode_stream.hpp"
#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"

namespace subspace::primitives::pieces {
  using common::layout::view;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("pieces");
      return logger;
    }
  }  // namespace

  PieceArray::Parts PieceArray::split() const {
    const auto bytes{gsl::make_span(data(), kSize)};
    return {view<Record>(bytes.subspan(0, kRecordSize)),
            view<RecordCommitment>(
                bytes.subspan(kCommitmentOffset, RecordCommitment::kSize)),
            view<RecordWitness>(
                bytes.subspan(kWitnessOffset, RecordWitness::kSize))};
  }

  PieceArray::PartsMut PieceArray::splitMut() {
    const auto bytes{gsl::make_span(data(), kSize)};
    return {view<Record>(bytes.subspan(0, kRecordSize)),
            view<RecordCommitment>(
                bytes.subspan(kCommitmentOffset, RecordCommitment::kSize)),
            view<RecordWitness>(
                bytes.subspan(kWitnessOffset, RecordWitness::kSize))};
  }

  const Record &PieceArray::record() const {
    return std::get<0>(split());
  }

  Record &PieceArray::recordMut() {
    return std::get<0>(splitMut());
  }

  const RecordCommitment &PieceArray::commitment() const {
    return std::get<1>(split());
  }

  RecordCommitment &PieceArray::commitmentMut() {
    return std::get<1>(splitMut());
  }

  const RecordWitness &PieceArray::witness() const {
    return std::get<2>(split());
  }

  RecordWitness &PieceArray::witnessMut() {
    return std::get<2>(splitMut());
  }

  Piece::Piece() : array_{std::make_unique<PieceArray>()} {}

  Piece::Piece(const PieceArray &array)
      : array_{std::make_unique<PieceArray>(array)} {}

  Piece::Piece(const Piece &other)
      : array_{std::make_unique<PieceArray>(*other.array_)} {}

  Piece::Piece(Piece &&other)
      : array_{std::exchange(other.array_, std::make_unique<PieceArray>())} {}

  Piece::Piece(std::unique_ptr<PieceArray> array) : array_{std::move(array)} {}

  Piece &Piece::operator=(const Piece &other) {
    if (this != &other) {
      *array_ = *other.array_;
    }
    return *this;
  }

  Piece &Piece::operator=(Piece &&other) noexcept {
    std::swap(array_, other.array_);
    return *this;
  }

  outcome::result<Piece> Piece::fromSpan(BytesIn bytes) {
    if (static_cast<size_t>(bytes.size()) != kPieceSize) {
      return PieceError::kLengthMismatch;
    }
    auto array{std::make_unique<PieceArray>()};
    std::copy(bytes.begin(), bytes.end(), array->begin());
    return Piece{std::move(array)};
  }

  outcome::result<Piece> Piece::fromBytes(Bytes &&bytes) {
    const auto owned{std::move(bytes)};
    return fromSpan(owned);
  }

  Bytes Piece::toBytes() const {
    return copy(bytes());
  }

  const PieceArray &Piece::array() const {
    return *array_;
  }

  PieceArray &Piece::arrayMut() {
    return *array_;
  }

  const PieceArray &Piece::operator*() const {
    return *array_;
  }

  const PieceArray *Piece::operator->() const {
    return array_.get();
  }

  BytesIn Piece::bytes() const {
    return gsl::make_span(array_->data(), kPieceSize);
  }

  BytesOut Piece::bytesMut() {
    return gsl::make_span(array_->data(), kPieceSize);
  }

  bool operator==(const Piece &lhs, const Piece &rhs) {
    return lhs.array() == rhs.array();
  }

  bool operator<(const Piece &lhs, const Piece &rhs) {
    return lhs.array() < rhs.array();
  }

  size_t hash_value(const PieceArray &array) {
    return boost::hash_range(array.begin(), array.end());
  }

  size_t hash_value(const Piece &piece) {
    return hash_value(piece.array());
  }

  SCALE_ENCODE(PieceArray) {
    return s.putBytes(gsl::make_span(v.data(), kPieceSize));
  }

  SCALE_DECODE(PieceArray) {
    s.readInto(gsl::make_span(v.data(), kPieceSize));
    return s;
  }

  SCALE_ENCODE(Piece) {
    return s.putBytes(v.bytes());
  }

  SCALE_DECODE(Piece) {
    auto array{std::make_unique<PieceArray>()};
    try {
      s.readInto(gsl::make_span(array->data(), kPieceSize));
    } catch (const std::system_error &e) {
      logger()->debug("Could not decode Piece: {:#}", e.code());
      outcome::raise(PieceError::kDecodeTruncated);
    }
    v.array_ = std::move(array);
    return s;
  }
}  // namespace subspace::primitives::pieces

namespace std {
  size_t hash<subspace::primitives::pieces::PieceArray>::operator()(
      const subspace::primitives::pieces::PieceArray &array) const {
    return hash_value(array);
  }

  size_t hash<subspace::primitives::pieces::Piece>::operator()(
      const subspace::primitives::pieces::Piece &piece) const {
    return hash_value(piece);
  }
}  // namespace std
