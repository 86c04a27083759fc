/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_digests_util.hpp"

#include <span>

#include <scale/scale.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(tessera::consensus::babe, DigestError, e) {
  using E = tessera::consensus::babe::DigestError;
  switch (e) {
    case E::REQUIRED_DIGESTS_NOT_FOUND:
      return "the block must contain at least BABE "
             "header and seal digests";
    case E::NO_TRAILING_SEAL_DIGEST:
      return "the block must contain a seal digest as the last digest";
    case E::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS:
      return "genesis block can not have digests";
    case E::INVALID_SLOT_TYPE:
      return "BABE header has unknown slot assignment type";
    case E::MULTIPLE_PRE_DIGESTS:
      return "the block must contain exactly one BABE header digest";
  }
  return "unknown error (tessera::consensus::babe::DigestError)";
}

namespace tessera::consensus::babe {

  namespace {
    bool isBabeItem(const primitives::DigestItem &item,
                    primitives::DigestItemKind kind) {
      return item.kind == kind
         and item.consensus_engine_id == primitives::kBabeEngineId;
    }

    /// Payload of the BABE consensus message of \param kind, if any
    std::optional<common::BufferView> findConsensusMessage(
        const primitives::BlockHeader &header, ConsensusLogKind kind) {
      for (const auto &item : header.digest) {
        if (not isBabeItem(item, primitives::DigestItemKind::Consensus)
            or item.data.empty()) {
          continue;
        }
        if (item.data[0] == static_cast<uint8_t>(kind)) {
          return item.data.view().subspan(1);
        }
      }
      return std::nullopt;
    }

    primitives::DigestItem makeConsensusDigest(ConsensusLogKind kind,
                                               common::BufferView payload) {
      common::Buffer data;
      data.putUint8(static_cast<uint8_t>(kind)).put(payload);
      return primitives::DigestItem{
          .kind = primitives::DigestItemKind::Consensus,
          .consensus_engine_id = primitives::kBabeEngineId,
          .data = std::move(data),
      };
    }
  }  // namespace

  outcome::result<SlotNumber> getSlot(const primitives::BlockHeader &header) {
    OUTCOME_TRY(babe_block_header, getBabeBlockHeader(header));
    return babe_block_header.slot_number;
  }

  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header) {
    [[unlikely]] if (block_header.number == 0) {
      return DigestError::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS;
    }

    if (block_header.digest.empty()) {
      return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
    }
    const auto &digests = block_header.digest;

    std::optional<BabeBlockHeader> found;
    for (const auto &digest :
         std::span(digests).subspan(0, digests.size() - 1)) {
      if (not isBabeItem(digest, primitives::DigestItemKind::PreRuntime)) {
        continue;
      }
      if (found.has_value()) {
        return DigestError::MULTIPLE_PRE_DIGESTS;
      }
      OUTCOME_TRY(babe_block_header,
                  scale::decode<BabeBlockHeader>(digest.data.view()));
      found = babe_block_header;
    }

    if (not found.has_value()) {
      return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
    }

    switch (found->slot_assignment_type) {
      case SlotType::Primary:
      case SlotType::SecondaryPlain:
      case SlotType::SecondaryVRF:
        return found.value();
    }
    return DigestError::INVALID_SLOT_TYPE;
  }

  outcome::result<Seal> getSeal(const primitives::BlockHeader &block_header) {
    [[unlikely]] if (block_header.number == 0) {
      return DigestError::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS;
    }

    if (block_header.digest.empty()) {
      return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
    }

    // last digest of the block must be a seal - signature
    const auto &last = block_header.digest.back();
    if (not isBabeItem(last, primitives::DigestItemKind::Seal)) {
      return DigestError::NO_TRAILING_SEAL_DIGEST;
    }

    OUTCOME_TRY(seal_digest, scale::decode<Seal>(last.data.view()));

    return seal_digest;
  }

  outcome::result<std::optional<NextEpochDescriptor>> getNextEpochDigest(
      const primitives::BlockHeader &block_header) {
    auto payload =
        findConsensusMessage(block_header, ConsensusLogKind::NextEpochData);
    if (not payload.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(descriptor, scale::decode<NextEpochDescriptor>(*payload));
    return descriptor;
  }

  outcome::result<std::optional<EpochConfiguration>> getNextConfigDigest(
      const primitives::BlockHeader &block_header) {
    auto payload =
        findConsensusMessage(block_header, ConsensusLogKind::NextConfigData);
    if (not payload.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(config, scale::decode<EpochConfiguration>(*payload));
    return config;
  }

  primitives::DigestItem makePreDigest(const BabeBlockHeader &babe_header) {
    return primitives::DigestItem{
        .kind = primitives::DigestItemKind::PreRuntime,
        .consensus_engine_id = primitives::kBabeEngineId,
        .data = common::Buffer(scale::encode(babe_header).value()),
    };
  }

  primitives::DigestItem makeSealDigest(const Seal &seal) {
    return primitives::DigestItem{
        .kind = primitives::DigestItemKind::Seal,
        .consensus_engine_id = primitives::kBabeEngineId,
        .data = common::Buffer(scale::encode(seal).value()),
    };
  }

  primitives::DigestItem makeNextEpochDigest(
      const NextEpochDescriptor &descriptor) {
    auto payload = scale::encode(descriptor).value();
    return makeConsensusDigest(ConsensusLogKind::NextEpochData, payload);
  }

  primitives::DigestItem makeNextConfigDigest(
      const EpochConfiguration &config) {
    auto payload = scale::encode(config).value();
    return makeConsensusDigest(ConsensusLogKind::NextConfigData, payload);
  }

}  // namespace tessera::consensus::babe
