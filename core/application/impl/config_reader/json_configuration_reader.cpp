/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/json_configuration_reader.hpp"

#include <array>
#include <string_view>

#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/error.hpp"
#include "application/impl/config_reader/pt_util.hpp"

namespace tessera::application {
  namespace pt = boost::property_tree;

  namespace {
    constexpr std::array<std::string_view, 6> kRequiredEntries{
        "babe.slot_duration_ms",
        "babe.epoch_length",
        "babe.leadership_rate",
        "babe.allowed_slots",
        "babe.randomness",
        "babe.authorities",
    };

    outcome::result<consensus::babe::AllowedSlots> parseAllowedSlots(
        std::string_view str) {
      using consensus::babe::AllowedSlots;
      if (str == "PrimaryOnly") {
        return AllowedSlots::PrimaryOnly;
      }
      if (str == "PrimaryAndSecondaryPlain") {
        return AllowedSlots::PrimaryAndSecondaryPlain;
      }
      if (str == "PrimaryAndSecondaryVRF") {
        return AllowedSlots::PrimaryAndSecondaryVRF;
      }
      return ConfigReaderError::INVALID_VALUE;
    }

    outcome::result<std::pair<uint64_t, uint64_t>> parseRatio(
        const pt::ptree &tree) {
      if (tree.size() != 2) {
        return ConfigReaderError::INVALID_VALUE;
      }
      auto it = tree.begin();
      OUTCOME_TRY(numerator, valueOf<uint64_t>(it->second));
      OUTCOME_TRY(denominator, valueOf<uint64_t>((++it)->second));
      return std::make_pair(numerator, denominator);
    }

    outcome::result<primitives::AuthorityList> parseAuthorities(
        const pt::ptree &tree) {
      primitives::AuthorityList authorities;
      for (auto &[_, entry] : tree) {
        OUTCOME_TRY(id_hex, ensure(entry.get_optional<std::string>("id")));
        auto id_res = primitives::AuthorityId::fromHexWithPrefix(id_hex);
        if (id_res.has_error()) {
          return ConfigReaderError::INVALID_VALUE;
        }
        OUTCOME_TRY(weight_entry, ensure(entry.get_child_optional("weight")));
        OUTCOME_TRY(weight, valueOf<uint64_t>(weight_entry));
        authorities.push_back({.id = id_res.value(), .weight = weight});
      }
      return authorities;
    }
  }  // namespace

  outcome::result<TesseraConfig> JsonConfigurationReader::initConfig(
      std::istream &config_file_data) {
    OUTCOME_TRY(tree, readPropertyTree(config_file_data));
    for (auto entry : kRequiredEntries) {
      if (not tree.get_child_optional(std::string{entry})) {
        return ConfigReaderError::MISSING_ENTRY;
      }
    }
    TesseraConfig config;
    OUTCOME_TRY(updateFromTree(config, tree));
    return config;
  }

  outcome::result<void> JsonConfigurationReader::updateConfig(
      TesseraConfig &config, std::istream &config_file_data) {
    OUTCOME_TRY(tree, readPropertyTree(config_file_data));
    OUTCOME_TRY(updateFromTree(config, tree));
    return outcome::success();
  }

  outcome::result<boost::property_tree::ptree>
  JsonConfigurationReader::readPropertyTree(std::istream &data) {
    pt::ptree tree;
    try {
      pt::read_json(data, tree);
    } catch (const pt::json_parser_error &) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return tree;
  }

  outcome::result<void> JsonConfigurationReader::updateFromTree(
      TesseraConfig &config, const boost::property_tree::ptree &tree) {
    auto &babe = config.babe;

    if (auto entry = tree.get_child_optional("babe.slot_duration_ms")) {
      OUTCOME_TRY(slot_duration, valueOf<uint64_t>(entry.value()));
      babe.slot_duration = consensus::SlotDuration{slot_duration};
    }
    if (auto entry = tree.get_child_optional("babe.epoch_length")) {
      OUTCOME_TRY(epoch_length, valueOf<uint64_t>(entry.value()));
      babe.epoch_length = epoch_length;
    }
    if (auto entry = tree.get_child_optional("babe.leadership_rate")) {
      OUTCOME_TRY(ratio, parseRatio(entry.value()));
      babe.epoch_config.leadership_rate = ratio;
    }
    if (auto entry = tree.get_optional<std::string>("babe.allowed_slots")) {
      OUTCOME_TRY(allowed_slots, parseAllowedSlots(entry.value()));
      babe.epoch_config.allowed_slots = allowed_slots;
    }
    if (auto entry = tree.get_optional<std::string>("babe.randomness")) {
      auto randomness_res =
          consensus::Randomness::fromHexWithPrefix(entry.value());
      if (randomness_res.has_error()) {
        return ConfigReaderError::INVALID_VALUE;
      }
      babe.randomness = randomness_res.value();
    }
    if (auto entry = tree.get_child_optional("babe.authorities")) {
      OUTCOME_TRY(authorities, parseAuthorities(entry.value()));
      babe.authorities = std::move(authorities);
    }
    if (auto entry = tree.get_child_optional("babe.genesis_slot")) {
      OUTCOME_TRY(genesis_slot, valueOf<uint64_t>(entry.value()));
      config.genesis_slot = genesis_slot;
    }
    if (auto entry = tree.get_child_optional("equivocation.slot_horizon")) {
      OUTCOME_TRY(horizon, valueOf<uint64_t>(entry.value()));
      config.equivocation_slot_horizon = horizon;
    }
    if (auto entry = tree.get_child_optional("log")) {
      config.log.clear();
      for (auto &[_, item] : entry.value()) {
        config.log.push_back(item.get_value<std::string>());
      }
    }
    return outcome::success();
  }

}  // namespace tessera::application
