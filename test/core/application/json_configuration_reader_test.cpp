/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/json_configuration_reader.hpp"

#include <gtest/gtest.h>

#include "application/impl/config_reader/error.hpp"
#include "core/application/example_config.hpp"
#include "testutil/outcome.hpp"

using tessera::application::ConfigReaderError;
using tessera::application::JsonConfigurationReader;
using tessera::application::TesseraConfig;
using tessera::consensus::babe::AllowedSlots;
using test::application::getExampleConfig;
using test::application::readJSONConfig;

/**
 * @given a json file with configuration
 * @when initialising configuration from this file
 * @then the configuration matches the content of the file
 */
TEST(JsonConfigReader, LoadConfig) {
  auto ss = readJSONConfig();
  EXPECT_OUTCOME_TRUE(config, JsonConfigurationReader::initConfig(ss));
  ASSERT_EQ(config, getExampleConfig());
}

/**
 * @given a json file with configuration
 * @when updating a differing configuration from this file
 * @then the configuration matches the content of the file
 */
TEST(JsonConfigReader, UpdateConfig) {
  TesseraConfig config = getExampleConfig();
  config.babe.epoch_length = 34;
  config.babe.authorities.clear();
  config.genesis_slot = 0;
  config.log.clear();
  auto ss = readJSONConfig();
  EXPECT_OUTCOME_TRUE_1(JsonConfigurationReader::updateConfig(config, ss));
  ASSERT_EQ(config, getExampleConfig());
}

/**
 * @given a json file with some of the entries
 * @when updating configuration from it
 * @then only the present entries change
 */
TEST(JsonConfigReader, PartialUpdate) {
  TesseraConfig config = getExampleConfig();
  std::stringstream config_data{
      R"({"babe": {"allowed_slots": "PrimaryOnly"}})"};
  EXPECT_OUTCOME_TRUE_1(
      JsonConfigurationReader::updateConfig(config, config_data));

  auto expected = getExampleConfig();
  expected.babe.epoch_config.allowed_slots = AllowedSlots::PrimaryOnly;
  ASSERT_EQ(config, expected);
}

/**
 * @given a json file without optional entries
 * @when reading configuration from it
 * @then defaults are used for them
 */
TEST(JsonConfigReader, Defaults) {
  std::stringstream config_data{R"({"babe": {
    "slot_duration_ms": 1000,
    "epoch_length": 10,
    "leadership_rate": [1, 1],
    "allowed_slots": "PrimaryOnly",
    "randomness": "0x0000000000000000000000000000000000000000000000000000000000000000",
    "authorities": []
  }})"};
  EXPECT_OUTCOME_TRUE(config, JsonConfigurationReader::initConfig(config_data));
  EXPECT_EQ(config.genesis_slot, 0u);
  EXPECT_EQ(config.equivocation_slot_horizon,
            TesseraConfig::kDefaultSlotHorizon);
  EXPECT_TRUE(config.log.empty());
}

/**
 * @given a json file with malformed content
 * @when reading configuration from this file
 * @then parser error is returned
 */
TEST(JsonConfigReader, ParserError) {
  std::stringstream config_data;
  config_data << "{\n";
  config_data << "\t\"babe: \"0000\"\n";
  config_data << "}\n";
  EXPECT_OUTCOME_FALSE(e, JsonConfigurationReader::initConfig(config_data));
  ASSERT_EQ(e, ConfigReaderError::PARSER_ERROR);
}

/**
 * @given a json file with incomplete config
 * @when reading configuration from this file
 * @then missing entry error is returned
 */
TEST(JsonConfigReader, MissingEntry) {
  std::stringstream config_data;
  config_data << "{\n";
  config_data << "}\n";
  EXPECT_OUTCOME_FALSE(e, JsonConfigurationReader::initConfig(config_data));
  ASSERT_EQ(e, ConfigReaderError::MISSING_ENTRY);
}

/**
 * @given json files with values of wrong format
 * @when updating configuration from them
 * @then invalid value error is returned
 */
TEST(JsonConfigReader, InvalidValues) {
  for (auto json : {R"({"babe": {"allowed_slots": "Sometimes"}})",
                    R"({"babe": {"leadership_rate": [1, 2, 3]}})",
                    R"({"babe": {"epoch_length": "long"}})",
                    R"({"babe": {"randomness": "0x0102"}})",
                    R"({"babe": {"authorities": [{"id": "0x01", "weight": 1}]}})"}) {
    TesseraConfig config;
    std::stringstream config_data{json};
    EXPECT_OUTCOME_FALSE(e,
                         JsonConfigurationReader::updateConfig(config, config_data));
    EXPECT_EQ(e, ConfigReaderError::INVALID_VALUE) << json;
  }
}
