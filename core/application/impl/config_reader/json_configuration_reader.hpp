/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include <boost/property_tree/ptree.hpp>

#include "application/impl/tessera_config.hpp"
#include "outcome/outcome.hpp"

namespace tessera::application {

  /**
   * Reads a tessera configuration from a JSON file
   */
  class JsonConfigurationReader {
   public:
    /**
     * @param config_file_data stream with the config file data
     * @return tessera configuration if the data was correctly read and
     * contained the full config
     */
    static outcome::result<TesseraConfig> initConfig(
        std::istream &config_file_data);

    /**
     * Updates parameters of config from entries present in the config data. In
     * other words, the config in the stream may be incomplete
     * @param config_file_data stream with the config file data
     * @return error if the stream couldn't be read or contained malformed
     * content
     */
    static outcome::result<void> updateConfig(TesseraConfig &config,
                                              std::istream &config_file_data);

   private:
    static outcome::result<boost::property_tree::ptree> readPropertyTree(
        std::istream &data);

    static outcome::result<void> updateFromTree(
        TesseraConfig &config, const boost::property_tree::ptree &tree);
  };

}  // namespace tessera::application
