/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "application/impl/config_reader/error.hpp"

namespace tessera::application {

  template <typename T>
  outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt_entry) {
    if (not opt_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    return opt_entry.value();
  }

  /// Value of a leaf of \param tree converted to \param T
  template <typename T>
  outcome::result<T> valueOf(const boost::property_tree::ptree &tree) {
    auto value = tree.get_value_optional<T>();
    if (not value) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return value.value();
  }

}  // namespace tessera::application
