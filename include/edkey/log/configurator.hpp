/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/impl/configurator_from_yaml.hpp>

namespace edkey::log {

  /**
   * Logging configuration of the library: the "edkey" group tree, muted by
   * default. Applications layer their own YAML on top of it with
   * soralog::ConfiguratorFromYAML(previous, config).
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);
  };

}  // namespace edkey::log
