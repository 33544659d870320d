/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/log/configurator.hpp>

namespace edkey::log {

  namespace {
    const std::string embedded_config(R"(
# This is edkey configuration part of logging system
# ------------- Begin of edkey config --------------
groups:
  - name: edkey
    level: off
    children:
      - name: codec
# --------------- End of edkey config ---------------)");
  }

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::string config)
      : soralog::ConfiguratorFromYAML(std::move(config)) {}

}  // namespace edkey::log
