#pragma once

#include "world_config.h"
#include <QJsonObject>
#include <QString>

namespace Sprawl::Map {

class WorldConfigLoader {
public:
  static auto load_from_json_file(const QString &path, WorldConfig &out_config,
                                  QString *out_error = nullptr) -> bool;

  // Keys missing from root keep the values already in out_config.
  static auto load_from_json(const QJsonObject &root, WorldConfig &out_config,
                             QString *out_error = nullptr) -> bool;
};

} // namespace Sprawl::Map
