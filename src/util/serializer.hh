#pragma once

#include <cstdint>

#include <cereal/access.hpp>  // IWYU pragma: export
#include <cereal/cereal.hpp>

/// Declare a versioned serialization method. Fields are wrapped in CEREAL_NVP so text archives
/// carry field names.
#define SERIALIZE(...)                                                \
  friend class cereal::access;                                        \
  template <class Archive>                                            \
  void serialize(Archive& archive, const std::uint32_t version) {     \
    archive(__VA_ARGS__);                                             \
  }

#define FIELD(f) cereal::make_nvp(#f, f)
