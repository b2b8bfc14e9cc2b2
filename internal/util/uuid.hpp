#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace launcher::util {

/*
  Random identifiers

  Correlation ids and developer server node keys are RFC4122 version 4 UUIDs
  in canonical lowercase text form, e.g. 3f2b8c1e-9a4d-4e6f-8b21-0c5d7e9f1a2b.
*/

using UUID = std::array<uint8_t, 16>;

UUID        GenerateUUID();
std::string ToString(const UUID& id);

// True for the 36 character hyphenated form, any version.
bool IsCanonicalUUID(std::string_view text);

// Fresh correlation id for one outgoing request.
std::string NewCorrelationId();

} // namespace launcher::util
