#pragma once

#define BRAID_VERSION "0.9.0"
#define BRAID_SCHEMA_VERSION 9

namespace braid {
namespace version {

// Schema version written by this build; anything newer fails closed.
constexpr int CURRENT_SCHEMA = BRAID_SCHEMA_VERSION;

} // namespace version
} // namespace braid
