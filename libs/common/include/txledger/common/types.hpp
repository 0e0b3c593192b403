#pragma once

#include <cstdint>

namespace txledger {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;
using TimestampNs = std::int64_t;

}  // namespace common
}  // namespace txledger
