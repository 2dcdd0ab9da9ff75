#pragma once

#include <cstdint>
#include <vector>

namespace tdkg {

using Bytes = std::vector<uint8_t>;

}  // namespace tdkg
