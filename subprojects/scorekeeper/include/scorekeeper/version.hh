#pragma once

namespace scorekeeper {

constexpr const char VERSION[] = "1.0.0";

} // namespace scorekeeper
