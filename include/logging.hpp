#pragma once

namespace imgmin {

// spdlog default logger auf stderr, debug wenn verbose
void setup_logging(bool verbose);

} // namespace imgmin
